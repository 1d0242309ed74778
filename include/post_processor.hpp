#pragma once

#include <regex>
#include <string>
#include <vector>

namespace holdtalk {

struct PostProcessorConfig {
    bool remove_fillers = true;
    // Whole words or phrases, matched case-insensitively
    std::vector<std::string> filler_words = {"um", "uh", "er", "ah", "hmm", "you know"};
    bool fix_spacing = true;
    bool auto_capitalize = true;
    bool capitalize_sentences = false;  // also capitalize after . ! ?
    bool auto_punctuate = false;        // add period if text doesn't end with punctuation
};

class PostProcessor {
public:
    PostProcessor();
    explicit PostProcessor(const PostProcessorConfig& config);

    // Main processing function - applies all enabled transformations.
    // Idempotent: process(process(x)) == process(x).
    std::string process(const std::string& text) const;

    // Individual operations (public for testing)
    std::string remove_filler_words(const std::string& text) const;
    std::string fix_spacing(const std::string& text) const;
    std::string fix_capitalization(const std::string& text) const;
    std::string trim(const std::string& text) const;
    std::string ensure_punctuation(const std::string& text) const;

    const PostProcessorConfig& get_config() const { return config_; }

private:
    void build_filler_pattern();

    PostProcessorConfig config_;
    std::regex filler_pattern_;
    bool has_fillers_ = false;
};

} // namespace holdtalk
