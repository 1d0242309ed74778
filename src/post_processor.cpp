#include "post_processor.hpp"
#include <cctype>

namespace holdtalk {

namespace {

// Escapes regex metacharacters and lets any whitespace run separate the
// words of a multi-word filler
std::string filler_to_regex(const std::string& filler) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string result;
    bool pending_space = false;

    for (char c : filler) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result += R"(\s+)";
            pending_space = false;
        }
        if (special.find(c) != std::string::npos) {
            result += '\\';
        }
        result += c;
    }
    return result;
}

bool has_alnum(const std::string& text) {
    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c))) return true;
    }
    return false;
}

bool is_sentence_end(char c) {
    return c == '.' || c == '!' || c == '?';
}

} // namespace

PostProcessor::PostProcessor() {
    build_filler_pattern();
}

PostProcessor::PostProcessor(const PostProcessorConfig& config)
    : config_(config) {
    build_filler_pattern();
}

void PostProcessor::build_filler_pattern() {
    std::string alternatives;
    for (const auto& filler : config_.filler_words) {
        std::string pattern = filler_to_regex(filler);
        if (pattern.empty()) continue;
        if (!alternatives.empty()) alternatives += '|';
        alternatives += pattern;
    }

    has_fillers_ = !alternatives.empty();
    if (has_fillers_) {
        // A comma directly after the filler belongs to it ("um, hello")
        filler_pattern_ = std::regex(R"(\b(?:)" + alternatives + R"()\b,?)",
                                     std::regex::ECMAScript | std::regex::icase);
    }
}

std::string PostProcessor::process(const std::string& text) const {
    if (text.empty()) return text;

    std::string result = text;

    // Order matters: capitalization must see the text without fillers
    if (config_.remove_fillers) {
        result = remove_filler_words(result);
    }

    if (config_.fix_spacing) {
        result = fix_spacing(result);
    }

    result = trim(result);

    if (config_.auto_capitalize) {
        result = fix_capitalization(result);
    }

    if (config_.auto_punctuate) {
        result = ensure_punctuation(result);
    }

    return result;
}

std::string PostProcessor::remove_filler_words(const std::string& text) const {
    if (!has_fillers_ || text.empty()) return text;

    static const std::regex double_comma(R"(,\s*,)");
    static const std::regex comma_before_end(R"(,\s*([.!?]))");
    static const std::regex double_space(R"(\s{2,})");
    static const std::regex orphan_comma_start(R"(^\s*,\s*)");
    // "Um. Hello" and "Hi. Um. There" leave a terminator with no sentence
    static const std::regex orphan_terminator_start(R"(^\s*[.!?]+\s*)");
    static const std::regex orphan_terminator(R"(([.!?])\s+[.!?]+(?=\s|$))");
    static const std::regex leading_terminator(R"(^\s*[.!?])");

    // Text that starts with "..." on its own keeps it
    const bool keep_leading = std::regex_search(text, leading_terminator);

    std::string result = text;

    // Removing one filler may expose another ("you um know"), so run to a
    // fixed point
    bool changed = true;
    while (changed) {
        std::string prev = result;

        result = std::regex_replace(result, filler_pattern_, " ");
        result = std::regex_replace(result, double_comma, ",");
        result = std::regex_replace(result, comma_before_end, "$1");
        result = std::regex_replace(result, double_space, " ");
        result = std::regex_replace(result, orphan_comma_start, "");
        result = std::regex_replace(result, orphan_terminator, "$1");
        if (!keep_leading) {
            result = std::regex_replace(result, orphan_terminator_start, "");
        }

        changed = (result != prev);
    }

    // "Um." leaves only the punctuation behind
    if (has_alnum(text) && !has_alnum(result)) {
        return "";
    }
    return trim(result);
}

std::string PostProcessor::fix_spacing(const std::string& text) const {
    if (text.empty()) return text;

    std::string result;
    result.reserve(text.size());

    bool last_was_space = true; // Start true to trim leading spaces

    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!last_was_space) {
                result += ' ';
                last_was_space = true;
            }
        } else if (c == '.' || c == ',' || c == '!' || c == '?' || c == ':' || c == ';') {
            // Remove space before punctuation
            if (!result.empty() && result.back() == ' ') {
                result.pop_back();
            }
            result += c;
            last_was_space = false;
        } else {
            result += c;
            last_was_space = false;
        }
    }

    return result;
}

std::string PostProcessor::fix_capitalization(const std::string& text) const {
    if (text.empty()) return text;

    std::string result = text;
    bool capitalize_next = true;
    bool after_terminator = false;

    for (size_t i = 0; i < result.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(result[i]);

        if (capitalize_next && std::isalpha(c)) {
            result[i] = static_cast<char>(std::toupper(c));
            capitalize_next = false;
            if (!config_.capitalize_sentences) break;
        } else if (config_.capitalize_sentences) {
            if (is_sentence_end(static_cast<char>(c))) {
                after_terminator = true;
            } else if (std::isspace(c)) {
                if (after_terminator) capitalize_next = true;
                after_terminator = false;
            } else {
                after_terminator = false;
            }
        }
    }

    return result;
}

std::string PostProcessor::trim(const std::string& text) const {
    if (text.empty()) return text;

    size_t start = 0;
    size_t end = text.size();

    while (start < end && std::isspace(static_cast<unsigned char>(text[start]))) {
        ++start;
    }

    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }

    if (start >= end) return "";

    return text.substr(start, end - start);
}

std::string PostProcessor::ensure_punctuation(const std::string& text) const {
    std::string result = trim(text);
    if (result.empty()) return result;

    // A dangling comma is replaced, not followed, by the period
    while (!result.empty() && result.back() == ',') {
        result.pop_back();
    }
    result = trim(result);
    if (result.empty()) return result;

    char last = result.back();
    if (is_sentence_end(last) || last == ':' || last == ';') {
        return result;
    }

    // Only end with a period if the text contains something to punctuate
    if (!has_alnum(result)) return result;

    result += '.';
    return result;
}

} // namespace holdtalk
