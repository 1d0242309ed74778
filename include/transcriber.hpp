#pragma once

#include "transcription_engine.hpp"

#include <mutex>
#include <string>

// Forward declare whisper types
struct whisper_context;

namespace holdtalk {

// whisper.cpp speech-to-text. One context, used by one transcription at a
// time; a call that outlives its timeout holds the mutex until it finishes.
class Transcriber : public TranscriptionEngine {
public:
    Transcriber();
    ~Transcriber() override;

    // Initialize with model path
    bool initialize(const std::string& model_path, int n_threads = 4);
    void shutdown();
    bool is_initialized() const { return ctx_ != nullptr; }

    // Audio is 16kHz mono float. language_hint is a code such as "en", or
    // kAutoLanguage to let the model detect it.
    TranscriptionResult transcribe(const AudioBuffer& audio,
                                   const std::string& language_hint) override;

private:
    // Calculate confidence from token probabilities
    float calculate_confidence() const;

    whisper_context* ctx_ = nullptr;
    int n_threads_ = 4;
    bool multilingual_ = false;
    std::mutex mutex_;
};

} // namespace holdtalk
