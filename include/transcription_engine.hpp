#pragma once

#include "capture_backend.hpp"

#include <cstdint>
#include <string>

namespace holdtalk {

// Passed as language hint to let the engine detect the language
constexpr const char* kAutoLanguage = "auto";

struct TranscriptionResult {
    std::string text;
    std::string language;     // detected, or the forced code
    int64_t duration_ms = 0;
    float confidence = 0.0f;  // average token probability (0.0 - 1.0), 0 when unknown
    bool success = false;
    std::string error;
};

class TranscriptionEngine {
public:
    virtual ~TranscriptionEngine() = default;

    // Blocking. Called from the session worker, never from the event loop.
    virtual TranscriptionResult transcribe(const AudioBuffer& audio,
                                           const std::string& language_hint) = 0;
};

} // namespace holdtalk
