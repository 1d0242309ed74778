#include "transcriber.hpp"
#include "log.hpp"
#include "whisper.h"
#include <chrono>

namespace holdtalk {

// Whisper requires minimum 100ms of audio (16kHz)
static constexpr size_t kMinSamples = 1600;

Transcriber::Transcriber() = default;

Transcriber::~Transcriber() {
    shutdown();
}

bool Transcriber::initialize(const std::string& model_path, int n_threads) {
    if (ctx_) return true;

    n_threads_ = n_threads;

    struct whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = false;

    ctx_ = whisper_init_from_file_with_params(model_path.c_str(), cparams);
    if (!ctx_) {
        log_error("whisper") << "Failed to load whisper model: " << model_path;
        return false;
    }

    multilingual_ = whisper_is_multilingual(ctx_) != 0;
    log_info("whisper") << "Loaded whisper model: " << model_path
                        << (multilingual_ ? " (multilingual)" : " (English only)");
    return true;
}

void Transcriber::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

TranscriptionResult Transcriber::transcribe(const AudioBuffer& audio,
                                            const std::string& language_hint) {
    std::lock_guard<std::mutex> lock(mutex_);
    TranscriptionResult result;

    if (!ctx_) {
        result.error = "Transcriber not initialized";
        return result;
    }

    if (audio.empty()) {
        result.error = "No audio data";
        return result;
    }

    // An English-only model can not detect or emit anything else
    std::string language = language_hint.empty() ? kAutoLanguage : language_hint;
    if (!multilingual_ && language != "en") {
        if (language != kAutoLanguage) {
            log_warning("whisper") << "Model is English only, ignoring language '" << language << "'";
        }
        language = "en";
    }
    const bool detect = language == kAutoLanguage;

    auto start_time = std::chrono::steady_clock::now();

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

    wparams.print_progress   = false;
    wparams.print_special    = false;
    wparams.print_realtime   = false;
    wparams.print_timestamps = false;
    wparams.translate        = false;
    wparams.single_segment   = true;   // Faster for short audio
    wparams.no_context       = true;
    wparams.language         = detect ? "auto" : language.c_str();
    wparams.detect_language  = false;
    wparams.n_threads        = n_threads_;
    wparams.greedy.best_of   = 1;
    wparams.logprob_thold    = -1.0f;

    // Pad short recordings with silence
    const float* samples = audio.data();
    int n_samples = static_cast<int>(audio.size());
    AudioBuffer padded;
    if (audio.size() < kMinSamples) {
        padded = audio;
        padded.resize(kMinSamples, 0.0f);
        samples = padded.data();
        n_samples = static_cast<int>(padded.size());
    }

    // Run inference
    int ret = whisper_full(ctx_, wparams, samples, n_samples);
    if (ret != 0) {
        result.error = "Whisper inference failed (code " + std::to_string(ret) + ")";
        return result;
    }

    const int n_segments = whisper_full_n_segments(ctx_);
    std::string text;
    for (int i = 0; i < n_segments; ++i) {
        const char* segment_text = whisper_full_get_segment_text(ctx_, i);
        if (segment_text) {
            text += segment_text;
        }
    }

    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

    // Trim whitespace
    size_t start = text.find_first_not_of(" \t\n\r");
    size_t end = text.find_last_not_of(" \t\n\r");
    if (start != std::string::npos && end != std::string::npos) {
        text = text.substr(start, end - start + 1);
    } else {
        text.clear();
    }

    if (detect) {
        const char* detected = whisper_lang_str(whisper_full_lang_id(ctx_));
        result.language = detected ? detected : "";
    } else {
        result.language = language;
    }

    result.text = text;
    result.duration_ms = duration.count();
    result.confidence = calculate_confidence();
    result.success = true;

    log_debug("whisper") << "Transcription took " << result.duration_ms << "ms (conf: "
                         << static_cast<int>(result.confidence * 100) << "%, lang: " << result.language
                         << "): \"" << result.text << "\"";

    return result;
}

float Transcriber::calculate_confidence() const {
    const int n_segments = whisper_full_n_segments(ctx_);
    if (n_segments == 0) return 0.0f;

    float total_prob = 0.0f;
    int total_tokens = 0;

    for (int seg = 0; seg < n_segments; ++seg) {
        const int n_tokens = whisper_full_n_tokens(ctx_, seg);
        for (int tok = 0; tok < n_tokens; ++tok) {
            whisper_token_data token_data = whisper_full_get_token_data(ctx_, seg, tok);
            // Skip special tokens
            if (token_data.id >= whisper_token_eot(ctx_)) continue;
            if (token_data.p > 0.0f) {
                total_prob += token_data.p;
                total_tokens++;
            }
        }
    }

    return total_tokens > 0 ? total_prob / static_cast<float>(total_tokens) : 0.0f;
}

} // namespace holdtalk
