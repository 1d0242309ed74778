#include "audio_capture.hpp"
#include "log.hpp"

namespace holdtalk {

// Hard cap on buffered audio; the orchestrator commits long before this
static constexpr int kMaxBufferSeconds = 120;

AudioCapture::AudioCapture(int sample_rate, int channels, int frames_per_buffer)
    : sample_rate_(sample_rate)
    , channels_(channels)
    , frames_per_buffer_(frames_per_buffer)
    , max_samples_(static_cast<size_t>(sample_rate) * kMaxBufferSeconds) {
}

AudioCapture::~AudioCapture() {
    shutdown();
}

bool AudioCapture::initialize() {
    if (initialized_.load()) return true;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        log_error("audio") << "PortAudio init failed: " << Pa_GetErrorText(err);
        return false;
    }

    // Open default input device
    PaStreamParameters input_params;
    input_params.device = Pa_GetDefaultInputDevice();
    if (input_params.device == paNoDevice) {
        log_error("audio") << "No default input device";
        Pa_Terminate();
        return false;
    }

    const PaDeviceInfo* info = Pa_GetDeviceInfo(input_params.device);
    input_params.channelCount = channels_;
    input_params.sampleFormat = paFloat32;
    input_params.suggestedLatency = info->defaultLowInputLatency;
    input_params.hostApiSpecificStreamInfo = nullptr;

    err = Pa_OpenStream(&stream_,
                        &input_params,
                        nullptr,  // No output
                        sample_rate_,
                        frames_per_buffer_,
                        paClipOff,
                        pa_callback,
                        this);

    if (err != paNoError) {
        log_error("audio") << "Failed to open stream: " << Pa_GetErrorText(err);
        Pa_Terminate();
        return false;
    }

    log_info("audio") << "Using input device: " << info->name << " (" << sample_rate_ << "Hz, "
                      << channels_ << " channel" << (channels_ == 1 ? "" : "s") << ")";
    initialized_.store(true);
    return true;
}

void AudioCapture::shutdown() {
    if (!initialized_.load()) return;

    if (recording_.load()) {
        recording_.store(false);
        Pa_StopStream(stream_);
    }

    if (stream_) {
        Pa_CloseStream(stream_);
        stream_ = nullptr;
    }

    Pa_Terminate();
    initialized_.store(false);
}

CaptureStartResult AudioCapture::start() {
    std::lock_guard<std::mutex> lock(control_mutex_);
    CaptureStartResult result;

    if (!initialized_.load()) {
        result.error = "audio capture not initialized";
        return result;
    }
    if (recording_.load()) {
        result.error = "a capture is already running";
        return result;
    }

    clear_buffer();

    PaError err = Pa_StartStream(stream_);
    if (err != paNoError) {
        result.error = std::string("failed to start stream: ") + Pa_GetErrorText(err);
        return result;
    }

    recording_.store(true);
    current_ = next_handle_++;
    result.success = true;
    result.handle = current_;
    return result;
}

CaptureStopResult AudioCapture::stop(CaptureHandle handle, bool keep) {
    std::lock_guard<std::mutex> lock(control_mutex_);
    CaptureStopResult result;

    if (!recording_.load() || handle != current_) {
        result.error = "unknown capture handle " + std::to_string(handle);
        return result;
    }

    recording_.store(false);
    current_ = 0;

    PaError err = Pa_StopStream(stream_);
    if (err != paNoError) {
        result.error = std::string("failed to stop stream: ") + Pa_GetErrorText(err);
        return result;
    }

    if (overflowed_.load()) {
        log_warning("audio") << "Recording exceeded " << kMaxBufferSeconds << "s, the rest was dropped";
    }

    std::lock_guard<std::mutex> buffer_lock(buffer_mutex_);
    if (keep) {
        result.audio.swap(audio_buffer_);
    }
    audio_buffer_.clear();
    result.success = true;
    return result;
}

void AudioCapture::clear_buffer() {
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    audio_buffer_.clear();
    audio_buffer_.reserve(sample_rate_ * 30);  // Reserve for 30 seconds
    overflowed_.store(false);
}

int AudioCapture::pa_callback(const void* input, void* output,
                              unsigned long frame_count,
                              const PaStreamCallbackTimeInfo* time_info,
                              PaStreamCallbackFlags status_flags,
                              void* user_data) {
    (void)output;
    (void)time_info;
    (void)status_flags;

    auto* capture = static_cast<AudioCapture*>(user_data);
    if (!capture->recording_.load() || input == nullptr) return paContinue;

    const float* in = static_cast<const float*>(input);
    const int channels = capture->channels_;

    std::lock_guard<std::mutex> lock(capture->buffer_mutex_);
    AudioBuffer& buffer = capture->audio_buffer_;
    if (buffer.size() + frame_count > capture->max_samples_) {
        capture->overflowed_.store(true);
        return paContinue;
    }

    if (channels == 1) {
        buffer.insert(buffer.end(), in, in + frame_count);
    } else {
        // Downmix interleaved frames to mono
        for (unsigned long frame = 0; frame < frame_count; ++frame) {
            float sum = 0.0f;
            for (int ch = 0; ch < channels; ++ch) {
                sum += in[frame * channels + ch];
            }
            buffer.push_back(sum / static_cast<float>(channels));
        }
    }

    return paContinue;
}

} // namespace holdtalk
