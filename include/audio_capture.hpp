#pragma once

#include "capture_backend.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <portaudio.h>

namespace holdtalk {

// Microphone capture through PortAudio's default input device. The stream is
// opened once in initialize() and started/stopped per session; only one
// capture can run at a time.
class AudioCapture : public CaptureBackend {
public:
    AudioCapture(int sample_rate = 16000, int channels = 1, int frames_per_buffer = 512);
    ~AudioCapture() override;

    bool initialize();
    void shutdown();

    CaptureStartResult start() override;
    CaptureStopResult stop(CaptureHandle handle, bool keep) override;

    bool is_recording() const { return recording_.load(); }

private:
    static int pa_callback(const void* input, void* output,
                          unsigned long frame_count,
                          const PaStreamCallbackTimeInfo* time_info,
                          PaStreamCallbackFlags status_flags,
                          void* user_data);

    void clear_buffer();

    int sample_rate_;
    int channels_;
    int frames_per_buffer_;
    size_t max_samples_;

    PaStream* stream_ = nullptr;
    std::atomic<bool> recording_{false};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> overflowed_{false};

    // start() and stop() come from the session worker; the mutex guards the
    // handle against a late stop from an older session
    std::mutex control_mutex_;
    CaptureHandle current_ = 0;
    CaptureHandle next_handle_ = 1;

    AudioBuffer audio_buffer_;
    std::mutex buffer_mutex_;
};

} // namespace holdtalk
