#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace holdtalk {

// 16kHz mono float samples
using AudioBuffer = std::vector<float>;
using CaptureHandle = uint64_t;

struct CaptureStartResult {
    bool success = false;
    CaptureHandle handle = 0;
    std::string error;
};

struct CaptureStopResult {
    bool success = false;
    AudioBuffer audio;      // empty when discarded
    std::string error;
};

class CaptureBackend {
public:
    virtual ~CaptureBackend() = default;

    virtual CaptureStartResult start() = 0;

    // keep == false discards the recording without materializing a buffer
    virtual CaptureStopResult stop(CaptureHandle handle, bool keep) = 0;
};

} // namespace holdtalk
