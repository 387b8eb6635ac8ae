#pragma once

#include <cstddef>
#include <functional>
#include <string>

struct CaptureRequest {
    unsigned int sampleRate;
    unsigned int channels;
    unsigned int bufferFrames;
    // Empty selects the default input.
    std::string deviceName;
};

struct CaptureFormat {
    unsigned int sampleRate;
    unsigned int channels;
};

class IAudioInputDevice {
public:
    // Invoked on the device's real-time thread with interleaved float frames.
    using BlockCallback = std::function<bool(const float*, size_t)>;

    virtual ~IAudioInputDevice() = default;

    // Throws DeviceUnavailableException. The negotiated format may differ from the request.
    virtual CaptureFormat Open(const CaptureRequest& request, BlockCallback callback) = 0;
    virtual void Start() = 0;
    // No callback is in flight once Stop() returns.
    virtual void Stop() = 0;
    virtual void Close() noexcept = 0;
    virtual bool IsOpen() const = 0;
};
