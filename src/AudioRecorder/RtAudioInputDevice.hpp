#pragma once

#include <RtAudio.h>
#include <atomic>
#include <cstdint>
#include <string>

#include "IAudioInputDevice.hpp"

class RtAudioInputDevice : public IAudioInputDevice {
public:
    RtAudioInputDevice();
    ~RtAudioInputDevice() override;

    CaptureFormat Open(const CaptureRequest& request, BlockCallback callback) override;
    void Start() override;
    void Stop() override;
    void Close() noexcept override;
    bool IsOpen() const override { return _audio.isStreamOpen(); }

private:
    static int OnAudio(void* outputBuffer, void* inputBuffer, unsigned int nBufferFrames,
                       double streamTime, RtAudioStreamStatus status, void* userData);

    unsigned int SelectDevice(const std::string& deviceName);
    unsigned int SelectSampleRate(const RtAudio::DeviceInfo& info, unsigned int requested) const;

    RtAudio _audio;
    RtAudio::StreamParameters _parameters;
    BlockCallback _callback;
    std::atomic<uint64_t> _overflows;
};
