#pragma once

#include <RtAudio.h>
#include <atomic>
#include <cstddef>
#include <memory>

#include "IAudioTrack.hpp"
#include "../WavWorker/WavClipReader.hpp"

// Plays an in-memory clip on the default output device.
class RtAudioClipTrack : public IAudioTrack {
public:
    explicit RtAudioClipTrack(const EncodedClip& clip);
    ~RtAudioClipTrack() override;

    void SeekToStart() override;
    void Play() override;
    void Pause() noexcept override;
    bool HasEnded() const override { return _ended.load(std::memory_order_acquire); }
    double GetDurationSeconds() const override;

private:
    static int OnAudio(void* outputBuffer, void* inputBuffer, unsigned int nBufferFrames,
                       double streamTime, RtAudioStreamStatus status, void* userData);

    void OpenStream();

    DecodedClip _clip;
    RtAudio _audio;
    RtAudio::StreamParameters _parameters;
    std::atomic<size_t> _position;
    std::atomic<bool> _ended;
};

// Local clips play through RtAudioClipTrack. Remote URLs need a streaming factory supplied
// by the host and are rejected here.
AudioTrackFactory MakeLocalTrackFactory();
