#pragma once

#include "AudioRecorder/IAudioInputDevice.hpp"
#include "Playback/IAudioTrack.hpp"
#include "Playback/IVideoSurface.hpp"
#include "common/Exceptions.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace test_utils {

// Shared between a test and the FakeInputDevice the session owns.
struct FakeDeviceControl {
    std::optional<DeviceUnavailableException::Reason> failOpen;
    bool failStart = false;
    unsigned int sampleRate = 48000;
    unsigned int channels = 2;

    // When set, Start() spawns a thread that feeds blocks of `level` as a real device would.
    bool threaded = false;
    unsigned int blockFrames = 256;
    float level = 0.25f;

    IAudioInputDevice::BlockCallback callback;
    std::atomic<bool> running{false};
    int openCount = 0;
    int closeCount = 0;
    bool open = false;
};

class FakeInputDevice : public IAudioInputDevice {
public:
    explicit FakeInputDevice(std::shared_ptr<FakeDeviceControl> control)
        : _control(std::move(control)) {}

    ~FakeInputDevice() override { Close(); }

    CaptureFormat Open(const CaptureRequest& request, BlockCallback callback) override {
        ++_control->openCount;
        if (_control->failOpen) {
            throw DeviceUnavailableException(*_control->failOpen, "fake device refused");
        }
        _control->callback = std::move(callback);
        _control->open = true;
        return CaptureFormat{_control->sampleRate, std::min(request.channels, _control->channels)};
    }

    void Start() override {
        if (_control->failStart) {
            throw DeviceUnavailableException(DeviceUnavailableException::Reason::PermissionDenied,
                                             "fake device could not start");
        }
        _control->running = true;
        if (_control->threaded) {
            _thread = std::thread([this]() { Feed(); });
        }
    }

    void Stop() override {
        _control->running = false;
        if (_thread.joinable()) {
            _thread.join();
        }
    }

    void Close() noexcept override {
        if (!_control->open) {
            return;
        }
        Stop();
        _control->callback = nullptr;
        _control->open = false;
        ++_control->closeCount;
    }

    bool IsOpen() const override { return _control->open; }

private:
    void Feed() {
        std::vector<float> block(_control->blockFrames * _control->channels, _control->level);
        while (_control->running) {
            _control->callback(block.data(), _control->blockFrames);
            std::this_thread::sleep_for(std::chrono::microseconds(200));
        }
    }

    std::shared_ptr<FakeDeviceControl> _control;
    std::thread _thread;
};

// Delivers one block on the calling thread, standing in for the device thread.
inline bool Deliver(FakeDeviceControl& control, unsigned int frames, float level) {
    if (!control.running || !control.callback) {
        return false;
    }
    std::vector<float> block(frames * control.channels, level);
    return control.callback(block.data(), frames);
}

class FakeVideoSurface : public IVideoSurface {
public:
    void SetMuted(bool muted) noexcept override { this->muted = muted; }
    bool IsMuted() const override { return muted; }
    void SeekToStart() override { position = 0.0; }
    void Play() override {
        if (failPlay) {
            throw PlaybackFailureException("video refused to play");
        }
        paused = false;
    }
    void Pause() noexcept override { paused = true; }
    bool IsPaused() const override { return paused; }

    bool muted = false;
    bool paused = true;
    bool failPlay = false;
    double position = 5.0;
};

struct FakeTrackState {
    bool failPlay = false;
    bool playing = false;
    bool released = false;
    std::atomic<bool> ended{false};
    double position = 2.0;
    int created = 0;
};

class FakeAudioTrack : public IAudioTrack {
public:
    explicit FakeAudioTrack(std::shared_ptr<FakeTrackState> state) : _state(std::move(state)) {
        ++_state->created;
        _state->released = false;
    }
    ~FakeAudioTrack() override { _state->released = true; }

    void SeekToStart() override { _state->position = 0.0; }
    void Play() override {
        if (_state->failPlay) {
            throw PlaybackFailureException("audio refused to play");
        }
        _state->playing = true;
    }
    void Pause() noexcept override { _state->playing = false; }
    bool HasEnded() const override { return _state->ended.load(); }
    double GetDurationSeconds() const override { return 3.0; }

private:
    std::shared_ptr<FakeTrackState> _state;
};

inline AudioTrackFactory MakeFakeTrackFactory(std::shared_ptr<FakeTrackState> state) {
    return [state](const AudioSource&) -> std::unique_ptr<IAudioTrack> {
        return std::make_unique<FakeAudioTrack>(state);
    };
}

} // namespace test_utils
