#pragma once

#include <functional>
#include <memory>
#include <utility>

#include "IAudioTrack.hpp"
#include "IVideoSurface.hpp"
#include "PlaybackBinding.hpp"

class SyncPlaybackCoordinator {
public:
    using StateCallback = std::function<void(bool playing)>;

    explicit SyncPlaybackCoordinator(AudioTrackFactory trackFactory);
    ~SyncPlaybackCoordinator();

    SyncPlaybackCoordinator(const SyncPlaybackCoordinator&) = delete;
    SyncPlaybackCoordinator& operator=(const SyncPlaybackCoordinator&) = delete;

    // Starts muted-video + audio playback from zero, or stops the running one.
    // Returns true if playback started. Throws PlaybackFailureException after unwinding.
    bool Toggle(IVideoSurface& video, const AudioSource& source);

    void Stop() noexcept;

    // Tears down after the audio's natural end. Returns true if that happened.
    bool Poll();

    bool IsPlaying() const { return _binding != nullptr; }
    double GetAudioDurationSeconds() const;

    void SetStateCallback(StateCallback callback) { _stateCallback = std::move(callback); }

private:
    void Start(IVideoSurface& video, const AudioSource& source);
    void TearDown() noexcept;
    void NotifyState(bool playing);

    AudioTrackFactory _trackFactory;
    std::unique_ptr<PlaybackBinding> _binding;
    StateCallback _stateCallback;
};
