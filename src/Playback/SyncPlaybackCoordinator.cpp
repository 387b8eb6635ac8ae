#include "SyncPlaybackCoordinator.hpp"
#include "../common/Exceptions.hpp"
#include "../common/debug_log.hpp"

#include <utility>

SyncPlaybackCoordinator::SyncPlaybackCoordinator(AudioTrackFactory trackFactory)
    : _trackFactory(std::move(trackFactory)) {
}

SyncPlaybackCoordinator::~SyncPlaybackCoordinator() {
    _stateCallback = nullptr;
    Stop();
}

bool SyncPlaybackCoordinator::Toggle(IVideoSurface& video, const AudioSource& source) {
    if (_binding) {
        DEBUG_LOG("Stopping synced playback" << DEBUG_LOG_ENDL);
        Stop();
        return false;
    }
    Start(video, source);
    return true;
}

void SyncPlaybackCoordinator::Start(IVideoSurface& video, const AudioSource& source) {
    std::unique_ptr<IAudioTrack> track = _trackFactory ? _trackFactory(source) : nullptr;
    if (!track) {
        throw PlaybackFailureException("No audio track available for synced playback");
    }
    video.SetMuted(true);
    try {
        video.SeekToStart();
        track->SeekToStart();
        video.Play();
        track->Play();
    } catch (const std::exception& e) {
        ERROR_LOG("Failed to start synced playback: " << e.what());
        track->Pause();
        video.Pause();
        video.SetMuted(false);
        // Dropping the track releases any temporary decoded copy.
        track.reset();
        throw PlaybackFailureException(std::string("Synced playback failed: ") + e.what());
    }

    _binding.reset(new PlaybackBinding{video, std::move(track)});
    DEBUG_LOG("Synced playback started (" << _binding->track->GetDurationSeconds() << "s)" << DEBUG_LOG_ENDL);
    NotifyState(true);
}

void SyncPlaybackCoordinator::Stop() noexcept {
    if (!_binding) {
        return;
    }
    TearDown();
    try {
        NotifyState(false);
    } catch (const std::exception& e) {
        ERROR_LOG("Playback state callback failed: " << e.what());
    }
}

bool SyncPlaybackCoordinator::Poll() {
    if (!_binding || !_binding->track->HasEnded()) {
        return false;
    }
    DEBUG_LOG("Synced playback ended" << DEBUG_LOG_ENDL);
    TearDown();
    NotifyState(false);
    return true;
}

double SyncPlaybackCoordinator::GetAudioDurationSeconds() const {
    return _binding ? _binding->track->GetDurationSeconds() : 0.0;
}

void SyncPlaybackCoordinator::TearDown() noexcept {
    std::unique_ptr<PlaybackBinding> binding = std::move(_binding);
    binding->track->Pause();
    binding->video.Pause();
    binding->video.SetMuted(false);
}

void SyncPlaybackCoordinator::NotifyState(bool playing) {
    if (_stateCallback) {
        _stateCallback(playing);
    }
}
