#pragma once

#include <functional>
#include <memory>
#include <string>
#include <variant>

#include "../WavWorker/EncodedClip.hpp"

// A freshly recorded clip or the URL of a previously uploaded one.
using AudioSource = std::variant<EncodedClip, std::string>;

class IAudioTrack {
public:
    virtual ~IAudioTrack() = default;

    virtual void SeekToStart() = 0;
    // Throws PlaybackFailureException.
    virtual void Play() = 0;
    virtual void Pause() noexcept = 0;
    // Natural end of the track. May be set from a media thread.
    virtual bool HasEnded() const = 0;
    virtual double GetDurationSeconds() const = 0;
};

// Throws PlaybackFailureException when the source cannot be opened.
using AudioTrackFactory = std::function<std::unique_ptr<IAudioTrack>(const AudioSource&)>;
