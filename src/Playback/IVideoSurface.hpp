#pragma once

// The video element a dub is previewed against.
class IVideoSurface {
public:
    virtual ~IVideoSurface() = default;

    virtual void SetMuted(bool muted) noexcept = 0;
    virtual bool IsMuted() const = 0;
    virtual void SeekToStart() = 0;
    // Throws PlaybackFailureException.
    virtual void Play() = 0;
    virtual void Pause() noexcept = 0;
    virtual bool IsPaused() const = 0;
};
