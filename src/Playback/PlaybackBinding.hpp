#pragma once

#include <memory>

#include "IAudioTrack.hpp"
#include "IVideoSurface.hpp"

// Pairing of one video surface and one audio track for a single synced playback cycle.
// A track built from an in-memory clip owns its decoded copy, so dropping the binding
// releases it.
struct PlaybackBinding {
    IVideoSurface& video;
    std::unique_ptr<IAudioTrack> track;
};
