#pragma once

#include <cstddef>
#include <vector>

struct AudioChunk {
    // One vector of samples per channel, all of equal length.
    std::vector<std::vector<float>> channels;
    float peakLevel = 0.0f;

    size_t ChannelCount() const { return channels.size(); }
    size_t FrameCount() const { return channels.empty() ? 0 : channels[0].size(); }
};
