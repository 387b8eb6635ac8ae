#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

struct DecodedClip {
    // Interleaved frames.
    std::vector<float> samples;
    unsigned int sampleRate = 0;
    unsigned int channels = 0;

    size_t FrameCount() const { return channels ? samples.size() / channels : 0; }
};

// Decodes a WAV file held in memory through libsndfile. Throws WavFormatException.
DecodedClip ReadWavClip(const std::vector<uint8_t>& bytes);
