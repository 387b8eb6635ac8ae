#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

static const size_t WAV_HEADER_SIZE = 44;

struct WavHeaderInfo {
    uint16_t formatTag;
    uint16_t channels;
    uint32_t sampleRate;
    uint32_t byteRate;
    uint16_t blockAlign;
    uint16_t bitsPerSample;
    uint32_t dataBytes;

    size_t FrameCount() const { return blockAlign ? dataBytes / blockAlign : 0; }
};

// Canonical 16-bit PCM RIFF/WAVE, little-endian, frames interleaved ch0, ch1, ...
// Throws InvalidChannelLengthException if there are no channels or their lengths differ.
std::vector<uint8_t> EncodeWav(const std::vector<std::vector<float>>& channels,
                               unsigned int sampleRate);

int16_t FloatToPcm16(float sample);

// Parses the 44-byte canonical header written by EncodeWav and checks it against the
// buffer size. Throws WavFormatException.
WavHeaderInfo ParseWavHeader(const std::vector<uint8_t>& bytes);
