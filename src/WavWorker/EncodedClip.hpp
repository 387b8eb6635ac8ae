#pragma once

#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include "WavEncoder.hpp"
#include "../common/Exceptions.hpp"

// Immutable result of one successful recording. Copies share the same bytes.
class EncodedClip {
public:
    static constexpr const char* MIME_TYPE = "audio/wav";

    EncodedClip(std::vector<uint8_t> bytes, unsigned int sampleRate, unsigned int channels)
        : _bytes(std::make_shared<const std::vector<uint8_t>>(std::move(bytes)))
        , _sampleRate(sampleRate)
        , _channels(channels) {
        const WavHeaderInfo info = ParseWavHeader(*_bytes);
        if (info.sampleRate != sampleRate || info.channels != channels) {
            throw WavFormatException("Encoded header does not match the declared format");
        }
        _frames = info.FrameCount();
    }

    const std::vector<uint8_t>& GetBytes() const { return *_bytes; }
    unsigned int GetSampleRate() const { return _sampleRate; }
    unsigned int GetChannelCount() const { return _channels; }
    size_t GetFrameCount() const { return _frames; }
    double GetDurationSeconds() const {
        return static_cast<double>(_frames) / static_cast<double>(_sampleRate);
    }

private:
    std::shared_ptr<const std::vector<uint8_t>> _bytes;
    unsigned int _sampleRate;
    unsigned int _channels;
    size_t _frames;
};
