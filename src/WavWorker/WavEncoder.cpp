#include "WavEncoder.hpp"
#include "../common/Exceptions.hpp"
#include "../common/debug_log.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <string>

namespace {

void WriteTag(uint8_t* out, const char* tag) {
    std::memcpy(out, tag, 4);
}

void WriteU16(uint8_t* out, uint16_t value) {
    out[0] = static_cast<uint8_t>(value & 0xFF);
    out[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
}

void WriteU32(uint8_t* out, uint32_t value) {
    out[0] = static_cast<uint8_t>(value & 0xFF);
    out[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
    out[2] = static_cast<uint8_t>((value >> 16) & 0xFF);
    out[3] = static_cast<uint8_t>((value >> 24) & 0xFF);
}

uint16_t ReadU16(const uint8_t* in) {
    return static_cast<uint16_t>(in[0] | (in[1] << 8));
}

uint32_t ReadU32(const uint8_t* in) {
    return static_cast<uint32_t>(in[0])
         | (static_cast<uint32_t>(in[1]) << 8)
         | (static_cast<uint32_t>(in[2]) << 16)
         | (static_cast<uint32_t>(in[3]) << 24);
}

bool TagEquals(const uint8_t* in, const char* tag) {
    return std::memcmp(in, tag, 4) == 0;
}

} // namespace

int16_t FloatToPcm16(float sample) {
    // NaN compares false both ways and ends up as silence.
    if (!(sample == sample)) {
        return 0;
    }
    const float clamped = std::max(-1.0f, std::min(1.0f, sample));
    return static_cast<int16_t>(clamped * 32767.0f);
}

std::vector<uint8_t> EncodeWav(const std::vector<std::vector<float>>& channels,
                               unsigned int sampleRate) {
    if (channels.empty()) {
        ERROR_LOG("EncodeWav called without channels");
        throw InvalidChannelLengthException("Cannot encode WAV without channels");
    }
    const size_t frames = channels[0].size();
    for (size_t ch = 1; ch < channels.size(); ++ch) {
        if (channels[ch].size() != frames) {
            ERROR_LOG("EncodeWav channel " << ch << " has " << channels[ch].size()
                      << " samples, channel 0 has " << frames);
            throw InvalidChannelLengthException("Channel " + std::to_string(ch)
                                                + " length differs from channel 0");
        }
    }

    const size_t numChannels = channels.size();
    const uint64_t dataBytes64 = static_cast<uint64_t>(frames) * numChannels * 2;
    if (numChannels > std::numeric_limits<uint16_t>::max() / 2
        || dataBytes64 > std::numeric_limits<uint32_t>::max() - 36) {
        throw InvalidChannelLengthException("Recording too large for a RIFF container");
    }
    const uint32_t dataBytes = static_cast<uint32_t>(dataBytes64);

    std::vector<uint8_t> bytes(WAV_HEADER_SIZE + dataBytes);
    uint8_t* out = bytes.data();

    WriteTag(out + 0, "RIFF");
    WriteU32(out + 4, 36 + dataBytes);
    WriteTag(out + 8, "WAVE");
    WriteTag(out + 12, "fmt ");
    WriteU32(out + 16, 16);
    WriteU16(out + 20, 1);
    WriteU16(out + 22, static_cast<uint16_t>(numChannels));
    WriteU32(out + 24, sampleRate);
    WriteU32(out + 28, static_cast<uint32_t>(sampleRate * numChannels * 2));
    WriteU16(out + 32, static_cast<uint16_t>(numChannels * 2));
    WriteU16(out + 34, 16);
    WriteTag(out + 36, "data");
    WriteU32(out + 40, dataBytes);

    uint8_t* pcm = out + WAV_HEADER_SIZE;
    for (size_t i = 0; i < frames; ++i) {
        for (size_t ch = 0; ch < numChannels; ++ch) {
            WriteU16(pcm, static_cast<uint16_t>(FloatToPcm16(channels[ch][i])));
            pcm += 2;
        }
    }

    DEBUG_LOG("Encoded WAV: " << numChannels << " ch, " << sampleRate << " Hz, "
              << frames << " frames, " << bytes.size() << " bytes" << DEBUG_LOG_ENDL);
    return bytes;
}

WavHeaderInfo ParseWavHeader(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < WAV_HEADER_SIZE) {
        throw WavFormatException("Buffer too small for a WAV header");
    }
    const uint8_t* in = bytes.data();
    if (!TagEquals(in, "RIFF") || !TagEquals(in + 8, "WAVE")
        || !TagEquals(in + 12, "fmt ") || !TagEquals(in + 36, "data")) {
        throw WavFormatException("Not a canonical RIFF/WAVE buffer");
    }
    if (ReadU32(in + 16) != 16) {
        throw WavFormatException("Unexpected fmt chunk size");
    }

    WavHeaderInfo info;
    info.formatTag = ReadU16(in + 20);
    info.channels = ReadU16(in + 22);
    info.sampleRate = ReadU32(in + 24);
    info.byteRate = ReadU32(in + 28);
    info.blockAlign = ReadU16(in + 32);
    info.bitsPerSample = ReadU16(in + 34);
    info.dataBytes = ReadU32(in + 40);

    if (info.formatTag != 1 || info.bitsPerSample != 16) {
        throw WavFormatException("Only 16-bit PCM is supported");
    }
    if (info.channels == 0 || info.blockAlign != info.channels * 2
        || info.byteRate != info.sampleRate * info.blockAlign) {
        throw WavFormatException("Inconsistent fmt chunk");
    }
    if (ReadU32(in + 4) != 36 + info.dataBytes
        || bytes.size() != WAV_HEADER_SIZE + static_cast<size_t>(info.dataBytes)
        || info.dataBytes % info.blockAlign != 0) {
        throw WavFormatException("RIFF/data sizes do not match the buffer");
    }
    return info;
}
