#include "SavingWorkers/WavFileWorker.hpp"
#include "WavWorker/EncodedClip.hpp"
#include "WavWorker/WavClipReader.hpp"
#include "WavWorker/WavEncoder.hpp"
#include "common/Exceptions.hpp"
#include "sndfile.h"

#include <gtest/gtest.h>

#include <cmath>
#include <cstdio>
#include <cstring>
#include <vector>

namespace {

uint32_t ReadU32(const std::vector<uint8_t>& bytes, size_t offset) {
    return static_cast<uint32_t>(bytes[offset])
         | (static_cast<uint32_t>(bytes[offset + 1]) << 8)
         | (static_cast<uint32_t>(bytes[offset + 2]) << 16)
         | (static_cast<uint32_t>(bytes[offset + 3]) << 24);
}

int16_t ReadI16(const std::vector<uint8_t>& bytes, size_t offset) {
    return static_cast<int16_t>(bytes[offset] | (bytes[offset + 1] << 8));
}

} // namespace

TEST(WavEncoderTest, OneSecondOfStereoSilence) {
    std::vector<std::vector<float>> channels(2, std::vector<float>(48000, 0.0f));
    std::vector<uint8_t> bytes = EncodeWav(channels, 48000);

    ASSERT_EQ(bytes.size(), 192044u);
    EXPECT_EQ(std::memcmp(bytes.data(), "RIFF", 4), 0);
    EXPECT_EQ(std::memcmp(bytes.data() + 8, "WAVE", 4), 0);
    EXPECT_EQ(std::memcmp(bytes.data() + 12, "fmt ", 4), 0);
    EXPECT_EQ(std::memcmp(bytes.data() + 36, "data", 4), 0);
    EXPECT_EQ(ReadU32(bytes, 4), 192036u);
    EXPECT_EQ(ReadU32(bytes, 40), 192000u);

    WavHeaderInfo info = ParseWavHeader(bytes);
    EXPECT_EQ(info.formatTag, 1);
    EXPECT_EQ(info.channels, 2);
    EXPECT_EQ(info.sampleRate, 48000u);
    EXPECT_EQ(info.byteRate, 192000u);
    EXPECT_EQ(info.blockAlign, 4);
    EXPECT_EQ(info.bitsPerSample, 16);
    EXPECT_EQ(info.FrameCount(), 48000u);

    for (size_t i = WAV_HEADER_SIZE; i < bytes.size(); ++i) {
        ASSERT_EQ(bytes[i], 0) << "silence should encode as zero bytes, offset " << i;
    }
}

TEST(WavEncoderTest, ConvertsSamplesByTruncation) {
    EXPECT_EQ(FloatToPcm16(0.0f), 0);
    EXPECT_EQ(FloatToPcm16(1.0f), 32767);
    EXPECT_EQ(FloatToPcm16(-1.0f), -32767);
    EXPECT_EQ(FloatToPcm16(0.5f), 16383);
    EXPECT_EQ(FloatToPcm16(-0.5f), -16383);
    EXPECT_EQ(FloatToPcm16(2.0f), 32767);
    EXPECT_EQ(FloatToPcm16(-3.0f), -32767);
    EXPECT_EQ(FloatToPcm16(NAN), 0);
}

TEST(WavEncoderTest, InterleavesChannels) {
    std::vector<std::vector<float>> channels = {{0.5f, -0.5f, 1.0f}, {-1.0f, 0.25f, 0.0f}};
    std::vector<uint8_t> bytes = EncodeWav(channels, 8000);

    const int16_t expected[] = {16383, -32767, -16383, 8191, 32767, 0};
    for (size_t i = 0; i < 6; ++i) {
        EXPECT_EQ(ReadI16(bytes, WAV_HEADER_SIZE + i * 2), expected[i]) << "sample " << i;
    }
}

TEST(WavEncoderTest, RejectsBadChannelLayouts) {
    const std::vector<std::vector<float>> none;
    EXPECT_THROW(EncodeWav(none, 48000), InvalidChannelLengthException);

    const std::vector<std::vector<float>> ragged = {std::vector<float>(10), std::vector<float>(9)};
    EXPECT_THROW(EncodeWav(ragged, 48000), InvalidChannelLengthException);
}

TEST(WavEncoderTest, RejectsMalformedHeaders) {
    std::vector<uint8_t> good = EncodeWav({std::vector<float>(16, 0.1f)}, 16000);
    EXPECT_NO_THROW(ParseWavHeader(good));

    std::vector<uint8_t> truncated(good.begin(), good.begin() + 20);
    EXPECT_THROW(ParseWavHeader(truncated), WavFormatException);

    std::vector<uint8_t> badTag = good;
    badTag[0] = 'X';
    EXPECT_THROW(ParseWavHeader(badTag), WavFormatException);

    std::vector<uint8_t> badDepth = good;
    badDepth[34] = 24;
    EXPECT_THROW(ParseWavHeader(badDepth), WavFormatException);

    std::vector<uint8_t> trailing = good;
    trailing.push_back(0);
    EXPECT_THROW(ParseWavHeader(trailing), WavFormatException);

    EXPECT_THROW(EncodedClip(good, 48000, 1), WavFormatException) << "declared rate differs";
}

TEST(WavEncoderTest, DecodesWithLibsndfile) {
    std::vector<std::vector<float>> channels(2, std::vector<float>(1000));
    for (size_t i = 0; i < 1000; ++i) {
        channels[0][i] = static_cast<float>(std::sin(i * 0.05));
        channels[1][i] = static_cast<float>(0.5 * std::cos(i * 0.03));
    }
    EncodedClip clip(EncodeWav(channels, 44100), 44100, 2);
    EXPECT_EQ(clip.GetFrameCount(), 1000u);
    EXPECT_DOUBLE_EQ(clip.GetDurationSeconds(), 1000.0 / 44100.0);

    DecodedClip decoded = ReadWavClip(clip.GetBytes());
    ASSERT_EQ(decoded.sampleRate, 44100u);
    ASSERT_EQ(decoded.channels, 2u);
    ASSERT_EQ(decoded.FrameCount(), 1000u);
    for (size_t i = 0; i < 1000; ++i) {
        for (size_t ch = 0; ch < 2; ++ch) {
            // libsndfile normalises 16-bit PCM by 32768.
            const double read = decoded.samples[i * 2 + ch] * 32768.0;
            const double written = channels[ch][i] * 32767.0;
            ASSERT_NEAR(read, written, 1.0) << "frame " << i << " channel " << ch;
        }
    }

    EXPECT_THROW(ReadWavClip(std::vector<uint8_t>(10, 0)), WavFormatException);
}

TEST(WavFileWorkerTest, SavesReadableWav) {
    const char* path = "wav_file_worker_test.wav";
    EncodedClip clip(EncodeWav({std::vector<float>(480, 0.25f)}, 48000), 48000, 1);

    WavFileWorker worker(path);
    EXPECT_FALSE(worker.HasClip());
    EXPECT_THROW(worker.Save(), SavingWorkerException);

    worker.SetClip(clip);
    ASSERT_TRUE(worker.Save());

    SF_INFO sfinfo;
    std::memset(&sfinfo, 0, sizeof(sfinfo));
    SNDFILE* infile = sf_open(path, SFM_READ, &sfinfo);
    ASSERT_NE(infile, nullptr) << sf_strerror(nullptr);
    EXPECT_EQ(sfinfo.frames, 480);
    EXPECT_EQ(sfinfo.channels, 1);
    EXPECT_EQ(sfinfo.samplerate, 48000);
    EXPECT_EQ(sfinfo.format & SF_FORMAT_SUBMASK, SF_FORMAT_PCM_16);
    sf_close(infile);
    std::remove(path);
}

TEST(WavFileWorkerTest, ReportsUnwritablePath) {
    WavFileWorker worker("/nonexistent-directory/clip.wav");
    worker.SetClip(EncodedClip(EncodeWav({std::vector<float>(10, 0.0f)}, 8000), 8000, 1));
    EXPECT_FALSE(worker.Save());
}
