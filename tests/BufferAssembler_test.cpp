#include "AudioRecorder/BufferAssembler.hpp"
#include "AudioRecorder/ChunkChannel.hpp"
#include "common/Exceptions.hpp"
#include "common/Timecode.hpp"

#include <gtest/gtest.h>

#include <random>
#include <vector>

namespace {

AudioChunk MakeChunk(unsigned int channels, size_t frames, float startValue) {
    AudioChunk chunk;
    chunk.channels.resize(channels);
    for (unsigned int ch = 0; ch < channels; ++ch) {
        for (size_t i = 0; i < frames; ++i) {
            chunk.channels[ch].push_back(startValue + static_cast<float>(i) + 0.5f * ch);
        }
    }
    chunk.peakLevel = 0.5f;
    return chunk;
}

} // namespace

TEST(BufferAssemblerTest, ConservesSamplesInOrder) {
    ChunkChannel channel;
    // Long enough that the limit is never reached.
    BufferAssembler assembler(channel, 2, 48000, 60.0);

    std::mt19937 rng(1234);
    std::uniform_int_distribution<size_t> lengths(1, 5000);
    std::vector<float> expectedLeft;
    size_t total = 0;
    for (int i = 0; i < 40; ++i) {
        const size_t frames = lengths(rng);
        AudioChunk chunk = MakeChunk(2, frames, static_cast<float>(total));
        expectedLeft.insert(expectedLeft.end(), chunk.channels[0].begin(), chunk.channels[0].end());
        total += frames;
        EXPECT_EQ(assembler.Accept(chunk), BufferAssembler::AcceptResult::Accepted) << "chunk " << i;
    }

    EXPECT_EQ(assembler.GetFrameCount(), total);
    EXPECT_EQ(assembler.GetChunksAccepted(), 40u);
    EXPECT_DOUBLE_EQ(assembler.ElapsedSeconds(), static_cast<double>(total) / 48000.0);
    EXPECT_FALSE(channel.StopRequested());

    std::vector<std::vector<float>> buffers = assembler.Finalize();
    ASSERT_EQ(buffers.size(), 2u);
    ASSERT_EQ(buffers[0].size(), total);
    ASSERT_EQ(buffers[1].size(), total);
    EXPECT_EQ(buffers[0], expectedLeft);
    EXPECT_FLOAT_EQ(buffers[1][0], expectedLeft[0] + 0.5f);
}

TEST(BufferAssemblerTest, AutoStopsWhenWindowIsFull) {
    ChunkChannel channel;
    // 0.1 s at 8 kHz is 800 frames.
    BufferAssembler assembler(channel, 1, 8000, 0.1);

    EXPECT_EQ(assembler.Accept(MakeChunk(1, 512, 0.0f)), BufferAssembler::AcceptResult::Accepted);
    EXPECT_EQ(assembler.Accept(MakeChunk(1, 512, 0.0f)), BufferAssembler::AcceptResult::AutoStopped);
    EXPECT_TRUE(channel.StopRequested());
    EXPECT_TRUE(assembler.LimitReached());

    EXPECT_EQ(assembler.Accept(MakeChunk(1, 512, 0.0f)), BufferAssembler::AcceptResult::Discarded);
    EXPECT_EQ(assembler.GetFrameCount(), 1024u) << "overshoot is bounded by the crossing chunk";
    EXPECT_EQ(assembler.GetChunksDiscarded(), 1u);
    EXPECT_FALSE(channel.RequestStop()) << "the stop request was already made";
}

TEST(BufferAssemblerTest, AutoStopsOnExactLimit) {
    ChunkChannel channel;
    BufferAssembler assembler(channel, 1, 8000, 0.1);
    EXPECT_EQ(assembler.Accept(MakeChunk(1, 800, 0.0f)), BufferAssembler::AcceptResult::AutoStopped);
}

TEST(BufferAssemblerTest, LongWindowGrowsWithRecordedAudio) {
    ChunkChannel channel;
    const double window = DialogueWindow{"00:00:00:000", "99:59:59:999", std::nullopt}.MaxDurationSeconds();
    BufferAssembler assembler(channel, 2, 48000, window);

    EXPECT_EQ(assembler.Accept(MakeChunk(2, 4096, 0.0f)), BufferAssembler::AcceptResult::Accepted);
    EXPECT_EQ(assembler.GetFrameCount(), 4096u);
    EXPECT_FALSE(assembler.LimitReached());

    std::vector<std::vector<float>> buffers = assembler.Finalize();
    ASSERT_EQ(buffers.size(), 2u);
    const size_t reserveLimit =
        static_cast<size_t>(BufferAssembler::MAX_RESERVE_SECONDS * 48000) + 1;
    EXPECT_LE(buffers[0].capacity(), reserveLimit) << "capacity must not scale with the window";
    EXPECT_EQ(buffers[1].size(), 4096u);
}

TEST(BufferAssemblerTest, EmptyFinalizeThrows) {
    ChunkChannel channel;
    BufferAssembler assembler(channel, 2, 48000, 1.0);
    EXPECT_THROW(assembler.Finalize(), EmptyRecordingException);
}

TEST(BufferAssemblerTest, RejectsMismatchedChunks) {
    ChunkChannel channel;
    BufferAssembler assembler(channel, 2, 48000, 1.0);

    EXPECT_THROW(assembler.Accept(MakeChunk(1, 10, 0.0f)), InvalidChannelLengthException);

    AudioChunk ragged = MakeChunk(2, 10, 0.0f);
    ragged.channels[1].pop_back();
    EXPECT_THROW(assembler.Accept(ragged), InvalidChannelLengthException);

    EXPECT_EQ(assembler.GetFrameCount(), 0u);
}
