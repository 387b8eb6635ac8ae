#pragma once

#include <cstddef>
#include <cstdint>

#include "AudioChunk.hpp"
#include "ChunkChannel.hpp"

// Runs on the device's real-time thread. Applies gain and clipping to incoming interleaved
// blocks and emits fixed-size chunks through the channel. Nothing here locks or waits.
class SampleProcessor {
public:
    SampleProcessor(ChunkChannel& channel, unsigned int channels,
                    unsigned int flushThreshold, float gain);

    SampleProcessor(const SampleProcessor&) = delete;
    SampleProcessor& operator=(const SampleProcessor&) = delete;

    // Returns false once the processor has stopped and wants no more input.
    bool Process(const float* interleaved, size_t frames);

    // Flushes the partial buffer, sends end-of-stream. Idempotent.
    void Stop();
    bool IsStopped() const { return _stopped; }

    unsigned int GetChannelCount() const { return _channels; }
    uint64_t GetChunksEmitted() const { return _chunksEmitted; }

private:
    void Flush();
    void PrepareStaging();

    ChunkChannel& _channel;
    unsigned int _channels;
    unsigned int _flushThreshold;
    float _gain;

    AudioChunk _staging;
    size_t _stagedFrames;
    float _stagedPeak;
    bool _stopped;
    uint64_t _chunksEmitted;
};
