#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "AudioChunk.hpp"
#include "ChunkChannel.hpp"

class BufferAssembler {
public:
    enum class AcceptResult {
        Accepted,
        // Accepted, and the target duration is now reached; a stop has been requested.
        AutoStopped,
        // Offered after the limit was reached and not recorded.
        Discarded
    };

    BufferAssembler(ChunkChannel& channel, unsigned int channels,
                    unsigned int sampleRate, double maxDurationSeconds);

    AcceptResult Accept(const AudioChunk& chunk);

    // Moves the assembled buffers out. Throws EmptyRecordingException if nothing was accepted.
    std::vector<std::vector<float>> Finalize();

    double ElapsedSeconds() const;
    double GetMaxDurationSeconds() const { return _maxDurationSeconds; }
    bool LimitReached() const { return _limitReached; }
    size_t GetFrameCount() const { return _frames; }
    size_t GetChunksAccepted() const { return _chunksAccepted; }
    size_t GetChunksDiscarded() const { return _chunksDiscarded; }
    float GetLastPeakLevel() const { return _lastPeak; }
    unsigned int GetSampleRate() const { return _sampleRate; }
    unsigned int GetChannelCount() const { return _channels; }

    static constexpr double MAX_RESERVE_SECONDS = 30.0;

private:
    ChunkChannel& _channel;
    unsigned int _channels;
    unsigned int _sampleRate;
    double _maxDurationSeconds;

    std::vector<std::vector<float>> _buffers;
    size_t _frames;
    size_t _chunksAccepted;
    size_t _chunksDiscarded;
    float _lastPeak;
    bool _limitReached;
};
