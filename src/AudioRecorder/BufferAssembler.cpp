#include "BufferAssembler.hpp"
#include "../common/Exceptions.hpp"
#include "../common/debug_log.hpp"

#include <algorithm>
#include <string>
#include <utility>

BufferAssembler::BufferAssembler(ChunkChannel& channel, unsigned int channels,
                                 unsigned int sampleRate, double maxDurationSeconds)
    : _channel(channel)
    , _channels(channels)
    , _sampleRate(sampleRate)
    , _maxDurationSeconds(maxDurationSeconds)
    , _buffers(channels)
    , _frames(0)
    , _chunksAccepted(0)
    , _chunksDiscarded(0)
    , _lastPeak(0.0f)
    , _limitReached(false) {
    // Short takes never reallocate; longer windows grow with what is actually recorded.
    const double reserveSeconds = std::min(maxDurationSeconds, MAX_RESERVE_SECONDS);
    const size_t expected = static_cast<size_t>(reserveSeconds * sampleRate) + 1;
    for (auto& buffer : _buffers) {
        buffer.reserve(expected);
    }
}

BufferAssembler::AcceptResult BufferAssembler::Accept(const AudioChunk& chunk) {
    if (_limitReached) {
        ++_chunksDiscarded;
        DEBUG_LOG("Discarding chunk received after auto-stop (" << chunk.FrameCount()
                  << " frames)" << DEBUG_LOG_ENDL);
        return AcceptResult::Discarded;
    }

    if (chunk.ChannelCount() != _channels) {
        throw InvalidChannelLengthException("Chunk has " + std::to_string(chunk.ChannelCount())
                                            + " channels, expected " + std::to_string(_channels));
    }
    const size_t frames = chunk.FrameCount();
    for (const auto& samples : chunk.channels) {
        if (samples.size() != frames) {
            throw InvalidChannelLengthException("Chunk channels have unequal sample counts");
        }
    }

    for (unsigned int ch = 0; ch < _channels; ++ch) {
        _buffers[ch].insert(_buffers[ch].end(), chunk.channels[ch].begin(), chunk.channels[ch].end());
    }
    _frames += frames;
    ++_chunksAccepted;
    _lastPeak = chunk.peakLevel;

    if (ElapsedSeconds() >= _maxDurationSeconds) {
        _limitReached = true;
        if (_channel.RequestStop()) {
            DEBUG_LOG("Target duration " << _maxDurationSeconds << "s reached at "
                      << ElapsedSeconds() << "s, requesting stop" << DEBUG_LOG_ENDL);
        }
        return AcceptResult::AutoStopped;
    }
    return AcceptResult::Accepted;
}

std::vector<std::vector<float>> BufferAssembler::Finalize() {
    if (_frames == 0) {
        throw EmptyRecordingException();
    }
    std::vector<std::vector<float>> result = std::move(_buffers);
    _buffers.assign(_channels, std::vector<float>());
    _frames = 0;
    return result;
}

double BufferAssembler::ElapsedSeconds() const {
    return static_cast<double>(_frames) / static_cast<double>(_sampleRate);
}
