#include "SampleProcessor.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

SampleProcessor::SampleProcessor(ChunkChannel& channel, unsigned int channels,
                                 unsigned int flushThreshold, float gain)
    : _channel(channel)
    , _channels(channels)
    , _flushThreshold(flushThreshold)
    , _gain(gain)
    , _stagedFrames(0)
    , _stagedPeak(0.0f)
    , _stopped(false)
    , _chunksEmitted(0) {
    // Allocated here, on the coordinating thread, before the stream starts.
    PrepareStaging();
}

void SampleProcessor::PrepareStaging() {
    if (!_channel.TakeRecycled(_staging)) {
        _staging = AudioChunk();
    }
    _staging.channels.resize(_channels);
    for (auto& samples : _staging.channels) {
        samples.clear();
        samples.reserve(_flushThreshold);
    }
    _staging.peakLevel = 0.0f;
    _stagedFrames = 0;
    _stagedPeak = 0.0f;
}

bool SampleProcessor::Process(const float* interleaved, size_t frames) {
    if (_stopped) {
        return false;
    }
    if (_channel.StopRequested()) {
        Stop();
        return false;
    }
    if (!interleaved) {
        return true;
    }

    size_t frame = 0;
    while (frame < frames) {
        const size_t room = _flushThreshold - _stagedFrames;
        const size_t take = std::min(room, frames - frame);

        for (size_t i = 0; i < take; ++i) {
            const float* in = interleaved + (frame + i) * _channels;
            for (unsigned int ch = 0; ch < _channels; ++ch) {
                const float sample = std::max(-1.0f, std::min(1.0f, in[ch] * _gain));
                _staging.channels[ch].push_back(sample);
                _stagedPeak = std::max(_stagedPeak, std::fabs(sample));
            }
        }

        frame += take;
        _stagedFrames += take;
        if (_stagedFrames >= _flushThreshold) {
            Flush();
        }
    }

    return true;
}

void SampleProcessor::Stop() {
    if (_stopped) {
        return;
    }
    _stopped = true;
    if (_stagedFrames > 0) {
        Flush();
    }
    _channel.SendEndOfStream();
}

void SampleProcessor::Flush() {
    if (_stagedFrames == 0) {
        return;
    }
    _staging.peakLevel = _stagedPeak;
    _channel.Send(std::move(_staging));
    ++_chunksEmitted;

    if (_stopped) {
        _staging = AudioChunk();
        _stagedFrames = 0;
        _stagedPeak = 0.0f;
        return;
    }
    PrepareStaging();
}
