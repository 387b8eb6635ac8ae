#include "RtAudioClipTrack.hpp"
#include "../common/Exceptions.hpp"
#include "../common/debug_log.hpp"

#include <algorithm>
#include <cstring>
#include <string>

RtAudioClipTrack::RtAudioClipTrack(const EncodedClip& clip)
    : _audio(RtAudio::UNSPECIFIED, [](RtAudioErrorType type, const std::string& errorText) {
          if (type != RTAUDIO_WARNING) {
              ERROR_LOG("RtAudio playback error: " << errorText);
          }
      })
    , _position(0)
    , _ended(false) {
    try {
        _clip = ReadWavClip(clip.GetBytes());
    } catch (const WavFormatException& e) {
        throw PlaybackFailureException(std::string("Cannot decode clip: ") + e.what());
    }
    _audio.showWarnings(false);
}

RtAudioClipTrack::~RtAudioClipTrack() {
    Pause();
    if (_audio.isStreamOpen()) {
        _audio.closeStream();
    }
}

int RtAudioClipTrack::OnAudio(void* outputBuffer, void* /*inputBuffer*/, unsigned int nBufferFrames,
                              double /*streamTime*/, RtAudioStreamStatus /*status*/, void* userData) {
    RtAudioClipTrack* track = static_cast<RtAudioClipTrack*>(userData);
    float* out = static_cast<float*>(outputBuffer);
    const unsigned int channels = track->_clip.channels;
    const size_t total = track->_clip.FrameCount();
    const size_t position = track->_position.load(std::memory_order_relaxed);

    const size_t frames = position < total ? std::min<size_t>(nBufferFrames, total - position) : 0;
    if (frames > 0) {
        std::memcpy(out, track->_clip.samples.data() + position * channels,
                    frames * channels * sizeof(float));
    }
    if (frames < nBufferFrames) {
        std::memset(out + frames * channels, 0, (nBufferFrames - frames) * channels * sizeof(float));
    }
    track->_position.store(position + frames, std::memory_order_relaxed);

    if (position + frames >= total) {
        track->_ended.store(true, std::memory_order_release);
        // Drain the last buffer, then stop.
        return 1;
    }
    return 0;
}

void RtAudioClipTrack::OpenStream() {
    if (_audio.getCurrentApi() == RtAudio::RTAUDIO_DUMMY || _audio.getDeviceIds().empty()) {
        throw PlaybackFailureException("No audio output device available");
    }

    _parameters.deviceId = _audio.getDefaultOutputDevice();
    _parameters.nChannels = _clip.channels;
    _parameters.firstChannel = 0;

    unsigned int bufferFrames = 512;
    if (_audio.openStream(&_parameters, nullptr, RTAUDIO_FLOAT32, _clip.sampleRate,
                          &bufferFrames, &RtAudioClipTrack::OnAudio, this)) {
        throw PlaybackFailureException("Error opening output stream: " + _audio.getErrorText());
    }
}

void RtAudioClipTrack::SeekToStart() {
    if (_audio.isStreamRunning()) {
        _audio.stopStream();
    }
    _position.store(0);
    _ended.store(false);
}

void RtAudioClipTrack::Play() {
    if (!_audio.isStreamOpen()) {
        OpenStream();
    }
    if (_audio.isStreamRunning()) {
        return;
    }
    if (_audio.startStream()) {
        throw PlaybackFailureException("Error starting output stream: " + _audio.getErrorText());
    }
}

void RtAudioClipTrack::Pause() noexcept {
    if (_audio.isStreamRunning()) {
        _audio.stopStream();
    }
}

double RtAudioClipTrack::GetDurationSeconds() const {
    if (_clip.sampleRate == 0) {
        return 0.0;
    }
    return static_cast<double>(_clip.FrameCount()) / static_cast<double>(_clip.sampleRate);
}

AudioTrackFactory MakeLocalTrackFactory() {
    return [](const AudioSource& source) -> std::unique_ptr<IAudioTrack> {
        if (const EncodedClip* clip = std::get_if<EncodedClip>(&source)) {
            return std::make_unique<RtAudioClipTrack>(*clip);
        }
        throw PlaybackFailureException("Remote source '" + std::get<std::string>(source)
                                       + "' needs a streaming track factory");
    };
}
