#include "RecordingSession.hpp"
#include "../WavWorker/WavEncoder.hpp"
#include "../common/debug_log.hpp"

#include <utility>
#include <vector>

const char* ToString(RecordingSession::Phase phase) {
    switch (phase) {
        case RecordingSession::Phase::Idle: return "Idle";
        case RecordingSession::Phase::Acquiring: return "Acquiring";
        case RecordingSession::Phase::Recording: return "Recording";
        case RecordingSession::Phase::Stopping: return "Stopping";
        case RecordingSession::Phase::Encoded: return "Encoded";
        case RecordingSession::Phase::Error: return "Error";
    }
    return "Unknown";
}

RecordingSession::RecordingSession(const RecorderConfig& config, DeviceFactory deviceFactory)
    : _config(config)
    , _deviceFactory(std::move(deviceFactory))
    , _format{config.sampleRate, config.channels}
    , _phase(Phase::Idle)
    , _maxDurationSeconds(0.0)
    , _elapsedSeconds(0.0)
    , _peakLevel(0.0f) {
    _config.Validate();
}

RecordingSession::~RecordingSession() {
    _phaseCallback = nullptr;
    Discard();
}

void RecordingSession::Start(const DialogueWindow& window) {
    if (_phase != Phase::Idle) {
        throw InvalidStateException(std::string("Cannot start recording while ") + ToString(_phase));
    }

    // Validated before any device request.
    const double maxDuration = window.MaxDurationSeconds();

    _clip.reset();
    _lastError.clear();
    _deviceError.reset();
    _maxDurationSeconds = maxDuration;
    _elapsedSeconds = 0.0;
    _peakLevel = 0.0f;

    DEBUG_LOG("\n=== Starting recording, limit " << FormatTimecode(maxDuration) << " ===" << DEBUG_LOG_ENDL);

    try {
        ChangePhase(Phase::Acquiring);
        _device = _deviceFactory ? _deviceFactory() : nullptr;
        if (!_device) {
            throw DeviceUnavailableException(DeviceUnavailableException::Reason::Unsupported,
                                             "No audio input backend available");
        }

        _channel = std::make_unique<ChunkChannel>();

        CaptureRequest request{_config.sampleRate, _config.channels, _config.bufferFrames,
                               _config.deviceName};
        // The callback only runs after Start(), by which time the processor exists.
        _format = _device->Open(request, [this](const float* samples, size_t frames) {
            return _processor->Process(samples, frames);
        });
        if (_format.channels == 0 || _format.sampleRate == 0) {
            throw DeviceUnavailableException(DeviceUnavailableException::Reason::NoDevice,
                                             "Input device reported an empty format");
        }

        _processor = std::make_unique<SampleProcessor>(*_channel, _format.channels,
                                                       _config.flushThreshold, _config.gain);
        _assembler = std::make_unique<BufferAssembler>(*_channel, _format.channels,
                                                       _format.sampleRate, maxDuration);
        _device->Start();
        ChangePhase(Phase::Recording);
    } catch (const DeviceUnavailableException& e) {
        ERROR_LOG("Microphone unavailable (" << ToString(e.GetReason()) << "): " << e.what());
        _lastError = e.what();
        _deviceError = e.GetReason();
        ReleaseCapture();
        ChangePhase(Phase::Error);
        throw;
    } catch (const std::exception& e) {
        ERROR_LOG("Recording failed to start: " << e.what());
        _lastError = e.what();
        ReleaseCapture();
        ChangePhase(Phase::Error);
        throw;
    }
}

size_t RecordingSession::Pump() {
    if (_phase != Phase::Recording) {
        return 0;
    }

    const size_t before = _assembler->GetChunksAccepted() + _assembler->GetChunksDiscarded();
    const bool autoStop = DrainChannel();
    const size_t handled = _assembler->GetChunksAccepted() + _assembler->GetChunksDiscarded() - before;

    if (autoStop) {
        DEBUG_LOG("Auto-stop at " << _assembler->ElapsedSeconds() << "s" << DEBUG_LOG_ENDL);
        Stop();
    }
    return handled;
}

bool RecordingSession::DrainChannel() {
    bool autoStop = false;
    ChunkChannel::Message message;
    while (_channel->TryReceive(message)) {
        if (message.type == ChunkChannel::Message::Type::EndOfStream) {
            // Nothing follows end-of-stream.
            autoStop = true;
            break;
        }
        if (_assembler->Accept(message.chunk) == BufferAssembler::AcceptResult::AutoStopped) {
            autoStop = true;
        }
        _peakLevel = _assembler->GetLastPeakLevel();
        _channel->Recycle(std::move(message.chunk));
        if (autoStop) {
            // The stop must take effect before anything else is accepted.
            break;
        }
    }
    return autoStop;
}

void RecordingSession::Stop() {
    if (_phase != Phase::Recording) {
        return;
    }
    std::vector<std::vector<float>> buffers;
    try {
        ChangePhase(Phase::Stopping);
        _channel->RequestStop();
        _device->Stop();
        // The device may have gone quiet before it saw the request; flush from here instead.
        _processor->Stop();

        ChunkChannel::Message message;
        while (!_channel->EndOfStreamReceived() && _channel->TryReceive(message)) {
            if (message.type == ChunkChannel::Message::Type::Chunk) {
                _assembler->Accept(message.chunk);
            }
        }

        _elapsedSeconds = _assembler->ElapsedSeconds();
        DEBUG_LOG("Recording stopped." << DEBUG_LOG_ENDL);
        DEBUG_LOG("Recorded " << _assembler->GetFrameCount() << " frames in "
                  << _assembler->GetChunksAccepted() << " chunks ("
                  << _assembler->GetChunksDiscarded() << " discarded after the limit)" << DEBUG_LOG_ENDL);

        buffers = _assembler->Finalize();
    } catch (const EmptyRecordingException&) {
        DEBUG_LOG("WARNING: No audio data was recorded!" << DEBUG_LOG_ENDL);
        ReleaseCapture();
        _elapsedSeconds = 0.0;
        ChangePhase(Phase::Idle);
        return;
    } catch (const std::exception& e) {
        ERROR_LOG("Failed to finish recording: " << e.what());
        _lastError = e.what();
        ReleaseCapture();
        ChangePhase(Phase::Error);
        throw;
    }

    try {
        _clip.emplace(EncodeWav(buffers, _format.sampleRate), _format.sampleRate, _format.channels);
    } catch (const std::exception& e) {
        ERROR_LOG("Encoding failed: " << e.what());
        _lastError = e.what();
        ReleaseCapture();
        ChangePhase(Phase::Error);
        throw;
    }

    ReleaseCapture();
    ChangePhase(Phase::Encoded);
}

void RecordingSession::Discard() noexcept {
    ReleaseCapture();
    _clip.reset();
    _elapsedSeconds = 0.0;
    _peakLevel = 0.0f;
    if (_phase == Phase::Idle) {
        return;
    }
    try {
        ChangePhase(Phase::Idle);
    } catch (const std::exception& e) {
        ERROR_LOG("Phase callback failed during discard: " << e.what());
    }
}

double RecordingSession::ElapsedSeconds() const {
    if (_assembler && (_phase == Phase::Recording || _phase == Phase::Stopping)) {
        return _assembler->ElapsedSeconds();
    }
    return _elapsedSeconds;
}

void RecordingSession::ReleaseCapture() noexcept {
    if (_device) {
        _device->Close();
        _device.reset();
    }
    _assembler.reset();
    _processor.reset();
    _channel.reset();
}

void RecordingSession::ChangePhase(Phase newPhase) {
    if (_phase == newPhase) {
        return;
    }
    DEBUG_LOG("[SESSION] " << ToString(_phase) << " -> " << ToString(newPhase) << DEBUG_LOG_ENDL);
    _phase = newPhase;
    if (_phaseCallback) {
        _phaseCallback(newPhase);
    }
}
