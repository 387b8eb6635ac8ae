#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "BufferAssembler.hpp"
#include "ChunkChannel.hpp"
#include "IAudioInputDevice.hpp"
#include "SampleProcessor.hpp"
#include "../WavWorker/EncodedClip.hpp"
#include "../common/Exceptions.hpp"
#include "../common/RecorderConfig.hpp"
#include "../common/Timecode.hpp"

// One capture attempt for one dialogue line. Every method must be called from the same
// (coordinating) thread; only the device callback runs elsewhere.
class RecordingSession {
public:
    enum class Phase {
        Idle,
        Acquiring,
        Recording,
        Stopping,
        Encoded,
        Error
    };

    using DeviceFactory = std::function<std::unique_ptr<IAudioInputDevice>()>;
    using PhaseCallback = std::function<void(Phase)>;

    RecordingSession(const RecorderConfig& config, DeviceFactory deviceFactory);
    ~RecordingSession();

    RecordingSession(const RecordingSession&) = delete;
    RecordingSession& operator=(const RecordingSession&) = delete;

    // Throws InvalidStateException, InvalidDurationException, DeviceUnavailableException.
    void Start(const DialogueWindow& window);

    // Moves captured chunks into the assembler. Stops automatically when the dialogue
    // window is full. Returns the number of chunks handled.
    size_t Pump();

    // No-op unless recording.
    void Stop();

    void Discard() noexcept;

    Phase GetPhase() const { return _phase; }
    bool IsRecording() const { return _phase == Phase::Recording; }
    bool HasClip() const { return _phase == Phase::Encoded && _clip.has_value(); }
    const std::optional<EncodedClip>& GetClip() const { return _clip; }

    double ElapsedSeconds() const;
    double GetMaxDurationSeconds() const { return _maxDurationSeconds; }
    float GetPeakLevel() const { return _peakLevel; }
    unsigned int GetSampleRate() const { return _format.sampleRate; }
    unsigned int GetChannelCount() const { return _format.channels; }

    const std::string& GetLastError() const { return _lastError; }
    std::optional<DeviceUnavailableException::Reason> GetDeviceError() const { return _deviceError; }

    void SetPhaseCallback(PhaseCallback callback) { _phaseCallback = std::move(callback); }

private:
    // Returns true if the assembler asked for an auto-stop.
    bool DrainChannel();
    void ReleaseCapture() noexcept;
    void ChangePhase(Phase newPhase);

    RecorderConfig _config;
    DeviceFactory _deviceFactory;
    PhaseCallback _phaseCallback;

    // Declared before the device so that the device is torn down first.
    std::unique_ptr<ChunkChannel> _channel;
    std::unique_ptr<SampleProcessor> _processor;
    std::unique_ptr<BufferAssembler> _assembler;
    std::unique_ptr<IAudioInputDevice> _device;

    std::optional<EncodedClip> _clip;
    CaptureFormat _format;
    Phase _phase;
    double _maxDurationSeconds;
    double _elapsedSeconds;
    float _peakLevel;
    std::string _lastError;
    std::optional<DeviceUnavailableException::Reason> _deviceError;
};

const char* ToString(RecordingSession::Phase phase);
