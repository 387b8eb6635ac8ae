#pragma once

#include <stdexcept>
#include <string>

class DubCaptureException : public std::runtime_error {
public:
    explicit DubCaptureException(const std::string& message)
        : std::runtime_error(message) {}
};

class DeviceUnavailableException : public DubCaptureException {
public:
    enum class Reason {
        PermissionDenied,
        NoDevice,
        Unsupported
    };

    DeviceUnavailableException(Reason reason, const std::string& message)
        : DubCaptureException(message), _reason(reason) {}

    Reason GetReason() const { return _reason; }

private:
    Reason _reason;
};

inline const char* ToString(DeviceUnavailableException::Reason reason) {
    switch (reason) {
        case DeviceUnavailableException::Reason::PermissionDenied: return "permission denied";
        case DeviceUnavailableException::Reason::NoDevice: return "no device";
        case DeviceUnavailableException::Reason::Unsupported: return "unsupported platform";
    }
    return "unknown";
}

class InvalidDurationException : public DubCaptureException {
public:
    using DubCaptureException::DubCaptureException;
};

// Stop with zero captured samples. Recoverable: the session treats it as "nothing recorded".
class EmptyRecordingException : public DubCaptureException {
public:
    EmptyRecordingException() : DubCaptureException("No audio data was recorded") {}
};

class InvalidChannelLengthException : public DubCaptureException {
public:
    using DubCaptureException::DubCaptureException;
};

class InvalidStateException : public DubCaptureException {
public:
    using DubCaptureException::DubCaptureException;
};

class PlaybackFailureException : public DubCaptureException {
public:
    using DubCaptureException::DubCaptureException;
};

class WavFormatException : public DubCaptureException {
public:
    using DubCaptureException::DubCaptureException;
};

class ConfigException : public DubCaptureException {
public:
    using DubCaptureException::DubCaptureException;
};
