#include "RtAudioInputDevice.hpp"
#include "../common/Exceptions.hpp"
#include "../common/debug_log.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace {

DeviceUnavailableException::Reason ReasonFor(RtAudioErrorType error) {
    switch (error) {
        case RTAUDIO_NO_DEVICES_FOUND:
        case RTAUDIO_INVALID_DEVICE:
        case RTAUDIO_DEVICE_DISCONNECT:
            return DeviceUnavailableException::Reason::NoDevice;
        default:
            // The platform refused to open the device (busy, access denied by the system).
            return DeviceUnavailableException::Reason::PermissionDenied;
    }
}

} // namespace

RtAudioInputDevice::RtAudioInputDevice()
    : _audio(RtAudio::UNSPECIFIED, [](RtAudioErrorType type, const std::string& errorText) {
          if (type == RTAUDIO_WARNING) {
              DEBUG_LOG("RtAudio warning: " << errorText << DEBUG_LOG_ENDL);
          } else {
              ERROR_LOG("RtAudio error: " << errorText);
          }
      })
    , _overflows(0) {
    _audio.showWarnings(false);
}

RtAudioInputDevice::~RtAudioInputDevice() {
    Close();
}

int RtAudioInputDevice::OnAudio(void* /*outputBuffer*/, void* inputBuffer, unsigned int nBufferFrames,
                                double /*streamTime*/, RtAudioStreamStatus status, void* userData) {
    RtAudioInputDevice* device = static_cast<RtAudioInputDevice*>(userData);

    if (status & RTAUDIO_INPUT_OVERFLOW) {
        device->_overflows.fetch_add(1, std::memory_order_relaxed);
    }

    if (inputBuffer && device->_callback) {
        device->_callback(static_cast<const float*>(inputBuffer), nBufferFrames);
    }
    return 0;
}

unsigned int RtAudioInputDevice::SelectDevice(const std::string& deviceName) {
    std::vector<unsigned int> deviceIds = _audio.getDeviceIds();
    if (deviceIds.empty()) {
        throw DeviceUnavailableException(DeviceUnavailableException::Reason::NoDevice,
                                         "No audio devices found");
    }

    DEBUG_LOG("Available audio devices:" << DEBUG_LOG_ENDL);
    for (unsigned int i = 0; i < deviceIds.size(); i++) {
        RtAudio::DeviceInfo info = _audio.getDeviceInfo(deviceIds[i]);
        DEBUG_LOG("Device " << i << " (ID: " << deviceIds[i] << "): " << info.name
                  << ", input channels: " << info.inputChannels << DEBUG_LOG_ENDL);
        if (!deviceName.empty() && info.name == deviceName && info.inputChannels > 0) {
            return deviceIds[i];
        }
    }

    if (!deviceName.empty()) {
        throw DeviceUnavailableException(DeviceUnavailableException::Reason::NoDevice,
                                         "Input device '" + deviceName + "' not found");
    }

    unsigned int selected = _audio.getDefaultInputDevice();
    RtAudio::DeviceInfo selectedInfo = _audio.getDeviceInfo(selected);
    if (selectedInfo.inputChannels < 1) {
        DEBUG_LOG("Default device has no input channels! Searching for alternative..." << DEBUG_LOG_ENDL);
        for (unsigned int id : deviceIds) {
            RtAudio::DeviceInfo info = _audio.getDeviceInfo(id);
            if (info.inputChannels > 0) {
                selected = id;
                selectedInfo = info;
                break;
            }
        }
    }

    if (selectedInfo.inputChannels < 1) {
        throw DeviceUnavailableException(DeviceUnavailableException::Reason::NoDevice,
                                         "No input devices found");
    }

    DEBUG_LOG("Using input device: " << selectedInfo.name << DEBUG_LOG_ENDL);
    return selected;
}

unsigned int RtAudioInputDevice::SelectSampleRate(const RtAudio::DeviceInfo& info,
                                                  unsigned int requested) const {
    if (std::find(info.sampleRates.begin(), info.sampleRates.end(), requested) != info.sampleRates.end()) {
        return requested;
    }
    DEBUG_LOG(requested << " Hz not supported, using preferred rate: "
              << info.preferredSampleRate << DEBUG_LOG_ENDL);
    return info.preferredSampleRate;
}

CaptureFormat RtAudioInputDevice::Open(const CaptureRequest& request, BlockCallback callback) {
    if (_audio.getCurrentApi() == RtAudio::RTAUDIO_DUMMY) {
        throw DeviceUnavailableException(DeviceUnavailableException::Reason::Unsupported,
                                         "RtAudio was built without an audio backend");
    }
    if (_audio.isStreamOpen()) {
        Close();
    }

    const unsigned int deviceId = SelectDevice(request.deviceName);
    const RtAudio::DeviceInfo info = _audio.getDeviceInfo(deviceId);

    CaptureFormat format;
    format.channels = std::min(request.channels, info.inputChannels);
    format.sampleRate = SelectSampleRate(info, request.sampleRate);

    _parameters.deviceId = deviceId;
    _parameters.nChannels = format.channels;
    _parameters.firstChannel = 0;

    RtAudio::StreamOptions options;
    options.flags = RTAUDIO_MINIMIZE_LATENCY | RTAUDIO_SCHEDULE_REALTIME;
    options.streamName = "DubCapture";

    unsigned int bufferFrames = request.bufferFrames;
    _callback = std::move(callback);

    DEBUG_LOG("Opening input stream: " << format.sampleRate << " Hz, " << format.channels
              << " ch, " << bufferFrames << " frames, FLOAT32" << DEBUG_LOG_ENDL);

    RtAudioErrorType error = _audio.openStream(nullptr, &_parameters, RTAUDIO_FLOAT32,
                                               format.sampleRate, &bufferFrames,
                                               &RtAudioInputDevice::OnAudio, this, &options);
    if (error != RTAUDIO_NO_ERROR) {
        _callback = nullptr;
        throw DeviceUnavailableException(ReasonFor(error),
                                         "Error opening input stream: " + _audio.getErrorText());
    }

    DEBUG_LOG("Input stream opened, " << bufferFrames << " frames per block" << DEBUG_LOG_ENDL);
    return format;
}

void RtAudioInputDevice::Start() {
    RtAudioErrorType error = _audio.startStream();
    if (error != RTAUDIO_NO_ERROR) {
        const std::string text = _audio.getErrorText();
        Close();
        throw DeviceUnavailableException(ReasonFor(error), "Error starting input stream: " + text);
    }
}

void RtAudioInputDevice::Stop() {
    if (_audio.isStreamRunning()) {
        _audio.stopStream();
    }
    if (_overflows.load() > 0) {
        DEBUG_LOG("Input stream reported " << _overflows.load() << " overflows" << DEBUG_LOG_ENDL);
    }
}

void RtAudioInputDevice::Close() noexcept {
    if (_audio.isStreamRunning()) {
        _audio.abortStream();
    }
    if (_audio.isStreamOpen()) {
        _audio.closeStream();
    }
    _callback = nullptr;
}
