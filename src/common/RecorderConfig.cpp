#include "RecorderConfig.hpp"
#include "Exceptions.hpp"
#include "debug_log.hpp"

#include <cmath>
#include <fstream>

RecorderConfig RecorderConfig::FromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw ConfigException("Recorder config must be a JSON object");
    }

    RecorderConfig config;
    try {
        config.sampleRate = json.value("sampleRate", config.sampleRate);
        config.channels = json.value("channels", config.channels);
        config.gain = json.value("gain", config.gain);
        config.flushThreshold = json.value("flushThreshold", config.flushThreshold);
        config.bufferFrames = json.value("bufferFrames", config.bufferFrames);
        config.durationTolerance = json.value("durationTolerance", config.durationTolerance);
        config.deviceName = json.value("deviceName", config.deviceName);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigException(std::string("Invalid recorder config: ") + e.what());
    }

    config.Validate();
    return config;
}

RecorderConfig RecorderConfig::LoadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigException("Could not open config file: " + path);
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigException("Could not parse config file " + path + ": " + e.what());
    }

    DEBUG_LOG("Loaded recorder config from " << path << DEBUG_LOG_ENDL);
    return FromJson(json);
}

nlohmann::json RecorderConfig::ToJson() const {
    return nlohmann::json{
        {"sampleRate", sampleRate},
        {"channels", channels},
        {"gain", gain},
        {"flushThreshold", flushThreshold},
        {"bufferFrames", bufferFrames},
        {"durationTolerance", durationTolerance},
        {"deviceName", deviceName}
    };
}

void RecorderConfig::Validate() const {
    if (sampleRate < 8000 || sampleRate > 192000) {
        throw ConfigException("sampleRate must be between 8000 and 192000");
    }
    if (channels < 1 || channels > 8) {
        throw ConfigException("channels must be between 1 and 8");
    }
    if (!std::isfinite(gain) || gain <= 0.0f) {
        throw ConfigException("gain must be a positive number");
    }
    if (flushThreshold < 128 || flushThreshold > 65536) {
        throw ConfigException("flushThreshold must be between 128 and 65536 frames");
    }
    if (bufferFrames == 0 || bufferFrames > flushThreshold) {
        throw ConfigException("bufferFrames must be non-zero and not exceed flushThreshold");
    }
    if (!std::isfinite(durationTolerance) || durationTolerance < 0.0) {
        throw ConfigException("durationTolerance must be a non-negative number");
    }
}
