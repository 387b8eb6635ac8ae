#pragma once

#include <nlohmann/json.hpp>
#include <string>

struct RecorderConfig {
    unsigned int sampleRate = 48000;
    unsigned int channels = 2;
    float gain = 1.5f;
    unsigned int flushThreshold = 4096;
    unsigned int bufferFrames = 256;
    double durationTolerance = 0.1;
    // Empty selects the system default input.
    std::string deviceName;

    static RecorderConfig FromJson(const nlohmann::json& json);
    static RecorderConfig LoadFromFile(const std::string& path);

    nlohmann::json ToJson() const;
    void Validate() const;
};
