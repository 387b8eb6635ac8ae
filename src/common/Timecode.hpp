#pragma once

#include <optional>
#include <string>

// Dialogue timecodes are "HH:MM:SS:mmm" strings.
double ParseTimecode(const std::string& timecode);
std::string FormatTimecode(double seconds);

// Recorded audio and the video clip are considered in sync when they differ by less than
// the tolerance.
bool DurationsMatch(double audioSeconds, double videoSeconds, double toleranceSeconds);

struct DialogueWindow {
    std::string timeStart;
    std::string timeEnd;
    std::optional<std::string> voiceOverUrl;

    // end - start rounded to milliseconds. Throws InvalidDurationException if end <= start.
    double MaxDurationSeconds() const;
};
