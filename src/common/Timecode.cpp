#include "Timecode.hpp"
#include "Exceptions.hpp"

#include <cmath>
#include <cstdio>
#include <limits>
#include <vector>

namespace {

unsigned long ParseField(const std::string& field, const std::string& timecode) {
    if (field.empty() || field.size() > 9) {
        throw InvalidDurationException("Invalid timecode '" + timecode + "', expected HH:MM:SS:mmm");
    }
    unsigned long value = 0;
    for (char c : field) {
        if (c < '0' || c > '9') {
            throw InvalidDurationException("Invalid timecode '" + timecode + "', non-digit component");
        }
        value = value * 10 + static_cast<unsigned long>(c - '0');
    }
    return value;
}

double RoundToMilliseconds(double seconds) {
    return std::round(seconds * 1000.0) / 1000.0;
}

} // namespace

double ParseTimecode(const std::string& timecode) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : timecode) {
        if (c == ':') {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    parts.push_back(current);

    if (parts.size() != 4) {
        throw InvalidDurationException("Invalid timecode '" + timecode + "', expected HH:MM:SS:mmm");
    }

    const unsigned long hours = ParseField(parts[0], timecode);
    const unsigned long minutes = ParseField(parts[1], timecode);
    const unsigned long seconds = ParseField(parts[2], timecode);
    const unsigned long milliseconds = ParseField(parts[3], timecode);

    if (minutes >= 60 || seconds >= 60 || milliseconds >= 1000) {
        throw InvalidDurationException("Invalid timecode '" + timecode + "', component out of range");
    }

    return static_cast<double>(hours) * 3600.0
         + static_cast<double>(minutes) * 60.0
         + static_cast<double>(seconds)
         + static_cast<double>(milliseconds) / 1000.0;
}

std::string FormatTimecode(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) {
        throw InvalidDurationException("Cannot format a negative or non-finite duration");
    }
    if (seconds >= static_cast<double>(std::numeric_limits<unsigned long long>::max() / 1000ULL)) {
        throw InvalidDurationException("Duration too large to format as a timecode");
    }

    // Work in whole milliseconds so that 2.9999999 does not print as 00:00:02:999
    // when it was meant as 3 s.
    const unsigned long long totalMs =
        static_cast<unsigned long long>(std::floor(seconds * 1000.0 + 1e-6));
    const unsigned long long hours = totalMs / 3600000ULL;
    const unsigned long long minutes = (totalMs / 60000ULL) % 60ULL;
    const unsigned long long secs = (totalMs / 1000ULL) % 60ULL;
    const unsigned long long ms = totalMs % 1000ULL;

    char buffer[48];
    std::snprintf(buffer, sizeof(buffer), "%02llu:%02llu:%02llu:%03llu", hours, minutes, secs, ms);
    return buffer;
}

bool DurationsMatch(double audioSeconds, double videoSeconds, double toleranceSeconds) {
    return std::fabs(audioSeconds - videoSeconds) < toleranceSeconds;
}

double DialogueWindow::MaxDurationSeconds() const {
    const double start = ParseTimecode(timeStart);
    const double end = ParseTimecode(timeEnd);
    if (end <= start) {
        throw InvalidDurationException("Dialogue window ends (" + timeEnd
                                       + ") before it starts (" + timeStart + ")");
    }
    return RoundToMilliseconds(end - start);
}
