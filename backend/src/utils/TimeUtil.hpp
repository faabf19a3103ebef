#pragma once
#include <ctime>
#include <string>

namespace TimeUtil
{
    constexpr std::time_t SECONDS_PER_DAY = 24 * 60 * 60;

    // RFC 3339 in UTC, e.g. "2024-05-01T10:00:00Z".
    std::string formatTimestamp(std::time_t t);

    // Accepts "YYYY-MM-DDTHH:MM:SS" followed by optional fractional seconds and
    // either 'Z' or a +HH:MM / -HH:MM offset. A space may replace the 'T'.
    bool parseTimestamp(const std::string& text, std::time_t& out);

    // now + days, rounded to the nearest second.
    std::time_t addDays(std::time_t now, double days);
}
