#include "TimeUtil.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>

namespace TimeUtil
{
    std::string formatTimestamp(std::time_t t) {
        std::tm tm_utc{};
        gmtime_r(&t, &tm_utc);

        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
        return std::string(buf);
    }

    static bool readDigits(const std::string& s, size_t pos, size_t count, int& out) {
        if (pos + count > s.size()) return false;
        int value = 0;
        for (size_t i = pos; i < pos + count; ++i) {
            if (!std::isdigit((unsigned char)s[i])) return false;
            value = value * 10 + (s[i] - '0');
        }
        out = value;
        return true;
    }

    bool parseTimestamp(const std::string& text, std::time_t& out) {
        // 0123456789012345678
        // YYYY-MM-DDTHH:MM:SS
        if (text.size() < 19) return false;
        if (text[4] != '-' || text[7] != '-' || text[13] != ':' || text[16] != ':') return false;
        if (text[10] != 'T' && text[10] != 't' && text[10] != ' ') return false;

        int year, month, day, hour, minute, second;
        if (!readDigits(text, 0, 4, year) || !readDigits(text, 5, 2, month) ||
            !readDigits(text, 8, 2, day) || !readDigits(text, 11, 2, hour) ||
            !readDigits(text, 14, 2, minute) || !readDigits(text, 17, 2, second))
            return false;

        if (month < 1 || month > 12 || day < 1 || day > 31 ||
            hour > 23 || minute > 59 || second > 60)
            return false;

        size_t pos = 19;
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            size_t start = pos;
            while (pos < text.size() && std::isdigit((unsigned char)text[pos])) ++pos;
            if (pos == start) return false;
        }

        long offset_seconds = 0;
        if (pos == text.size()) {
            // no designator: treat as UTC
        }
        else if ((text[pos] == 'Z' || text[pos] == 'z') && pos + 1 == text.size()) {
            // UTC
        }
        else if (text[pos] == '+' || text[pos] == '-') {
            int oh, om;
            if (pos + 6 != text.size() || text[pos + 3] != ':') return false;
            if (!readDigits(text, pos + 1, 2, oh) || !readDigits(text, pos + 4, 2, om)) return false;
            if (oh > 23 || om > 59) return false;
            offset_seconds = oh * 3600L + om * 60L;
            if (text[pos] == '-') offset_seconds = -offset_seconds;
        }
        else {
            return false;
        }

        std::tm tm_utc{};
        tm_utc.tm_year = year - 1900;
        tm_utc.tm_mon = month - 1;
        tm_utc.tm_mday = day;
        tm_utc.tm_hour = hour;
        tm_utc.tm_min = minute;
        tm_utc.tm_sec = second;

        std::time_t t = timegm(&tm_utc);
        if (t == static_cast<std::time_t>(-1) && !(year == 1969 && month == 12 && day == 31))
            return false;

        out = t - offset_seconds;
        return true;
    }

    std::time_t addDays(std::time_t now, double days) {
        double seconds = std::round(days * static_cast<double>(SECONDS_PER_DAY));
        return now + static_cast<std::time_t>(seconds);
    }
}
