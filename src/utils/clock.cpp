#include "../../include/utils/clock.hpp"
#include <chrono>
#include <ctime>
#include <cstdio>
#include <cctype>
#include <sstream>
#include <iomanip>

namespace sealgate {

int64_t SystemClock::nowMillis() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string formatTimestamp(int64_t millis) {
    std::time_t seconds = static_cast<std::time_t>(millis / 1000);
    int ms = static_cast<int>(millis % 1000);
    if (ms < 0) {
        ms += 1000;
        seconds -= 1;
    }
    std::tm tm{};
    gmtime_r(&seconds, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setw(3) << std::setfill('0') << ms << "Z";
    return oss.str();
}

bool parseTimestamp(const std::string& text, int64_t& millis) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        return false;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return false;
    }

    size_t pos = static_cast<size_t>(consumed);
    int ms = 0;
    if (pos < text.size() && text[pos] == '.') {
        pos++;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 3) {
                ms = ms * 10 + (text[pos] - '0');
            }
            digits++;
            pos++;
        }
        if (digits == 0) {
            return false;
        }
        for (int i = digits; i < 3; i++) {
            ms *= 10;
        }
    }

    int offset_minutes = 0;
    if (pos < text.size()) {
        const std::string zone = text.substr(pos);
        if (zone == "Z" || zone == "z") {
            offset_minutes = 0;
        } else if ((zone[0] == '+' || zone[0] == '-') && zone.size() == 6 && zone[3] == ':') {
            int oh = 0, om = 0;
            if (std::sscanf(zone.c_str() + 1, "%2d:%2d", &oh, &om) != 2) {
                return false;
            }
            offset_minutes = (oh * 60 + om) * (zone[0] == '+' ? 1 : -1);
        } else {
            return false;
        }
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    const int64_t seconds = static_cast<int64_t>(timegm(&tm)) - static_cast<int64_t>(offset_minutes) * 60;
    millis = seconds * 1000 + ms;
    return true;
}

int64_t startOfDay(int64_t millis) {
    const int64_t day_ms = 24LL * 60 * 60 * 1000;
    return millis - (((millis % day_ms) + day_ms) % day_ms);
}

} // namespace sealgate
