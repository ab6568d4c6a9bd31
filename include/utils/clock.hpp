#ifndef CLOCK_HPP
#define CLOCK_HPP

#include <cstdint>
#include <string>

namespace sealgate {

// Wall clock in milliseconds since the Unix epoch.
class Clock {
public:
    virtual ~Clock() = default;
    virtual int64_t nowMillis() const = 0;
};

class SystemClock : public Clock {
public:
    int64_t nowMillis() const override;
};

// ISO-8601 UTC with millisecond precision, e.g. 2025-01-02T03:04:05.678Z.
std::string formatTimestamp(int64_t millis);
// Accepts "YYYY-mm-ddTHH:MM:SS", optional fractional seconds, and "Z" or "+00:00".
bool parseTimestamp(const std::string& text, int64_t& millis);
// Milliseconds of 00:00:00 UTC on the day containing `millis`.
int64_t startOfDay(int64_t millis);

} // namespace sealgate

#endif // CLOCK_HPP
