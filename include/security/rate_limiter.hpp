#ifndef RATE_LIMITER_HPP
#define RATE_LIMITER_HPP

#include <string>
#include <cstdint>
#include "../config/config.hpp"
#include "../storage/storage.hpp"
#include "../utils/service_error.hpp"

namespace sealgate {

/**
 * Send throttling with two sliding windows per send:
 *   - global: every message of the sender of this kind within the window
 *   - burst:  the sender's messages to this one conversation / group
 *
 * Windows are measured by counting already-persisted messages, so there is no
 * separate counter state. On rejection the error carries limit, remaining and a
 * retry-after derived from the oldest message still inside the window.
 */
class RateLimiter {
public:
    RateLimiter(MessageKind kind, const RateRule& global, const RateRule& burst);

    bool allow(Store& store, const std::string& sender_user_id, const std::string& target_id,
               int64_t now_ms, ServiceError& error) const;

    // Seconds until the oldest in-window message leaves the window, at least 1.
    static int64_t retryAfterSeconds(int64_t oldest_ms, int window_seconds, int64_t now_ms);

private:
    bool check(Store& store, const RateRule& rule, const char* scope, const std::string& sender_user_id,
               const std::string& target_id, int64_t now_ms, ServiceError& error) const;

    MessageKind kind_;
    RateRule global_;
    RateRule burst_;
};

} // namespace sealgate

#endif // RATE_LIMITER_HPP
