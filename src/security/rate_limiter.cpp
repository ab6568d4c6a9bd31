#include "../../include/security/rate_limiter.hpp"
#include "../../include/utils/logger.hpp"

namespace sealgate {

RateLimiter::RateLimiter(MessageKind kind, const RateRule& global, const RateRule& burst)
    : kind_(kind), global_(global), burst_(burst) {}

bool RateLimiter::allow(Store& store, const std::string& sender_user_id, const std::string& target_id,
                        int64_t now_ms, ServiceError& error) const {
    return check(store, global_, "global", sender_user_id, "", now_ms, error) &&
           check(store, burst_, "burst", sender_user_id, target_id, now_ms, error);
}

int64_t RateLimiter::retryAfterSeconds(int64_t oldest_ms, int window_seconds, int64_t now_ms) {
    int64_t remaining_ms = oldest_ms + static_cast<int64_t>(window_seconds) * 1000 - now_ms;
    int64_t seconds = (remaining_ms + 999) / 1000;
    return seconds < 1 ? 1 : seconds;
}

bool RateLimiter::check(Store& store, const RateRule& rule, const char* scope, const std::string& sender_user_id,
                        const std::string& target_id, int64_t now_ms, ServiceError& error) const {
    int64_t since = now_ms - static_cast<int64_t>(rule.window_seconds) * 1000;
    WindowUsage usage = store.senderWindowUsage(kind_, sender_user_id, target_id, since);
    if (usage.count < rule.max_messages) {
        return true;
    }

    int64_t retry_after = retryAfterSeconds(usage.oldest_at, rule.window_seconds, now_ms);
    error.set(429, codes::RATE_LIMITED,
              "Rate limit exceeded: " + std::to_string(rule.max_messages) + " messages per " +
              std::to_string(rule.window_seconds) + " seconds");
    error.headers["X-RateLimit-Limit"] = std::to_string(rule.max_messages);
    error.headers["X-RateLimit-Remaining"] = "0";
    error.headers["X-Retry-After"] = std::to_string(retry_after);
    error.headers["Retry-After"] = std::to_string(retry_after);
    error.context["limit"] = std::to_string(rule.max_messages);
    error.context["remaining"] = "0";
    error.context["retry_after"] = std::to_string(retry_after);
    error.context["window"] = scope;

    Logger::getInstance().info(std::string("Rate limit (") + scope + ") hit by " + sender_user_id +
                               ", retry after " + std::to_string(retry_after) + "s");
    return false;
}

} // namespace sealgate
