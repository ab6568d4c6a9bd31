#include <catch2/catch.hpp>
#include "test_support.hpp"
#include "security/rate_limiter.hpp"

using namespace sealgate;
using namespace sealgate::testing;

namespace {

void storeMessage(InMemoryStorage& storage, const std::string& sender, const std::string& target, int64_t at) {
    const std::string id = sender + "-" + target + "-" + std::to_string(at);
    storage.transact([&](Store& store) {
        Message message;
        message.id = id;
        message.kind = MessageKind::Direct;
        message.target_id = target;
        message.sender_user_id = sender;
        message.created_at = at;
        return store.insertMessage(message);
    });
}

bool allowed(InMemoryStorage& storage, const RateLimiter& limiter, const std::string& target, int64_t now,
             ServiceError& error) {
    bool ok = false;
    storage.transact([&](Store& store) {
        ok = limiter.allow(store, "alice", target, now, error);
        return true;
    });
    return ok;
}

} // namespace

TEST_CASE("Retry-after is rounded up and never below one second", "[ratelimit]") {
    CHECK(RateLimiter::retryAfterSeconds(0, 60, 5000) == 55);
    CHECK(RateLimiter::retryAfterSeconds(0, 60, 5001) == 55);
    CHECK(RateLimiter::retryAfterSeconds(0, 60, 4999) == 56);
    CHECK(RateLimiter::retryAfterSeconds(0, 60, 60000) == 1);
    CHECK(RateLimiter::retryAfterSeconds(0, 60, 90000) == 1);
}

TEST_CASE("Burst window applies per conversation", "[ratelimit]") {
    InMemoryStorage storage;
    RateLimiter limiter(MessageKind::Direct, RateRule{10, 60}, RateRule{2, 5});
    const int64_t now = kStartMillis;
    storeMessage(storage, "alice", "conv-1", now - 1000);
    storeMessage(storage, "alice", "conv-1", now - 500);

    ServiceError error;
    REQUIRE_FALSE(allowed(storage, limiter, "conv-1", now, error));
    CHECK(error.status == 429);
    CHECK(error.code == codes::RATE_LIMITED);
    CHECK(error.context.at("window") == "burst");
    CHECK(error.headers.at("X-RateLimit-Limit") == "2");
    CHECK(error.headers.at("X-RateLimit-Remaining") == "0");
    CHECK(error.headers.at("Retry-After") == "4");
    CHECK(error.headers.at("X-Retry-After") == "4");

    CHECK(allowed(storage, limiter, "conv-2", now, error));
    CHECK(allowed(storage, limiter, "conv-1", now + 4001, error));
}

TEST_CASE("Global window counts every conversation of the sender", "[ratelimit]") {
    InMemoryStorage storage;
    RateLimiter limiter(MessageKind::Direct, RateRule{3, 60}, RateRule{10, 5});
    const int64_t now = kStartMillis;
    storeMessage(storage, "alice", "conv-1", now - 30000);
    storeMessage(storage, "alice", "conv-2", now - 20000);
    storeMessage(storage, "alice", "conv-3", now - 10000);
    storeMessage(storage, "bob", "conv-1", now - 1000);

    ServiceError error;
    REQUIRE_FALSE(allowed(storage, limiter, "conv-4", now, error));
    CHECK(error.context.at("window") == "global");
    CHECK(error.headers.at("Retry-After") == "30");

    CHECK(allowed(storage, limiter, "conv-4", now + 30001, error));
}

TEST_CASE("Group messages do not count against the direct limit", "[ratelimit]") {
    InMemoryStorage storage;
    RateLimiter limiter(MessageKind::Group, RateRule{1, 60}, RateRule{1, 5});
    storeMessage(storage, "alice", "conv-1", kStartMillis - 1000);
    ServiceError error;
    CHECK(allowed(storage, limiter, "group-1", kStartMillis, error));
}
