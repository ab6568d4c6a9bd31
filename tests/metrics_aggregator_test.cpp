#include <catch2/catch.hpp>
#include "test_support.hpp"
#include "messaging/conversation_directory.hpp"
#include "messaging/message_relay.hpp"
#include "metrics/metrics_aggregator.hpp"

using namespace sealgate;
using namespace sealgate::testing;

namespace {

class FixedCounter : public ConnectionCounter {
public:
    ConnectionStats connectionStats() const override {
        ConnectionStats stats;
        stats.per_user["alice"] = 2;
        stats.per_user["bob"] = 1;
        stats.total = 3;
        return stats;
    }
};

} // namespace

TEST_CASE("Metrics are for operators only", "[metrics]") {
    InMemoryStorage storage;
    ManualClock clock;
    MetricsAggregator metrics(storage, clock, KeyPolicy(), 30);
    MetricsSnapshot snapshot;
    ServiceError error;
    REQUIRE_FALSE(metrics.snapshot(false, snapshot, error));
    CHECK(error.status == 403);
}

TEST_CASE("Metrics summarise keys, messages and connections", "[metrics]") {
    InMemoryStorage storage;
    ManualClock clock;
    KeyService keys(storage, clock, KeyPolicy());
    ConversationDirectory conversations(storage, clock);
    MessageRelay relay(storage, clock, MessagingPolicy());
    FixedCounter counter;
    MetricsAggregator metrics(storage, clock, KeyPolicy(), 30, &counter);
    addUser(storage, "alice");
    addUser(storage, "bob");

    const std::string healthy = registerDevice(keys, "alice", 10);
    const std::string low = registerDevice(keys, "bob", 3);

    ConversationView view;
    bool created = false;
    ServiceError error;
    REQUIRE(conversations.findOrCreate("alice", "bob", view, created, error));
    SendMessageRequest send;
    send.ciphertext = base64("hi");
    send.proto = 1;
    SendResult sent;
    REQUIRE(relay.sendDirect("alice", view.conversation.id, send, sent, error));

    MetricsSnapshot snapshot;
    REQUIRE(metrics.snapshot(true, snapshot, error));
    CHECK_FALSE(snapshot.stale);
    CHECK(snapshot.prekeys.total_available == 13);
    CHECK(snapshot.prekeys.low_devices == 1);
    REQUIRE(snapshot.prekeys.low_device_ids.size() == 1);
    CHECK(snapshot.prekeys.low_device_ids[0] == low);
    CHECK(snapshot.prekeys.critical_devices == 0);
    CHECK(snapshot.direct_messages.last_hour == 1);
    CHECK(snapshot.group_messages.last_hour == 0);
    CHECK(snapshot.delivery.undelivered == 1);
    CHECK(snapshot.devices.active == 2);
    CHECK(snapshot.connections.total == 3);
    CHECK(snapshot.connections.per_user.at("alice") == 2);
    CHECK(snapshot.signed_prekey_max_age_days == 30);
    CHECK(healthy != low);
}

TEST_CASE("Metrics snapshots are cached and served stale when storage fails", "[metrics]") {
    InMemoryStorage inner;
    FlakyStorage storage(inner);
    ManualClock clock;
    KeyService keys(inner, clock, KeyPolicy());
    MetricsAggregator metrics(storage, clock, KeyPolicy(), 30);
    addUser(inner, "alice");
    MetricsSnapshot snapshot;
    ServiceError error;

    SECTION("no snapshot yet") {
        storage.failing = true;
        REQUIRE_FALSE(metrics.snapshot(true, snapshot, error));
        CHECK(error.status == 503);
    }
    SECTION("cached within the window, stale after a failed refresh") {
        REQUIRE(metrics.snapshot(true, snapshot, error));
        const int64_t first = snapshot.generated_at;
        CHECK(snapshot.devices.total == 0);

        registerDevice(keys, "alice");
        clock.advanceSeconds(10);
        REQUIRE(metrics.snapshot(true, snapshot, error));
        CHECK(snapshot.generated_at == first);
        CHECK(snapshot.devices.total == 0);

        clock.advanceSeconds(30);
        storage.failing = true;
        REQUIRE(metrics.snapshot(true, snapshot, error));
        CHECK(snapshot.stale);
        CHECK(snapshot.generated_at == first);

        storage.failing = false;
        REQUIRE(metrics.snapshot(true, snapshot, error));
        CHECK_FALSE(snapshot.stale);
        CHECK(snapshot.devices.total == 1);
    }
}
