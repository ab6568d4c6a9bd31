#include <catch2/catch.hpp>
#include "test_support.hpp"
#include "groups/group_directory.hpp"
#include "keys/key_service.hpp"
#include "messaging/conversation_directory.hpp"
#include "messaging/message_relay.hpp"
#include "messaging/relationship_service.hpp"

using namespace sealgate;
using namespace sealgate::testing;

namespace {

MessagingPolicy tightPolicy() {
    MessagingPolicy policy;
    policy.max_message_size = 16;
    policy.dm_global = RateRule{5, 60};
    policy.dm_burst = RateRule{100, 5};
    return policy;
}

struct RelayFixture {
    InMemoryStorage storage;
    ManualClock clock;
    RecordingPublisher publisher;
    KeyService keys{storage, clock, KeyPolicy()};
    ConversationDirectory conversations{storage, clock};
    RelationshipService relationships{storage, clock};
    MessageRelay relay;
    std::string alice_device;
    std::string bob_device;
    std::string conversation_id;

    explicit RelayFixture(const MessagingPolicy& policy = MessagingPolicy())
        : relay(storage, clock, policy, &publisher) {
        addUser(storage, "alice");
        addUser(storage, "bob");
        addUser(storage, "carol");
        alice_device = registerDevice(keys, "alice");
        bob_device = registerDevice(keys, "bob");

        ConversationView view;
        bool created = false;
        ServiceError error;
        REQUIRE(conversations.findOrCreate("alice", "bob", view, created, error));
        conversation_id = view.conversation.id;
    }

    SendMessageRequest message(const std::string& text, const std::string& client_id = "") const {
        SendMessageRequest request;
        request.sender_device_id = alice_device;
        request.ciphertext = base64(text);
        request.proto = 1;
        request.client_message_id = client_id;
        return request;
    }

    bool send(const std::string& text, SendResult& result, ServiceError& error,
              const std::string& client_id = "") {
        return relay.sendDirect("alice", conversation_id, message(text, client_id), result, error);
    }
};

} // namespace

TEST_CASE("A direct send stores one message, one receipt and notifies the peer", "[relay]") {
    RelayFixture f;
    SendResult result;
    ServiceError error;
    REQUIRE(f.send("hi bob", result, error));
    CHECK_FALSE(result.duplicate);
    CHECK(result.message.sender_device_id == f.alice_device);

    auto state = f.storage.snapshot();
    CHECK(state.messages.size() == 1);
    CHECK(state.receipts.size() == 1);
    CHECK(state.receipts.count({result.message.id, "bob"}) == 1);
    CHECK(state.conversations.at(f.conversation_id).last_message_at == f.clock.nowMillis());

    CHECK(f.publisher.countFor("bob", "\"type\":\"dm\"") == 1);
    CHECK(f.publisher.countFor("alice", "\"type\":\"dm\"") == 0);
}

TEST_CASE("Resending with the same client_message_id is a duplicate", "[relay]") {
    RelayFixture f;
    SendResult first;
    SendResult second;
    ServiceError error;
    REQUIRE(f.send("hi", first, error, "client-1"));
    REQUIRE(f.send("hi", second, error, "client-1"));

    CHECK(second.duplicate);
    CHECK(second.message.id == first.message.id);
    CHECK(f.storage.snapshot().messages.size() == 1);
    CHECK(f.publisher.countFor("bob", "\"type\":\"dm\"") == 1);
}

TEST_CASE("Sends are validated before touching storage", "[relay]") {
    RelayFixture f(tightPolicy());
    SendResult result;
    ServiceError error;

    SECTION("empty ciphertext") {
        SendMessageRequest request = f.message("x");
        request.ciphertext.clear();
        REQUIRE_FALSE(f.relay.sendDirect("alice", f.conversation_id, request, result, error));
        CHECK(error.status == 400);
    }
    SECTION("invalid base64") {
        SendMessageRequest request = f.message("x");
        request.ciphertext = "***";
        REQUIRE_FALSE(f.relay.sendDirect("alice", f.conversation_id, request, result, error));
        CHECK(error.status == 400);
    }
    SECTION("over the size ceiling") {
        REQUIRE_FALSE(f.send(std::string(17, 'x'), result, error));
        CHECK(error.status == 413);
    }
    SECTION("exactly at the size ceiling") {
        REQUIRE(f.send(std::string(16, 'x'), result, error));
    }
}

TEST_CASE("Direct send failures", "[relay]") {
    RelayFixture f;
    SendResult result;
    ServiceError error;

    SECTION("caller is not a participant") {
        registerDevice(f.keys, "carol");
        SendMessageRequest request = f.message("x");
        request.sender_device_id.clear();
        REQUIRE_FALSE(f.relay.sendDirect("carol", f.conversation_id, request, result, error));
        CHECK(error.status == 404);
    }
    SECTION("revoked sender device") {
        bool already = false;
        REQUIRE(f.keys.revokeDevice("alice", f.alice_device, "lost", already, error));
        REQUIRE_FALSE(f.send("x", result, error));
        CHECK(error.status == 409);
        CHECK(error.code == codes::DEVICE_REVOKED);
    }
    SECTION("device of another user") {
        SendMessageRequest request = f.message("x");
        request.sender_device_id = f.bob_device;
        REQUIRE_FALSE(f.relay.sendDirect("alice", f.conversation_id, request, result, error));
        CHECK(error.status == 400);
    }
    SECTION("blocked by the peer") {
        bool already = false;
        REQUIRE(f.relationships.block("bob", "alice", already, error));
        REQUIRE_FALSE(f.send("x", result, error));
        CHECK(error.status == 403);
        CHECK(error.code == codes::BLOCKED);
    }
    CHECK(f.storage.snapshot().messages.empty());
    CHECK(f.publisher.events.empty());
}

TEST_CASE("The sixth send inside a 5-per-60s window is rate limited", "[relay][ratelimit]") {
    RelayFixture f(tightPolicy());
    SendResult result;
    ServiceError error;
    for (int i = 0; i < 5; ++i) {
        REQUIRE(f.send("m" + std::to_string(i), result, error));
        f.clock.advanceSeconds(1);
    }

    REQUIRE_FALSE(f.send("m5", result, error));
    CHECK(error.status == 429);
    CHECK(error.code == codes::RATE_LIMITED);
    CHECK(error.headers.at("X-RateLimit-Limit") == "5");
    CHECK(error.headers.at("X-RateLimit-Remaining") == "0");
    const int retry_after = std::stoi(error.headers.at("Retry-After"));
    CHECK(retry_after > 0);
    CHECK(retry_after <= 60);
    CHECK(retry_after == 55);
    CHECK(error.headers.at("X-Retry-After") == error.headers.at("Retry-After"));

    f.clock.advanceSeconds(60);
    REQUIRE(f.send("m5", result, error));
}

TEST_CASE("Retry-after is derived from the oldest message in the window", "[relay][ratelimit]") {
    CHECK(RateLimiter::retryAfterSeconds(0, 60, 59500) == 1);
    CHECK(RateLimiter::retryAfterSeconds(0, 60, 1000) == 59);
    CHECK(RateLimiter::retryAfterSeconds(0, 60, 60000) == 1);
}

TEST_CASE("A failing publisher never fails the send", "[relay]") {
    InMemoryStorage storage;
    ManualClock clock;
    ThrowingPublisher publisher;
    KeyService keys(storage, clock, KeyPolicy());
    ConversationDirectory conversations(storage, clock);
    MessageRelay relay(storage, clock, MessagingPolicy(), &publisher);
    addUser(storage, "alice");
    addUser(storage, "bob");
    registerDevice(keys, "alice");

    ConversationView view;
    bool created = false;
    ServiceError error;
    REQUIRE(conversations.findOrCreate("alice", "bob", view, created, error));

    SendMessageRequest request;
    request.ciphertext = base64("payload");
    request.proto = 1;
    SendResult result;
    REQUIRE(relay.sendDirect("alice", view.conversation.id, request, result, error));
    CHECK(publisher.attempts == 1);
    CHECK(storage.snapshot().messages.size() == 1);
}

TEST_CASE("Message pages are chronological and support cursor and after", "[relay][paging]") {
    RelayFixture f;
    std::vector<std::string> ids;
    for (int i = 0; i < 7; ++i) {
        SendResult result;
        ServiceError error;
        REQUIRE(f.send("m" + std::to_string(i), result, error));
        ids.push_back(result.message.id);
        f.clock.advanceSeconds(1);
    }

    std::vector<Message> page;
    ServiceError error;
    MessageQuery latest;
    latest.limit = 3;
    REQUIRE(f.relay.listMessages("bob", MessageKind::Direct, f.conversation_id, latest, page, error));
    REQUIRE(page.size() == 3);
    CHECK(page[0].id == ids[4]);
    CHECK(page[2].id == ids[6]);

    MessageQuery older;
    older.limit = 3;
    older.cursor = page[0].id;
    REQUIRE(f.relay.listMessages("bob", MessageKind::Direct, f.conversation_id, older, page, error));
    REQUIRE(page.size() == 3);
    CHECK(page[0].id == ids[1]);
    CHECK(page[2].id == ids[3]);

    MessageQuery newer;
    newer.limit = 2;
    newer.after = ids[2];
    REQUIRE(f.relay.listMessages("bob", MessageKind::Direct, f.conversation_id, newer, page, error));
    REQUIRE(page.size() == 2);
    CHECK(page[0].id == ids[3]);
    CHECK(page[1].id == ids[4]);

    MessageQuery unknown;
    unknown.cursor = "not-a-message";
    REQUIRE(f.relay.listMessages("bob", MessageKind::Direct, f.conversation_id, unknown, page, error));
    CHECK(page.size() == 7);

    REQUIRE_FALSE(f.relay.listMessages("carol", MessageKind::Direct, f.conversation_id, latest, page, error));
    CHECK(error.status == 404);
}

TEST_CASE("Receipt timestamps are written once", "[relay][receipts]") {
    RelayFixture f;
    SendResult sent;
    ServiceError error;
    REQUIRE(f.send("hello", sent, error));

    DeliveryReceipt receipt;
    f.clock.advanceSeconds(5);
    const int64_t delivered_at = f.clock.nowMillis();
    REQUIRE(f.relay.markDelivered("bob", MessageKind::Direct, sent.message.id, receipt, error));
    CHECK(receipt.delivered_at == delivered_at);
    CHECK(receipt.read_at == 0);

    f.clock.advanceSeconds(5);
    REQUIRE(f.relay.markDelivered("bob", MessageKind::Direct, sent.message.id, receipt, error));
    CHECK(receipt.delivered_at == delivered_at);

    const int64_t read_at = f.clock.nowMillis();
    REQUIRE(f.relay.markRead("bob", MessageKind::Direct, sent.message.id, receipt, error));
    CHECK(receipt.read_at == read_at);
    f.clock.advanceSeconds(5);
    REQUIRE(f.relay.markRead("bob", MessageKind::Direct, sent.message.id, receipt, error));
    CHECK(receipt.read_at == read_at);
    CHECK(receipt.delivered_at == delivered_at);

    SECTION("only the addressed recipient may mark") {
        REQUIRE_FALSE(f.relay.markRead("alice", MessageKind::Direct, sent.message.id, receipt, error));
        CHECK(error.status == 403);
    }
    SECTION("unknown message") {
        REQUIRE_FALSE(f.relay.markDelivered("bob", MessageKind::Direct, "missing", receipt, error));
        CHECK(error.status == 404);
    }
}

TEST_CASE("Reading an undelivered message leaves it undelivered", "[relay][receipts]") {
    RelayFixture f;
    SendResult sent;
    ServiceError error;
    REQUIRE(f.send("hello", sent, error));
    f.clock.advanceSeconds(30);

    DeliveryReceipt receipt;
    REQUIRE(f.relay.markRead("bob", MessageKind::Direct, sent.message.id, receipt, error));
    CHECK(receipt.read_at == f.clock.nowMillis());
    CHECK(receipt.delivered_at == 0);

    f.clock.advanceSeconds(5);
    REQUIRE(f.relay.markDelivered("bob", MessageKind::Direct, sent.message.id, receipt, error));
    CHECK(receipt.delivered_at == f.clock.nowMillis());
    CHECK(receipt.read_at == f.clock.nowMillis() - 5000);
}

TEST_CASE("A storage outage is reported as 500 and nothing is published", "[relay]") {
    InMemoryStorage backing;
    FlakyStorage storage(backing);
    ManualClock clock;
    RecordingPublisher publisher;
    MessageRelay relay(storage, clock, MessagingPolicy(), &publisher);

    storage.failing = true;
    SendMessageRequest request;
    request.ciphertext = base64("payload");
    SendResult result;
    ServiceError error;
    REQUIRE_FALSE(relay.sendDirect("alice", "any", request, result, error));
    CHECK(error.status == 500);
    CHECK(error.message == "storage unavailable");
    CHECK(publisher.events.empty());
}
