#include <catch2/catch.hpp>
#include <mutex>
#include <set>
#include <thread>
#include "test_support.hpp"
#include "keys/key_service.hpp"
#include "messaging/conversation_directory.hpp"
#include "messaging/message_relay.hpp"
#include "messaging/relationship_service.hpp"

using namespace sealgate;
using namespace sealgate::testing;

namespace {

struct ConversationFixture {
    InMemoryStorage storage;
    ManualClock clock;
    ConversationDirectory conversations{storage, clock};
    KeyService keys{storage, clock, KeyPolicy()};

    ConversationFixture() {
        for (const char* user : {"alice", "bob", "carol"}) {
            addUser(storage, user);
        }
    }

    ConversationView open(const std::string& a, const std::string& b) {
        ConversationView view;
        bool created = false;
        ServiceError error;
        REQUIRE(conversations.findOrCreate(a, b, view, created, error));
        return view;
    }
};

} // namespace

TEST_CASE("Pair keys do not depend on argument order", "[conversations]") {
    CHECK(ConversationDirectory::pairKey("alice", "bob") == ConversationDirectory::pairKey("bob", "alice"));
    CHECK(ConversationDirectory::pairKey("alice", "bob") != ConversationDirectory::pairKey("alice", "carol"));
}

TEST_CASE("FindOrCreate returns the existing conversation from either side", "[conversations]") {
    ConversationFixture f;
    ConversationView first;
    bool created = false;
    ServiceError error;
    REQUIRE(f.conversations.findOrCreate("alice", "bob", first, created, error));
    CHECK(created);
    CHECK(first.participants.size() == 2);

    ConversationView second;
    REQUIRE(f.conversations.findOrCreate("bob", "alice", second, created, error));
    CHECK_FALSE(created);
    CHECK(second.conversation.id == first.conversation.id);
}

TEST_CASE("Concurrent FindOrCreate calls converge on one row", "[conversations][concurrency]") {
    ConversationFixture f;
    std::mutex ids_mutex;
    std::set<std::string> ids;
    std::vector<std::thread> threads;
    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([&f, &ids, &ids_mutex, i]() {
            ConversationView view;
            bool created = false;
            ServiceError error;
            bool ok = i % 2 == 0 ? f.conversations.findOrCreate("alice", "bob", view, created, error)
                                 : f.conversations.findOrCreate("bob", "alice", view, created, error);
            if (ok) {
                std::lock_guard<std::mutex> lock(ids_mutex);
                ids.insert(view.conversation.id);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    CHECK(ids.size() == 1);
    CHECK(f.storage.snapshot().conversations.size() == 1);
    CHECK(f.storage.snapshot().participants.size() == 2);
}

TEST_CASE("FindOrCreate rejects invalid peers", "[conversations]") {
    ConversationFixture f;
    ConversationView view;
    bool created = false;
    ServiceError error;

    SECTION("self") {
        REQUIRE_FALSE(f.conversations.findOrCreate("alice", "alice", view, created, error));
        CHECK(error.status == 400);
    }
    SECTION("unknown user") {
        REQUIRE_FALSE(f.conversations.findOrCreate("alice", "mallory", view, created, error));
        CHECK(error.status == 404);
    }
    SECTION("blocked in either direction") {
        RelationshipService relationships(f.storage, f.clock);
        bool already = false;
        REQUIRE(relationships.block("bob", "alice", already, error));
        REQUIRE_FALSE(f.conversations.findOrCreate("alice", "bob", view, created, error));
        CHECK(error.status == 403);
        CHECK(error.code == codes::BLOCKED);
    }
    CHECK(f.storage.snapshot().conversations.empty());
}

TEST_CASE("Participant device lists are re-derived from the device table", "[conversations]") {
    ConversationFixture f;
    const std::string id = f.open("alice", "bob").conversation.id;

    const std::string device = registerDevice(f.keys, "bob");
    ConversationView view;
    ServiceError error;
    REQUIRE(f.conversations.getConversation("alice", id, view, error));
    for (const auto& participant : view.participants) {
        if (participant.user_id == "bob") {
            REQUIRE(participant.device_ids.size() == 1);
            CHECK(participant.device_ids[0] == device);
        } else {
            CHECK(participant.device_ids.empty());
        }
    }

    bool already = false;
    REQUIRE(f.keys.revokeDevice("bob", device, "lost", already, error));
    REQUIRE(f.conversations.getConversation("alice", id, view, error));
    for (const auto& participant : view.participants) {
        CHECK(participant.device_ids.empty());
    }
}

TEST_CASE("Conversations are only visible to participants", "[conversations]") {
    ConversationFixture f;
    const std::string id = f.open("alice", "bob").conversation.id;
    ConversationView view;
    ServiceError error;
    REQUIRE_FALSE(f.conversations.getConversation("carol", id, view, error));
    CHECK(error.status == 404);
    REQUIRE_FALSE(f.conversations.getConversation("alice", "no-such-id", view, error));
    CHECK(error.status == 404);
}

TEST_CASE("Conversation list is ordered by latest activity with unread counts", "[conversations]") {
    ConversationFixture f;
    MessageRelay relay(f.storage, f.clock, MessagingPolicy());
    registerDevice(f.keys, "bob");

    const std::string with_bob = f.open("alice", "bob").conversation.id;
    f.clock.advanceSeconds(10);
    const std::string with_carol = f.open("alice", "carol").conversation.id;

    std::vector<ConversationSummary> list;
    ServiceError error;
    REQUIRE(f.conversations.listConversations("alice", 0, 0, list, error));
    REQUIRE(list.size() == 2);
    CHECK(list[0].conversation_id == with_carol);

    f.clock.advanceSeconds(10);
    SendMessageRequest send;
    send.ciphertext = base64("hello");
    send.proto = 1;
    SendResult sent;
    REQUIRE(relay.sendDirect("bob", with_bob, send, sent, error));

    REQUIRE(f.conversations.listConversations("alice", 0, 0, list, error));
    REQUIRE(list.size() == 2);
    CHECK(list[0].conversation_id == with_bob);
    CHECK(list[0].peer_user_id == "bob");
    CHECK(list[0].unread_count == 1);
    CHECK(list[1].unread_count == 0);

    DeliveryReceipt receipt;
    REQUIRE(relay.markRead("alice", MessageKind::Direct, sent.message.id, receipt, error));
    REQUIRE(f.conversations.listConversations("alice", 1, 0, list, error));
    REQUIRE(list.size() == 1);
    CHECK(list[0].unread_count == 0);
}
