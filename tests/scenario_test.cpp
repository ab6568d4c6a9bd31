#include <catch2/catch.hpp>
#include "test_support.hpp"
#include "groups/group_directory.hpp"
#include "messaging/conversation_directory.hpp"
#include "messaging/message_relay.hpp"

using namespace sealgate;
using namespace sealgate::testing;

SCENARIO("A peer fetches a bundle and claims a one-time prekey", "[scenario][keys]") {
    InMemoryStorage storage;
    ManualClock clock;
    KeyService keys(storage, clock, KeyPolicy());
    ConversationDirectory conversations(storage, clock);
    addUser(storage, "user1");
    addUser(storage, "user2");
    ServiceError error;

    GIVEN("user1 has uploaded bundle v1 with two prekeys") {
        UploadBundleResult uploaded;
        REQUIRE(keys.uploadBundle("user1", bundleRequest(2), uploaded, error));
        REQUIRE(uploaded.bundle_version == 1);
        REQUIRE(uploaded.prekey_ids.size() == 2);

        WHEN("user2 has a conversation with user1 and fetches") {
            ConversationView view;
            bool created = false;
            REQUIRE(conversations.findOrCreate("user2", "user1", view, created, error));

            std::vector<DeviceBundleView> devices;
            REQUIRE(keys.fetchBundles("user2", "user1", -1, devices, error));

            THEN("the bundle shows both prekeys at version 1") {
                REQUIRE(devices.size() == 1);
                CHECK(devices[0].device_id == uploaded.device_id);
                CHECK(devices[0].prekeys_available == 2);
                CHECK(devices[0].bundle_version == 1);
            }

            AND_WHEN("user2 claims the first prekey") {
                ClaimedPrekey claimed;
                REQUIRE(keys.claimPrekey("user2", uploaded.device_id, uploaded.prekey_ids[0], claimed, error));

                THEN("a second fetch shows one prekey left") {
                    REQUIRE(keys.fetchBundles("user2", "user1", 1, devices, error));
                    REQUIRE(devices.size() == 1);
                    CHECK(devices[0].prekeys_available == 1);
                    CHECK(storage.snapshot().bundles.at(uploaded.device_id).prekeys_remaining == 1);
                }
            }
        }
    }
}

SCENARIO("Group membership changes move the epoch and an old link still admits", "[scenario][groups]") {
    InMemoryStorage storage;
    ManualClock clock;
    RecordingPublisher publisher;
    GroupDirectory groups(storage, clock, GroupPolicy(), &publisher);
    for (const char* user : {"owner", "u2", "u3"}) {
        addUser(storage, user);
    }
    ServiceError error;

    GIVEN("a group with only its owner and a link invite") {
        GroupView view;
        REQUIRE(groups.createGroup("owner", "Team", "", view, error));
        const std::string group_id = view.group.id;
        GroupInvite link;
        REQUIRE(groups.createInvite("owner", group_id, CreateInviteRequest(), link, error));

        WHEN("u2 and u3 are added and u2 is removed") {
            MembershipChange change;
            REQUIRE(groups.addMembers("owner", group_id, {"u2", "u3"}, change, error));
            CHECK(change.new_epoch == 1);
            REQUIRE(groups.removeMember("owner", group_id, "u2", change, error));
            CHECK(change.new_epoch == 2);

            THEN("u2 can come back through the old link") {
                std::string joined;
                REQUIRE(groups.joinByCode("u2", link.code, joined, change, error));
                CHECK(joined == group_id);
                CHECK(change.new_epoch == 3);
                CHECK(publisher.countFor("u3", "\"new_epoch\":3") == 1);
            }
            AND_WHEN("u2 is banned instead") {
                REQUIRE(groups.ban("owner", group_id, "u2", "", change, error));
                THEN("the link no longer admits u2") {
                    std::string joined;
                    REQUIRE_FALSE(groups.joinByCode("u2", link.code, joined, change, error));
                    CHECK(error.code == codes::BANNED);
                }
            }
        }
    }
}

SCENARIO("A sender over the per-minute limit waits out the window", "[scenario][ratelimit]") {
    InMemoryStorage storage;
    ManualClock clock;
    MessagingPolicy policy;
    policy.dm_global = RateRule{5, 60};
    KeyService keys(storage, clock, KeyPolicy());
    ConversationDirectory conversations(storage, clock);
    MessageRelay relay(storage, clock, policy);
    addUser(storage, "alice");
    addUser(storage, "bob");
    registerDevice(keys, "alice");
    ServiceError error;

    ConversationView view;
    bool created = false;
    REQUIRE(conversations.findOrCreate("alice", "bob", view, created, error));

    SendMessageRequest request;
    request.ciphertext = base64("hello");
    request.proto = 1;
    SendResult result;

    GIVEN("five sends within a minute, spread beyond the burst window") {
        for (int i = 0; i < 5; ++i) {
            REQUIRE(relay.sendDirect("alice", view.conversation.id, request, result, error));
            clock.advanceSeconds(6);
        }

        WHEN("the sixth send arrives") {
            REQUIRE_FALSE(relay.sendDirect("alice", view.conversation.id, request, result, error));

            THEN("it is rejected with a bounded retry-after") {
                CHECK(error.status == 429);
                CHECK(error.headers.at("X-RateLimit-Remaining") == "0");
                const int retry_after = std::stoi(error.headers.at("Retry-After"));
                CHECK(retry_after >= 1);
                CHECK(retry_after <= 60);
                CHECK(retry_after == 30);
            }
            AND_WHEN("the window has passed") {
                clock.advanceSeconds(60);
                THEN("the same send succeeds") {
                    CHECK(relay.sendDirect("alice", view.conversation.id, request, result, error));
                }
            }
        }
    }
}
