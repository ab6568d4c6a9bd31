#include <catch2/catch.hpp>
#include "test_support.hpp"

using namespace sealgate;
using namespace sealgate::testing;

TEST_CASE("A rejected transaction leaves the state untouched", "[storage]") {
    InMemoryStorage storage;
    addUser(storage, "alice");

    Participant participant;
    participant.conversation_id = "c1";
    participant.user_id = "alice";

    bool committed = storage.transact([&](Store& store) {
        store.insertParticipant(participant);
        return false;
    });
    CHECK_FALSE(committed);
    CHECK(storage.snapshot().participants.empty());
    CHECK(storage.snapshot().users.count("alice") == 1);
}

TEST_CASE("Integrity failures throw StorageError and roll back", "[storage]") {
    InMemoryStorage storage;
    Participant participant;
    participant.conversation_id = "c1";
    participant.user_id = "alice";
    REQUIRE(storage.transact([&](Store& store) {
        store.insertParticipant(participant);
        return true;
    }));

    SECTION("duplicate participant") {
        Participant other = participant;
        other.conversation_id = "c2";
        CHECK_THROWS_AS(storage.transact([&](Store& store) {
            store.insertParticipant(other);
            store.insertParticipant(participant);
            return true;
        }), StorageError);
        CHECK(storage.snapshot().participants.size() == 1);
    }
    SECTION("updating a group that does not exist") {
        Group group;
        group.id = "missing";
        CHECK_THROWS_AS(storage.transact([&](Store& store) {
            store.updateGroup(group);
            return true;
        }), StorageError);
        CHECK(storage.snapshot().groups.empty());
    }
}
