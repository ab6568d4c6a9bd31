#include <catch2/catch.hpp>
#include "test_support.hpp"
#include "messaging/relationship_service.hpp"

using namespace sealgate;
using namespace sealgate::testing;

TEST_CASE("Blocking is idempotent and listed newest first", "[relationships]") {
    InMemoryStorage storage;
    ManualClock clock;
    RelationshipService relationships(storage, clock);
    for (const char* user : {"alice", "bob", "carol"}) {
        addUser(storage, user);
    }

    bool already = true;
    ServiceError error;
    REQUIRE(relationships.block("alice", "bob", already, error));
    CHECK_FALSE(already);
    REQUIRE(relationships.block("alice", "bob", already, error));
    CHECK(already);

    clock.advanceSeconds(5);
    REQUIRE(relationships.block("alice", "carol", already, error));

    std::vector<BlockEntry> blocks;
    REQUIRE(relationships.listBlocks("alice", blocks, error));
    REQUIRE(blocks.size() == 2);
    CHECK(blocks[0].blocked_id == "carol");
    CHECK(blocks[1].blocked_id == "bob");

    REQUIRE(relationships.listBlocks("bob", blocks, error));
    CHECK(blocks.empty());

    storage.transact([&](Store& store) {
        CHECK(RelationshipService::blockedEitherWay(store, "bob", "alice"));
        CHECK_FALSE(RelationshipService::blockedEitherWay(store, "bob", "carol"));
        return true;
    });
}

TEST_CASE("Block and unblock reject bad targets", "[relationships]") {
    InMemoryStorage storage;
    ManualClock clock;
    RelationshipService relationships(storage, clock);
    addUser(storage, "alice");
    bool already = false;
    ServiceError error;

    REQUIRE_FALSE(relationships.block("alice", "alice", already, error));
    CHECK(error.status == 400);
    REQUIRE_FALSE(relationships.block("alice", "", already, error));
    CHECK(error.status == 400);
    REQUIRE_FALSE(relationships.block("alice", "ghost", already, error));
    CHECK(error.status == 404);
    REQUIRE_FALSE(relationships.unblock("alice", "ghost", error));
    CHECK(error.status == 404);
}

TEST_CASE("Unblock removes the entry", "[relationships]") {
    InMemoryStorage storage;
    ManualClock clock;
    RelationshipService relationships(storage, clock);
    addUser(storage, "alice");
    addUser(storage, "bob");
    bool already = false;
    ServiceError error;
    REQUIRE(relationships.block("alice", "bob", already, error));
    REQUIRE(relationships.unblock("alice", "bob", error));
    CHECK(storage.snapshot().blocks.empty());
    REQUIRE_FALSE(relationships.unblock("alice", "bob", error));
}

TEST_CASE("Registering a user keeps an existing username", "[relationships]") {
    InMemoryStorage storage;
    ManualClock clock;
    RelationshipService relationships(storage, clock);
    ServiceError error;
    REQUIRE(relationships.registerUser("alice", "Alice", error));
    REQUIRE(relationships.registerUser("alice", "", error));
    CHECK(storage.snapshot().users.at("alice").username == "Alice");
}
