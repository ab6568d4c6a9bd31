#include <catch2/catch.hpp>
#include <atomic>
#include <thread>
#include "test_support.hpp"
#include "keys/key_service.hpp"
#include "messaging/conversation_directory.hpp"
#include "messaging/relationship_service.hpp"

using namespace sealgate;
using namespace sealgate::testing;

namespace {

struct KeyFixture {
    InMemoryStorage storage;
    ManualClock clock;
    KeyPolicy policy;
    KeyService keys{storage, clock, policy};
    ConversationDirectory conversations{storage, clock};

    KeyFixture() {
        addUser(storage, "alice");
        addUser(storage, "bob");
        addUser(storage, "carol");
    }

    void connect(const std::string& a, const std::string& b) {
        ConversationView view;
        bool created = false;
        ServiceError error;
        REQUIRE(conversations.findOrCreate(a, b, view, created, error));
    }

    int available(const std::string& caller, const std::string& owner, const std::string& device_id) {
        std::vector<DeviceBundleView> devices;
        ServiceError error;
        REQUIRE(keys.fetchBundles(caller, owner, -1, devices, error));
        for (const auto& device : devices) {
            if (device.device_id == device_id) {
                return device.prekeys_available;
            }
        }
        return -1;
    }
};

} // namespace

TEST_CASE("Prekey batch size is bounded by the pool size", "[keys]") {
    KeyFixture f;
    UploadBundleResult result;
    ServiceError error;

    SECTION("exactly pool_size prekeys are accepted") {
        REQUIRE(f.keys.uploadBundle("alice", bundleRequest(f.policy.prekey_pool_size), result, error));
        CHECK(result.prekeys_stored == f.policy.prekey_pool_size);
        CHECK(result.prekey_ids.size() == static_cast<size_t>(f.policy.prekey_pool_size));
        CHECK(result.bundle_version == 1);
    }
    SECTION("pool_size + 1 prekeys are rejected") {
        REQUIRE_FALSE(f.keys.uploadBundle("alice", bundleRequest(f.policy.prekey_pool_size + 1), result, error));
        CHECK(error.status == 400);
    }
    SECTION("an empty prekey list is rejected") {
        REQUIRE_FALSE(f.keys.uploadBundle("alice", bundleRequest(0), result, error));
        CHECK(error.status == 400);
    }
    SECTION("non-base64 key material is rejected") {
        UploadBundleRequest request = bundleRequest(2);
        request.identity_key_pub = "not base64!";
        REQUIRE_FALSE(f.keys.uploadBundle("alice", request, result, error));
        CHECK(error.status == 400);
    }
}

TEST_CASE("Re-upload replaces the bundle and the unclaimed pool", "[keys]") {
    KeyFixture f;
    UploadBundleResult first;
    ServiceError error;
    REQUIRE(f.keys.uploadBundle("alice", bundleRequest(5), first, error));

    UploadBundleResult second;
    REQUIRE(f.keys.uploadBundle("alice", bundleRequest(2, "identity-1", first.device_id), second, error));
    CHECK(second.device_id == first.device_id);
    CHECK(second.bundle_version == 2);
    CHECK(f.available("alice", "alice", first.device_id) == 2);

    auto state = f.storage.snapshot();
    CHECK(state.bundles.at(first.device_id).prekeys_remaining == 2);
}

TEST_CASE("Uploading to a device of another user or a revoked device is forbidden", "[keys]") {
    KeyFixture f;
    const std::string device = registerDevice(f.keys, "alice");
    UploadBundleResult result;
    ServiceError error;

    SECTION("foreign device") {
        REQUIRE_FALSE(f.keys.uploadBundle("bob", bundleRequest(2, "identity-1", device), result, error));
        CHECK(error.status == 403);
    }
    SECTION("revoked device") {
        bool already = false;
        REQUIRE(f.keys.revokeDevice("alice", device, "lost", already, error));
        REQUIRE_FALSE(f.keys.uploadBundle("alice", bundleRequest(2, "identity-1", device), result, error));
        CHECK(error.status == 403);
        CHECK(error.code == codes::DEVICE_REVOKED);
    }
}

TEST_CASE("Fetch requires a relationship and no block", "[keys]") {
    KeyFixture f;
    registerDevice(f.keys, "alice");
    std::vector<DeviceBundleView> devices;
    ServiceError error;

    REQUIRE_FALSE(f.keys.fetchBundles("bob", "alice", -1, devices, error));
    CHECK(error.status == 403);
    CHECK(error.code == codes::RELATIONSHIP_REQUIRED);

    f.connect("bob", "alice");
    REQUIRE(f.keys.fetchBundles("bob", "alice", -1, devices, error));
    CHECK(devices.size() == 1);

    RelationshipService relationships(f.storage, f.clock);
    bool already = false;
    REQUIRE(relationships.block("alice", "bob", already, error));
    REQUIRE_FALSE(f.keys.fetchBundles("bob", "alice", -1, devices, error));
    CHECK(error.code == codes::BLOCKED);
}

TEST_CASE("Fetch with an outdated bundle version reports the current one", "[keys]") {
    KeyFixture f;
    const std::string device = registerDevice(f.keys, "alice");
    UploadBundleResult result;
    ServiceError error;
    REQUIRE(f.keys.uploadBundle("alice", bundleRequest(2, "identity-1", device), result, error));
    REQUIRE(result.bundle_version == 2);

    std::vector<DeviceBundleView> devices;
    REQUIRE_FALSE(f.keys.fetchBundles("alice", "alice", 1, devices, error));
    CHECK(error.status == 409);
    CHECK(error.code == codes::BUNDLE_STALE);
    CHECK(error.headers.at("X-Bundle-Version") == "2");
    CHECK(devices.empty());

    REQUIRE(f.keys.fetchBundles("alice", "alice", 2, devices, error));
    CHECK(devices.size() == 1);
}

TEST_CASE("Revoked devices never appear in fetched bundles", "[keys]") {
    KeyFixture f;
    const std::string kept = registerDevice(f.keys, "alice");
    const std::string revoked = registerDevice(f.keys, "alice");
    f.connect("alice", "bob");

    bool already = false;
    ServiceError error;
    REQUIRE(f.keys.revokeDevice("alice", revoked, "lost", already, error));
    CHECK_FALSE(already);

    std::vector<DeviceBundleView> devices;
    REQUIRE(f.keys.fetchBundles("bob", "alice", -1, devices, error));
    REQUIRE(devices.size() == 1);
    CHECK(devices[0].device_id == kept);

    std::vector<Device> owned;
    REQUIRE(f.keys.listDevices("alice", owned, error));
    CHECK(owned.size() == 2);
}

TEST_CASE("Revoking twice is a successful no-op", "[keys]") {
    KeyFixture f;
    const std::string device = registerDevice(f.keys, "alice");
    bool already = false;
    ServiceError error;

    REQUIRE(f.keys.revokeDevice("alice", device, "lost", already, error));
    CHECK_FALSE(already);
    REQUIRE(f.keys.revokeDevice("alice", device, "lost", already, error));
    CHECK(already);
    CHECK(f.storage.snapshot().revocations.size() == 1);

    REQUIRE_FALSE(f.keys.revokeDevice("bob", device, "lost", already, error));
    CHECK(error.status == 404);
}

TEST_CASE("Claimed prekeys leave the available count", "[keys]") {
    KeyFixture f;
    UploadBundleResult upload;
    ServiceError error;
    REQUIRE(f.keys.uploadBundle("alice", bundleRequest(4), upload, error));
    f.connect("alice", "bob");

    for (int i = 0; i < 3; ++i) {
        ClaimedPrekey claimed;
        REQUIRE(f.keys.claimPrekey("bob", upload.device_id, upload.prekey_ids[static_cast<size_t>(i)], claimed,
                                   error));
        CHECK(claimed.prekey_pub == base64("prekey-" + std::to_string(i)));
    }
    CHECK(f.available("bob", "alice", upload.device_id) == 1);
    CHECK(f.storage.snapshot().bundles.at(upload.device_id).prekeys_remaining == 1);

    ClaimedPrekey again;
    REQUIRE_FALSE(f.keys.claimPrekey("bob", upload.device_id, upload.prekey_ids[0], again, error));
    CHECK(error.status == 404);

    REQUIRE(f.keys.claimPrekey("bob", upload.device_id, upload.prekey_ids[3], again, error));
    REQUIRE_FALSE(f.keys.claimPrekey("bob", upload.device_id, upload.prekey_ids[3], again, error));
    CHECK(error.status == 409);
    CHECK(error.code == codes::PREKEYS_EXHAUSTED);
    CHECK(error.headers.at("X-Bundle-Version") == "1");
}

TEST_CASE("Concurrent claims of one prekey have a single winner", "[keys][concurrency]") {
    KeyFixture f;
    UploadBundleResult upload;
    ServiceError error;
    REQUIRE(f.keys.uploadBundle("alice", bundleRequest(3), upload, error));
    f.connect("alice", "bob");
    f.connect("alice", "carol");

    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        const std::string claimant = i % 2 == 0 ? "bob" : "carol";
        threads.emplace_back([&f, &upload, &winners, claimant]() {
            ClaimedPrekey claimed;
            ServiceError claim_error;
            if (f.keys.claimPrekey(claimant, upload.device_id, upload.prekey_ids[0], claimed, claim_error)) {
                ++winners;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    CHECK(winners.load() == 1);
    CHECK(f.storage.snapshot().bundles.at(upload.device_id).prekeys_remaining == 2);
}

TEST_CASE("Claims against a revoked device or without a relationship fail distinctly", "[keys]") {
    KeyFixture f;
    UploadBundleResult upload;
    ServiceError error;
    REQUIRE(f.keys.uploadBundle("alice", bundleRequest(2), upload, error));

    ClaimedPrekey claimed;
    REQUIRE_FALSE(f.keys.claimPrekey("bob", upload.device_id, upload.prekey_ids[0], claimed, error));
    CHECK(error.code == codes::RELATIONSHIP_REQUIRED);

    bool already = false;
    REQUIRE(f.keys.revokeDevice("alice", upload.device_id, "lost", already, error));
    REQUIRE_FALSE(f.keys.claimPrekey("alice", upload.device_id, upload.prekey_ids[0], claimed, error));
    CHECK(error.status == 409);
    CHECK(error.code == codes::DEVICE_REVOKED);
}

TEST_CASE("Repeated identity key changes revoke the device", "[keys][identity]") {
    KeyFixture f;
    UploadBundleResult result;
    ServiceError error;
    REQUIRE(f.keys.uploadBundle("alice", bundleRequest(2, "identity-0"), result, error));
    const std::string device = result.device_id;

    // Below the block threshold every change is accepted.
    for (int i = 1; i < f.policy.identity_change_block_threshold; ++i) {
        f.clock.advanceSeconds(60);
        REQUIRE(f.keys.uploadBundle("alice", bundleRequest(2, "identity-" + std::to_string(i), device), result,
                                    error));
    }
    CHECK(result.bundle_version == f.policy.identity_change_block_threshold);

    f.clock.advanceSeconds(60);
    REQUIRE_FALSE(f.keys.uploadBundle("alice", bundleRequest(2, "identity-final", device), result, error));
    CHECK(error.status == 403);
    CHECK(error.code == codes::IDENTITY_CHANGE_BLOCKED);

    auto state = f.storage.snapshot();
    CHECK(state.devices.at(device).isRevoked());
    CHECK(state.bundles.at(device).identity_key_pub ==
          base64("identity-" + std::to_string(f.policy.identity_change_block_threshold - 1)));
    int blocks = 0;
    for (const auto& event : state.identity_events) {
        if (event.reason == "identity_change_block") {
            ++blocks;
        }
    }
    CHECK(blocks == 1);
    CHECK(state.revocations.size() == 1);
}

TEST_CASE("Identity changes outside the window do not accumulate", "[keys][identity]") {
    KeyFixture f;
    UploadBundleResult result;
    ServiceError error;
    REQUIRE(f.keys.uploadBundle("alice", bundleRequest(1, "identity-0"), result, error));
    const std::string device = result.device_id;

    for (int i = 1; i <= 2 * f.policy.identity_change_block_threshold; ++i) {
        f.clock.advanceSeconds(static_cast<int64_t>(f.policy.identity_change_window_hours) * 3600);
        REQUIRE(f.keys.uploadBundle("alice", bundleRequest(1, "identity-" + std::to_string(i), device), result,
                                    error));
    }
    CHECK_FALSE(f.storage.snapshot().devices.at(device).isRevoked());
}

TEST_CASE("Fingerprints are the first 16 hex characters of SHA-256", "[keys]") {
    const std::string fp = KeyService::fingerprint("abc");
    CHECK(fp == "ba7816bf8f01cfea");
}
