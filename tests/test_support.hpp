#ifndef SEALGATE_TEST_SUPPORT_HPP
#define SEALGATE_TEST_SUPPORT_HPP

#include <string>
#include <vector>
#include <utility>
#include <stdexcept>
#include <openssl/evp.h>
#include "config/config.hpp"
#include "keys/key_service.hpp"
#include "messaging/event_publisher.hpp"
#include "storage/in_memory_storage.hpp"
#include "utils/clock.hpp"
#include "utils/service_error.hpp"

namespace sealgate {
namespace testing {

// 2023-11-14T22:13:20Z
constexpr int64_t kStartMillis = 1700000000000LL;

class ManualClock : public Clock {
public:
    explicit ManualClock(int64_t start = kStartMillis) : now_(start) {}

    int64_t nowMillis() const override { return now_; }
    void advanceMillis(int64_t delta) { now_ += delta; }
    void advanceSeconds(int64_t seconds) { now_ += seconds * 1000; }

private:
    int64_t now_;
};

class RecordingPublisher : public EventPublisher {
public:
    void publish(const std::string& channel, const std::string& event_json) override {
        events.emplace_back(channel, event_json);
    }

    // Events delivered to one user whose JSON contains `needle`.
    int countFor(const std::string& user_id, const std::string& needle) const {
        int count = 0;
        for (const auto& event : events) {
            if (event.first == userChannel(user_id) && event.second.find(needle) != std::string::npos) {
                ++count;
            }
        }
        return count;
    }

    std::vector<std::pair<std::string, std::string>> events;
};

class ThrowingPublisher : public EventPublisher {
public:
    void publish(const std::string&, const std::string&) override {
        ++attempts;
        throw std::runtime_error("broker unreachable");
    }

    int attempts = 0;
};

// Wraps a storage and fails every transaction while `failing` is set.
class FlakyStorage : public Storage {
public:
    explicit FlakyStorage(Storage& inner) : inner_(inner) {}

    bool initialize() override { return inner_.initialize(); }
    bool transact(const std::function<bool(Store&)>& work) override {
        if (failing) {
            throw StorageError("connection refused");
        }
        return inner_.transact(work);
    }

    bool failing = false;

private:
    Storage& inner_;
};

inline std::string base64(const std::string& raw) {
    std::string out(4 * ((raw.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  reinterpret_cast<const unsigned char*>(raw.data()),
                                  static_cast<int>(raw.size()));
    out.resize(static_cast<size_t>(written));
    return out;
}

inline void addUser(Storage& storage, const std::string& user_id) {
    User user;
    user.id = user_id;
    user.username = user_id + "_name";
    user.created_at = kStartMillis;
    storage.transact([&](Store& store) {
        store.upsertUser(user);
        return true;
    });
}

inline UploadBundleRequest bundleRequest(int prekeys, const std::string& identity = "identity-1",
                                         const std::string& device_id = "") {
    UploadBundleRequest request;
    request.device_id = device_id;
    request.device_name = "phone";
    request.identity_key_pub = base64(identity);
    request.signed_prekey_pub = base64("signed-prekey");
    request.signed_prekey_sig = base64("signature");
    for (int i = 0; i < prekeys; ++i) {
        request.prekeys.push_back(base64("prekey-" + std::to_string(i)));
    }
    return request;
}

// Registers a fresh device with a bundle and returns its id.
inline std::string registerDevice(KeyService& keys, const std::string& user_id, int prekeys = 3) {
    UploadBundleResult result;
    ServiceError error;
    if (!keys.uploadBundle(user_id, bundleRequest(prekeys), result, error)) {
        throw std::runtime_error("device registration failed: " + error.message);
    }
    return result.device_id;
}

inline Config testConfig() {
    Config config;
    config.metrics_cache_seconds = 30;
    return config;
}

} // namespace testing
} // namespace sealgate

#endif // SEALGATE_TEST_SUPPORT_HPP
