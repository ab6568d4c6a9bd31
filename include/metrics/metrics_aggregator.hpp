#ifndef METRICS_AGGREGATOR_HPP
#define METRICS_AGGREGATOR_HPP

#include <string>
#include <map>
#include <mutex>
#include <cstdint>
#include "../config/config.hpp"
#include "../storage/storage.hpp"
#include "../utils/clock.hpp"
#include "../utils/service_error.hpp"

namespace sealgate {

struct ConnectionStats {
    int64_t total = 0;
    std::map<std::string, int64_t> per_user;
};

// Live connection counts, supplied by whatever holds the sockets.
class ConnectionCounter {
public:
    virtual ~ConnectionCounter() = default;
    virtual ConnectionStats connectionStats() const = 0;
};

struct MessageVolume {
    int64_t today = 0;
    int64_t last_hour = 0;
};

struct MetricsSnapshot {
    int64_t generated_at = 0;
    bool stale = false;
    ConnectionStats connections;
    PrekeyPoolStats prekeys;
    int64_t stale_signed_prekeys = 0;
    int signed_prekey_max_age_days = 0;
    MessageVolume direct_messages;
    MessageVolume group_messages;
    DeliveryStats delivery;
    DeviceCounts devices;
    GroupCounts groups;
};

/**
 * Read-only operator view over the stores. A snapshot is reused for
 * cache_seconds; when a refresh fails the previous snapshot is served with
 * stale=true, and without one the call fails 503.
 */
class MetricsAggregator {
public:
    MetricsAggregator(Storage& storage, const Clock& clock, const KeyPolicy& policy, int cache_seconds,
                      const ConnectionCounter* connections = nullptr);

    bool snapshot(bool caller_is_operator, MetricsSnapshot& out, ServiceError& error);

    static constexpr size_t kSampleDeviceIds = 10;

private:
    bool collect(MetricsSnapshot& out, ServiceError& error);

    Storage& storage_;
    const Clock& clock_;
    KeyPolicy policy_;
    int cache_seconds_;
    const ConnectionCounter* connections_;

    std::mutex cache_mutex_;
    bool has_cached_ = false;
    MetricsSnapshot cached_;
};

} // namespace sealgate

#endif // METRICS_AGGREGATOR_HPP
