#include "../../include/metrics/metrics_aggregator.hpp"
#include "../../include/storage/transaction.hpp"
#include "../../include/utils/logger.hpp"

namespace sealgate {

namespace {

const int64_t kHourMillis = 3600LL * 1000;
const int64_t kDayMillis = 24 * kHourMillis;

} // namespace

MetricsAggregator::MetricsAggregator(Storage& storage, const Clock& clock, const KeyPolicy& policy,
                                     int cache_seconds, const ConnectionCounter* connections)
    : storage_(storage), clock_(clock), policy_(policy), cache_seconds_(cache_seconds), connections_(connections) {}

bool MetricsAggregator::collect(MetricsSnapshot& out, ServiceError& error) {
    const int64_t now = clock_.nowMillis();
    MetricsSnapshot fresh;
    fresh.generated_at = now;
    fresh.signed_prekey_max_age_days = policy_.signed_prekey_max_age_days;

    bool ok = runTransaction(storage_, "metrics", error, [&](Store& store) {
        fresh.prekeys = store.prekeyPoolStats(policy_.otpk_low_watermark, policy_.otpk_critical_watermark,
                                              kSampleDeviceIds);
        fresh.stale_signed_prekeys = store.countBundlesUpdatedBefore(
            now - static_cast<int64_t>(policy_.signed_prekey_max_age_days) * kDayMillis);
        const int64_t day_start = startOfDay(now);
        fresh.direct_messages.today = store.countMessagesSince(MessageKind::Direct, day_start);
        fresh.direct_messages.last_hour = store.countMessagesSince(MessageKind::Direct, now - kHourMillis);
        fresh.group_messages.today = store.countMessagesSince(MessageKind::Group, day_start);
        fresh.group_messages.last_hour = store.countMessagesSince(MessageKind::Group, now - kHourMillis);
        fresh.delivery = store.deliveryStats(now - kHourMillis);
        fresh.devices = store.deviceCounts();
        fresh.groups = store.groupCounts(now - kDayMillis);
        return true;
    });
    if (!ok) {
        return false;
    }
    if (connections_) {
        fresh.connections = connections_->connectionStats();
    }
    out = fresh;
    return true;
}

bool MetricsAggregator::snapshot(bool caller_is_operator, MetricsSnapshot& out, ServiceError& error) {
    if (!caller_is_operator) {
        error.set(403, codes::FORBIDDEN, "Operator access required");
        return false;
    }

    std::lock_guard<std::mutex> lock(cache_mutex_);
    const int64_t now = clock_.nowMillis();
    if (has_cached_ && cache_seconds_ > 0 &&
        now - cached_.generated_at < static_cast<int64_t>(cache_seconds_) * 1000) {
        out = cached_;
        return true;
    }

    MetricsSnapshot fresh;
    if (collect(fresh, error)) {
        cached_ = fresh;
        has_cached_ = true;
        out = fresh;
        return true;
    }

    if (has_cached_) {
        Logger::getInstance().warning("Metrics refresh failed, serving snapshot from " +
                                      formatTimestamp(cached_.generated_at));
        out = cached_;
        out.stale = true;
        return true;
    }
    error.set(503, "", "metrics unavailable");
    return false;
}

} // namespace sealgate
