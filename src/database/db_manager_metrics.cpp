#include "../../include/database/db_manager.hpp"
#include "../../include/utils/logger.hpp"

namespace sealgate {

bool PgStore::prepareMetricsStatements(DatabaseConnection& conn) {
    return conn.prepareStatement("metrics_prekey_pools",
               "SELECT device_id, COUNT(*) FILTER (WHERE claimed = FALSE), COUNT(*) FILTER (WHERE claimed = TRUE) "
               "FROM e2ee_one_time_prekeys GROUP BY device_id ORDER BY device_id") &&
           conn.prepareStatement("metrics_stale_bundles",
               "SELECT COUNT(*) FROM e2ee_key_bundles WHERE updated_at < " + sql::timestamp("$1")) &&
           conn.prepareStatement("metrics_messages_since",
               "SELECT COUNT(*) FROM relay_messages WHERE kind = $1 AND created_at >= " + sql::timestamp("$2")) &&
           conn.prepareStatement("metrics_deliveries",
               "SELECT COUNT(*) FILTER (WHERE r.delivered_at IS NULL), "
               "COUNT(*) FILTER (WHERE r.delivered_at IS NOT NULL AND r.read_at IS NULL), "
               "COALESCE(AVG(EXTRACT(EPOCH FROM (r.delivered_at - m.created_at)) * 1000) "
               "  FILTER (WHERE r.delivered_at >= " + sql::timestamp("$1") + "), 0) "
               "FROM relay_receipts r JOIN relay_messages m ON m.id = r.message_id") &&
           conn.prepareStatement("metrics_devices",
               "SELECT COUNT(*), COUNT(*) FILTER (WHERE status = 'active'), "
               "COUNT(*) FILTER (WHERE status = 'revoked') FROM e2ee_devices") &&
           conn.prepareStatement("metrics_groups",
               "SELECT COUNT(*), COUNT(*) FILTER (WHERE is_closed = FALSE), COUNT(*) FILTER (WHERE is_closed = TRUE), "
               "(SELECT COUNT(*) FROM group_epoch_changes WHERE changed_at >= " + sql::timestamp("$1") + ") "
               "FROM e2ee_groups");
}

PrekeyPoolStats PgStore::prekeyPoolStats(int low_watermark, int critical_watermark, size_t sample_limit) {
    PgResult res = exec("metrics_prekey_pools", PgParams());
    PrekeyPoolStats stats;
    for (int i = 0; i < res.rows(); i++) {
        int64_t available = res.int64(i, 1);
        stats.total_available += available;
        stats.total_claimed += res.int64(i, 2);
        if (available < critical_watermark) {
            ++stats.critical_devices;
            if (stats.critical_device_ids.size() < sample_limit) {
                stats.critical_device_ids.push_back(res.text(i, 0));
            }
        } else if (available < low_watermark) {
            ++stats.low_devices;
            if (stats.low_device_ids.size() < sample_limit) {
                stats.low_device_ids.push_back(res.text(i, 0));
            }
        }
    }
    return stats;
}

int64_t PgStore::countBundlesUpdatedBefore(int64_t cutoff) {
    return exec("metrics_stale_bundles", PgParams().add(cutoff)).int64(0, 0);
}

int64_t PgStore::countMessagesSince(MessageKind kind, int64_t since) {
    return exec("metrics_messages_since", PgParams().add(std::string(kindName(kind))).add(since)).int64(0, 0);
}

DeliveryStats PgStore::deliveryStats(int64_t latency_since) {
    PgResult res = exec("metrics_deliveries", PgParams().add(latency_since));
    DeliveryStats stats;
    stats.undelivered = res.int64(0, 0);
    stats.delivered_unread = res.int64(0, 1);
    stats.avg_delivery_ms = res.number(0, 2);
    return stats;
}

DeviceCounts PgStore::deviceCounts() {
    PgResult res = exec("metrics_devices", PgParams());
    DeviceCounts counts;
    counts.total = res.int64(0, 0);
    counts.active = res.int64(0, 1);
    counts.revoked = res.int64(0, 2);
    return counts;
}

GroupCounts PgStore::groupCounts(int64_t epoch_changes_since) {
    PgResult res = exec("metrics_groups", PgParams().add(epoch_changes_since));
    GroupCounts counts;
    counts.total = res.int64(0, 0);
    counts.active = res.int64(0, 1);
    counts.closed = res.int64(0, 2);
    counts.epoch_changes = res.int64(0, 3);
    return counts;
}

} // namespace sealgate
