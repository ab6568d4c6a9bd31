#include "../../include/database/db_manager.hpp"
#include "../../include/utils/logger.hpp"
#include <algorithm>

namespace sealgate {

namespace {

const std::string kDeviceColumns =
    "device_id, user_id, display_name, status, " + sql::millis("created_at") + ", " + sql::millis("last_seen_at");

const std::string kBundleColumns =
    "device_id, identity_key_pub, signed_prekey_pub, signed_prekey_sig, bundle_version, prekeys_remaining, " +
    sql::millis("updated_at");

Device readDevice(const PgResult& res, int row) {
    Device device;
    device.id = res.text(row, 0);
    device.owner_user_id = res.text(row, 1);
    device.display_name = res.text(row, 2);
    device.status = res.text(row, 3);
    device.created_at = res.int64(row, 4);
    device.last_seen_at = res.int64(row, 5);
    return device;
}

} // namespace

bool PgStore::prepareKeyStatements(DatabaseConnection& conn) {
    return conn.prepareStatement("find_device",
               "SELECT " + kDeviceColumns + " FROM e2ee_devices WHERE device_id = $1") &&
           conn.prepareStatement("find_device_for_update",
               "SELECT " + kDeviceColumns + " FROM e2ee_devices WHERE device_id = $1 FOR UPDATE") &&
           conn.prepareStatement("insert_device",
               "INSERT INTO e2ee_devices (device_id, user_id, display_name, status, created_at, last_seen_at) "
               "VALUES ($1, $2, $3, $4, " + sql::timestamp("$5") + ", " + sql::timestamp("$6") + ")") &&
           conn.prepareStatement("touch_device",
               "UPDATE e2ee_devices SET display_name = COALESCE(NULLIF($2, ''), display_name), "
               "last_seen_at = " + sql::timestamp("$3") + " WHERE device_id = $1") &&
           conn.prepareStatement("revoke_device",
               "UPDATE e2ee_devices SET status = 'revoked' WHERE device_id = $1") &&
           conn.prepareStatement("insert_revocation",
               "INSERT INTO e2ee_device_revocations (user_id, device_id, reason, revoked_at) "
               "VALUES ($1, $2, $3, " + sql::timestamp("$4") + ")") &&
           conn.prepareStatement("list_devices",
               "SELECT " + kDeviceColumns + " FROM e2ee_devices WHERE user_id = $1 ORDER BY created_at, device_id") &&
           conn.prepareStatement("active_device_ids",
               "SELECT device_id FROM e2ee_devices WHERE user_id = $1 AND status = 'active' "
               "ORDER BY created_at, device_id") &&
           conn.prepareStatement("find_bundle",
               "SELECT " + kBundleColumns + " FROM e2ee_key_bundles WHERE device_id = $1") &&
           conn.prepareStatement("save_bundle",
               "INSERT INTO e2ee_key_bundles (device_id, identity_key_pub, signed_prekey_pub, signed_prekey_sig, "
               "bundle_version, prekeys_remaining, updated_at) VALUES ($1, $2, $3, $4, $5, $6, " +
               sql::timestamp("$7") + ") ON CONFLICT (device_id) DO UPDATE SET "
               "identity_key_pub = EXCLUDED.identity_key_pub, signed_prekey_pub = EXCLUDED.signed_prekey_pub, "
               "signed_prekey_sig = EXCLUDED.signed_prekey_sig, bundle_version = EXCLUDED.bundle_version, "
               "prekeys_remaining = EXCLUDED.prekeys_remaining, updated_at = EXCLUDED.updated_at") &&
           conn.prepareStatement("set_prekeys_remaining",
               "UPDATE e2ee_key_bundles SET prekeys_remaining = $2 WHERE device_id = $1") &&
           conn.prepareStatement("delete_unclaimed_prekeys",
               "DELETE FROM e2ee_one_time_prekeys WHERE device_id = $1 AND claimed = FALSE") &&
           conn.prepareStatement("insert_prekeys",
               "INSERT INTO e2ee_one_time_prekeys (device_id, prekey_pub) "
               "SELECT $1, k.pub FROM unnest($2::text[]) WITH ORDINALITY AS k(pub, ord) ORDER BY k.ord "
               "RETURNING id") &&
           conn.prepareStatement("count_unclaimed_prekeys",
               "SELECT COUNT(*) FROM e2ee_one_time_prekeys WHERE device_id = $1 AND claimed = FALSE") &&
           conn.prepareStatement("claim_prekey",
               "UPDATE e2ee_one_time_prekeys SET claimed = TRUE, claimed_at = " + sql::timestamp("$3") + " "
               "WHERE id = $1 AND device_id = $2 AND claimed = FALSE RETURNING id, device_id, prekey_pub") &&
           conn.prepareStatement("insert_identity_event",
               "INSERT INTO e2ee_identity_events (user_id, device_id, reason, created_at) "
               "VALUES ($1, $2, $3, " + sql::timestamp("$4") + ")") &&
           conn.prepareStatement("count_identity_events",
               "SELECT COUNT(*) FROM e2ee_identity_events WHERE device_id = $1 AND reason = $2 "
               "AND created_at >= " + sql::timestamp("$3"));
}

// ========== DEVICES ==========

bool PgStore::findDevice(const std::string& device_id, Device& out, bool for_update) {
    PgResult res = exec(for_update ? "find_device_for_update" : "find_device", PgParams().add(device_id));
    if (res.rows() == 0) {
        return false;
    }
    out = readDevice(res, 0);
    return true;
}

void PgStore::insertDevice(const Device& device) {
    exec("insert_device", PgParams()
        .add(device.id)
        .add(device.owner_user_id)
        .add(device.display_name)
        .add(device.status)
        .add(device.created_at)
        .addMillis(device.last_seen_at));
}

void PgStore::touchDevice(const std::string& device_id, const std::string& display_name, int64_t seen_at) {
    exec("touch_device", PgParams().add(device_id).add(display_name).add(seen_at));
}

void PgStore::markDeviceRevoked(const std::string& device_id) {
    exec("revoke_device", PgParams().add(device_id));
}

void PgStore::insertRevocation(const DeviceRevocation& revocation) {
    exec("insert_revocation", PgParams()
        .add(revocation.user_id)
        .add(revocation.device_id)
        .add(revocation.reason)
        .add(revocation.revoked_at));
}

std::vector<Device> PgStore::listDevices(const std::string& user_id) {
    PgResult res = exec("list_devices", PgParams().add(user_id));
    std::vector<Device> devices;
    for (int i = 0; i < res.rows(); i++) {
        devices.push_back(readDevice(res, i));
    }
    return devices;
}

std::vector<std::string> PgStore::activeDeviceIds(const std::string& user_id) {
    PgResult res = exec("active_device_ids", PgParams().add(user_id));
    std::vector<std::string> ids;
    for (int i = 0; i < res.rows(); i++) {
        ids.push_back(res.text(i, 0));
    }
    return ids;
}

// ========== KEY BUNDLES & PREKEYS ==========

bool PgStore::findBundle(const std::string& device_id, KeyBundle& out) {
    PgResult res = exec("find_bundle", PgParams().add(device_id));
    if (res.rows() == 0) {
        return false;
    }
    out.device_id = res.text(0, 0);
    out.identity_key_pub = res.text(0, 1);
    out.signed_prekey_pub = res.text(0, 2);
    out.signed_prekey_sig = res.text(0, 3);
    out.bundle_version = res.int64(0, 4);
    out.prekeys_remaining = static_cast<int>(res.int64(0, 5));
    out.updated_at = res.int64(0, 6);
    return true;
}

void PgStore::saveBundle(const KeyBundle& bundle) {
    exec("save_bundle", PgParams()
        .add(bundle.device_id)
        .add(bundle.identity_key_pub)
        .add(bundle.signed_prekey_pub)
        .add(bundle.signed_prekey_sig)
        .add(bundle.bundle_version)
        .add(static_cast<int64_t>(bundle.prekeys_remaining))
        .add(bundle.updated_at));
}

void PgStore::setPrekeysRemaining(const std::string& device_id, int remaining) {
    exec("set_prekeys_remaining", PgParams().add(device_id).add(static_cast<int64_t>(remaining)));
}

int PgStore::deleteUnclaimedPrekeys(const std::string& device_id) {
    return exec("delete_unclaimed_prekeys", PgParams().add(device_id)).affected();
}

std::vector<int64_t> PgStore::insertPrekeys(const std::string& device_id,
                                            const std::vector<std::string>& prekey_pubs) {
    PgResult res = exec("insert_prekeys", PgParams().add(device_id).addArray(prekey_pubs));
    std::vector<int64_t> ids;
    for (int i = 0; i < res.rows(); i++) {
        ids.push_back(res.int64(i, 0));
    }
    // BIGSERIAL ids follow insertion order, which follows input order
    std::sort(ids.begin(), ids.end());
    return ids;
}

int PgStore::countUnclaimedPrekeys(const std::string& device_id) {
    PgResult res = exec("count_unclaimed_prekeys", PgParams().add(device_id));
    return static_cast<int>(res.int64(0, 0));
}

bool PgStore::claimPrekey(const std::string& device_id, int64_t prekey_id, int64_t claimed_at,
                          OneTimePrekey& out) {
    PgResult res = exec("claim_prekey", PgParams().add(prekey_id).add(device_id).add(claimed_at));
    if (res.rows() == 0) {
        return false;
    }
    out.id = res.int64(0, 0);
    out.device_id = res.text(0, 1);
    out.prekey_pub = res.text(0, 2);
    out.claimed = true;
    out.claimed_at = claimed_at;
    return true;
}

void PgStore::insertIdentityChangeEvent(const IdentityChangeEvent& event) {
    exec("insert_identity_event", PgParams()
        .add(event.user_id)
        .add(event.device_id)
        .add(event.reason)
        .add(event.created_at));
}

int PgStore::countIdentityChangeEvents(const std::string& device_id, const std::string& reason, int64_t since) {
    PgResult res = exec("count_identity_events", PgParams().add(device_id).add(reason).add(since));
    return static_cast<int>(res.int64(0, 0));
}

} // namespace sealgate
