#include "../../include/keys/key_service.hpp"
#include "../../include/messaging/relationship_service.hpp"
#include "../../include/storage/transaction.hpp"
#include "../../include/utils/crypto_utils.hpp"
#include "../../include/utils/logger.hpp"
#include <algorithm>

namespace sealgate {

namespace {

const char* const kIdentityChange = "identity_change";
const char* const kIdentityChangeBlock = "identity_change_block";

bool isEncodedKey(const std::string& value) {
    std::string decoded;
    return !value.empty() && crypto::base64Decode(value, decoded) && !decoded.empty();
}

} // namespace

KeyService::KeyService(Storage& storage, const Clock& clock, const KeyPolicy& policy)
    : storage_(storage), clock_(clock), policy_(policy) {}

std::string KeyService::fingerprint(const std::string& key) {
    return crypto::sha256Hex(key).substr(0, 16);
}

bool KeyService::validateUpload(const UploadBundleRequest& request, ServiceError& error) const {
    if (!request.device_id.empty() && !crypto::isUuid(request.device_id)) {
        error.set(400, "", "Invalid device id");
        return false;
    }
    if (!isEncodedKey(request.identity_key_pub) || !isEncodedKey(request.signed_prekey_pub) ||
        !isEncodedKey(request.signed_prekey_sig)) {
        error.set(400, "", "identity_key_pub, signed_prekey_pub and signed_prekey_sig must be base64");
        return false;
    }
    if (request.prekeys.empty()) {
        error.set(400, "", "At least one one-time prekey is required");
        return false;
    }
    if (request.prekeys.size() > static_cast<size_t>(policy_.prekey_pool_size)) {
        error.set(400, "", "Too many one-time prekeys (max " + std::to_string(policy_.prekey_pool_size) + ")");
        return false;
    }
    for (const auto& prekey : request.prekeys) {
        if (!isEncodedKey(prekey)) {
            error.set(400, "", "One-time prekeys must be base64");
            return false;
        }
    }
    return true;
}

bool KeyService::uploadBundle(const std::string& caller, const UploadBundleRequest& request,
                              UploadBundleResult& result, ServiceError& error) {
    if (!validateUpload(request, error)) {
        return false;
    }

    const std::string device_id = request.device_id.empty() ? crypto::generateUuid() : request.device_id;
    const int64_t now = clock_.nowMillis();
    bool identity_blocked = false;
    int identity_changes = 0;

    bool ok = runTransaction(storage_, "uploadBundle", error, [&](Store& store) {
        Device device;
        if (store.findDevice(device_id, device, true)) {
            if (device.owner_user_id != caller) {
                error.set(403, codes::FORBIDDEN, "Device belongs to another user");
                return false;
            }
            if (device.isRevoked()) {
                Logger::getInstance().audit("revoked_device_use",
                                            "user=" + caller + " device=" + device_id + " op=upload");
                error.set(403, codes::DEVICE_REVOKED, "Device has been revoked");
                return false;
            }
            store.touchDevice(device_id, request.device_name, now);
        } else {
            device.id = device_id;
            device.owner_user_id = caller;
            device.display_name = request.device_name;
            device.status = "active";
            device.created_at = now;
            device.last_seen_at = now;
            store.insertDevice(device);
        }

        KeyBundle bundle;
        bool existing = store.findBundle(device_id, bundle);
        if (existing && bundle.identity_key_pub != request.identity_key_pub) {
            Logger::getInstance().audit("identity_change",
                                        "user=" + caller + " device=" + device_id +
                                        " old_fingerprint=" + fingerprint(bundle.identity_key_pub) +
                                        " new_fingerprint=" + fingerprint(request.identity_key_pub));
            IdentityChangeEvent event;
            event.user_id = caller;
            event.device_id = device_id;
            event.reason = kIdentityChange;
            event.created_at = now;
            store.insertIdentityChangeEvent(event);

            const int64_t window_start = now - static_cast<int64_t>(policy_.identity_change_window_hours) * 3600 * 1000;
            identity_changes = store.countIdentityChangeEvents(device_id, kIdentityChange, window_start);

            if (identity_changes >= policy_.identity_change_block_threshold) {
                store.markDeviceRevoked(device_id);
                event.reason = kIdentityChangeBlock;
                store.insertIdentityChangeEvent(event);
                DeviceRevocation revocation;
                revocation.user_id = caller;
                revocation.device_id = device_id;
                revocation.reason = kIdentityChangeBlock;
                revocation.revoked_at = now;
                store.insertRevocation(revocation);
                identity_blocked = true;
                // Commit the revocation and the events, but not the new bundle.
                return true;
            }
            if (identity_changes >= policy_.identity_change_alert_threshold) {
                Logger::getInstance().warning("Identity change alert: device " + device_id + " rotated " +
                                              std::to_string(identity_changes) + " times within " +
                                              std::to_string(policy_.identity_change_window_hours) + "h");
            }
        }

        bundle.device_id = device_id;
        bundle.identity_key_pub = request.identity_key_pub;
        bundle.signed_prekey_pub = request.signed_prekey_pub;
        bundle.signed_prekey_sig = request.signed_prekey_sig;
        bundle.bundle_version = existing ? bundle.bundle_version + 1 : 1;
        bundle.prekeys_remaining = static_cast<int>(request.prekeys.size());
        bundle.updated_at = now;
        store.saveBundle(bundle);

        store.deleteUnclaimedPrekeys(device_id);
        result.prekey_ids = store.insertPrekeys(device_id, request.prekeys);
        result.device_id = device_id;
        result.bundle_version = bundle.bundle_version;
        result.prekeys_stored = static_cast<int>(result.prekey_ids.size());
        return true;
    });

    if (!ok) {
        return false;
    }
    if (identity_blocked) {
        Logger::getInstance().audit("identity_change_block",
                                    "user=" + caller + " device=" + device_id + " changes=" +
                                    std::to_string(identity_changes) + " device revoked");
        error.set(403, codes::IDENTITY_CHANGE_BLOCKED,
                  "Too many identity key changes; device has been revoked");
        return false;
    }

    Logger::getInstance().info("Key bundle v" + std::to_string(result.bundle_version) + " uploaded for device " +
                               device_id + " (user " + caller + ", " + std::to_string(result.prekeys_stored) +
                               " prekeys)");
    return true;
}

bool KeyService::fetchBundles(const std::string& caller, const std::string& target_user_id, int64_t known_version,
                              std::vector<DeviceBundleView>& devices, ServiceError& error) {
    if (target_user_id.empty()) {
        error.set(400, "", "user_id is required");
        return false;
    }
    devices.clear();

    return runTransaction(storage_, "fetchBundles", error, [&](Store& store) {
        if (caller != target_user_id) {
            if (RelationshipService::blockedEitherWay(store, caller, target_user_id)) {
                error.set(403, codes::BLOCKED, "BLOCKED");
                return false;
            }
            if (!RelationshipService::related(store, caller, target_user_id)) {
                error.set(403, codes::RELATIONSHIP_REQUIRED,
                          "A conversation or shared group is required before fetching keys");
                return false;
            }
        }

        int64_t newest_version = 0;
        for (const auto& device : store.listDevices(target_user_id)) {
            if (device.isRevoked()) {
                continue;
            }
            KeyBundle bundle;
            if (!store.findBundle(device.id, bundle)) {
                continue;
            }
            newest_version = std::max(newest_version, bundle.bundle_version);

            DeviceBundleView view;
            view.device_id = device.id;
            view.device_name = device.display_name;
            view.identity_key_pub = bundle.identity_key_pub;
            view.signed_prekey_pub = bundle.signed_prekey_pub;
            view.signed_prekey_sig = bundle.signed_prekey_sig;
            view.bundle_version = bundle.bundle_version;
            view.prekeys_available = store.countUnclaimedPrekeys(device.id);
            devices.push_back(view);
        }

        if (known_version >= 0 && known_version < newest_version) {
            devices.clear();
            error.set(409, codes::BUNDLE_STALE, "BUNDLE_STALE");
            error.headers["X-Bundle-Version"] = std::to_string(newest_version);
            error.context["bundle_version"] = std::to_string(newest_version);
            return false;
        }
        return true;
    });
}

bool KeyService::listDevices(const std::string& caller, std::vector<Device>& devices, ServiceError& error) {
    return runTransaction(storage_, "listDevices", error, [&](Store& store) {
        devices = store.listDevices(caller);
        std::reverse(devices.begin(), devices.end());
        return true;
    });
}

bool KeyService::revokeDevice(const std::string& caller, const std::string& device_id, const std::string& reason,
                              bool& already_revoked, ServiceError& error) {
    if (device_id.empty()) {
        error.set(400, "", "device_id is required");
        return false;
    }
    already_revoked = false;
    const int64_t now = clock_.nowMillis();

    bool ok = runTransaction(storage_, "revokeDevice", error, [&](Store& store) {
        Device device;
        if (!store.findDevice(device_id, device, true) || device.owner_user_id != caller) {
            error.set(404, "", "Device not found");
            return false;
        }
        if (device.isRevoked()) {
            already_revoked = true;
            return true;
        }
        store.markDeviceRevoked(device_id);
        DeviceRevocation revocation;
        revocation.user_id = caller;
        revocation.device_id = device_id;
        revocation.reason = reason;
        revocation.revoked_at = now;
        store.insertRevocation(revocation);
        return true;
    });

    if (ok && !already_revoked) {
        Logger::getInstance().audit("device_revoked",
                                    "user=" + caller + " device=" + device_id + " reason=" + reason);
    }
    return ok;
}

bool KeyService::claimPrekey(const std::string& caller, const std::string& device_id, int64_t prekey_id,
                             ClaimedPrekey& claimed, ServiceError& error) {
    if (device_id.empty() || prekey_id <= 0) {
        error.set(400, "", "device_id and prekey_id are required");
        return false;
    }
    const int64_t now = clock_.nowMillis();

    return runTransaction(storage_, "claimPrekey", error, [&](Store& store) {
        // The device row lock orders concurrent claims so the recount below is current.
        Device device;
        if (!store.findDevice(device_id, device, true)) {
            error.set(404, "", "Device not found");
            return false;
        }
        if (device.isRevoked()) {
            Logger::getInstance().audit("revoked_device_use",
                                        "user=" + caller + " device=" + device_id + " op=claim");
            error.set(409, codes::DEVICE_REVOKED, "DEVICE_REVOKED");
            return false;
        }
        if (device.owner_user_id != caller) {
            if (RelationshipService::blockedEitherWay(store, caller, device.owner_user_id)) {
                error.set(403, codes::BLOCKED, "BLOCKED");
                return false;
            }
            if (!RelationshipService::related(store, caller, device.owner_user_id)) {
                error.set(403, codes::RELATIONSHIP_REQUIRED,
                          "A conversation or shared group is required before claiming prekeys");
                return false;
            }
        }

        OneTimePrekey prekey;
        if (!store.claimPrekey(device_id, prekey_id, now, prekey)) {
            if (store.countUnclaimedPrekeys(device_id) == 0) {
                KeyBundle bundle;
                int64_t version = store.findBundle(device_id, bundle) ? bundle.bundle_version : 1;
                error.set(409, codes::PREKEYS_EXHAUSTED, "PREKEYS_EXHAUSTED");
                error.headers["X-Bundle-Version"] = std::to_string(version);
                error.context["bundle_version"] = std::to_string(version);
            } else {
                error.set(404, "", "Prekey not found or already claimed");
            }
            return false;
        }

        store.setPrekeysRemaining(device_id, store.countUnclaimedPrekeys(device_id));
        claimed.device_id = device_id;
        claimed.prekey_id = prekey.id;
        claimed.prekey_pub = prekey.prekey_pub;
        return true;
    });
}

} // namespace sealgate
