#ifndef KEY_SERVICE_HPP
#define KEY_SERVICE_HPP

#include <string>
#include <vector>
#include <cstdint>
#include "../config/config.hpp"
#include "../storage/storage.hpp"
#include "../utils/clock.hpp"
#include "../utils/service_error.hpp"

namespace sealgate {

struct UploadBundleRequest {
    std::string device_id;              // empty: register a new device
    std::string device_name;
    std::string identity_key_pub;
    std::string signed_prekey_pub;
    std::string signed_prekey_sig;
    std::vector<std::string> prekeys;
};

struct UploadBundleResult {
    std::string device_id;
    int64_t bundle_version = 0;
    int prekeys_stored = 0;
    std::vector<int64_t> prekey_ids;
};

struct DeviceBundleView {
    std::string device_id;
    std::string device_name;
    std::string identity_key_pub;
    std::string signed_prekey_pub;
    std::string signed_prekey_sig;
    int64_t bundle_version = 0;
    int prekeys_available = 0;
};

struct ClaimedPrekey {
    std::string device_id;
    int64_t prekey_id = 0;
    std::string prekey_pub;
};

/**
 * Device registry, key bundle store and one-time prekey pool.
 *
 * Device status only moves active -> revoked. Bundle versions strictly increase,
 * and prekeys_remaining is always rewritten from the live unclaimed count.
 * Identity-key rotation is tracked per device; too many rotations inside the
 * configured window revoke the device.
 */
class KeyService {
public:
    KeyService(Storage& storage, const Clock& clock, const KeyPolicy& policy);

    bool uploadBundle(const std::string& caller, const UploadBundleRequest& request,
                      UploadBundleResult& result, ServiceError& error);

    // known_version < 0 means the caller holds no cached version.
    bool fetchBundles(const std::string& caller, const std::string& target_user_id, int64_t known_version,
                      std::vector<DeviceBundleView>& devices, ServiceError& error);

    bool listDevices(const std::string& caller, std::vector<Device>& devices, ServiceError& error);

    bool revokeDevice(const std::string& caller, const std::string& device_id, const std::string& reason,
                      bool& already_revoked, ServiceError& error);

    bool claimPrekey(const std::string& caller, const std::string& device_id, int64_t prekey_id,
                     ClaimedPrekey& claimed, ServiceError& error);

    // First 16 hex characters of SHA-256 over the key text.
    static std::string fingerprint(const std::string& key);

private:
    bool validateUpload(const UploadBundleRequest& request, ServiceError& error) const;

    Storage& storage_;
    const Clock& clock_;
    KeyPolicy policy_;
};

} // namespace sealgate

#endif // KEY_SERVICE_HPP
