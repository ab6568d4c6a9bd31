#include "../../include/server/request_handler.hpp"
#include "../../include/server/response_writer.hpp"
#include "../../include/utils/json_parser.hpp"
#include <sstream>

namespace sealgate {

std::string RequestHandler::routeKeys(const ApiRequest& request) {
    const auto& s = request.segments;
    if (s.size() == 3 && s[1] == "keys") {
        if (s[2] == "upload" && request.method == "POST") return handleUploadBundle(request);
        if (s[2] == "bundle" && request.method == "GET") return handleFetchBundle(request);
    } else if (s.size() == 2 && s[1] == "devices" && request.method == "GET") {
        return handleListDevices(request);
    } else if (s.size() == 3 && s[1] == "devices" && s[2] == "revoke" && request.method == "POST") {
        return handleRevokeDevice(request);
    } else if (s.size() == 3 && s[1] == "prekeys" && s[2] == "claim" && request.method == "POST") {
        return handleClaimPrekey(request);
    }
    return statusResponse(404, "Not found");
}

/**
 * POST /e2ee/keys/upload
 *
 * Request: { "device_id"?, "device_name"?, "identity_key_pub", "signed_prekey_pub",
 *            "signed_prekey_sig", "one_time_prekeys": ["base64", ...] }
 * Response: { "device_id", "bundle_version", "prekeys_stored", "prekey_ids" }
 */
std::string RequestHandler::handleUploadBundle(const ApiRequest& request) {
    boost::property_tree::ptree tree;
    std::string failure;
    if (!parseBody(request, tree, failure)) {
        return failure;
    }

    UploadBundleRequest upload;
    JsonParser::getString(tree, "device_id", upload.device_id);
    JsonParser::getString(tree, "device_name", upload.device_name);
    JsonParser::getString(tree, "identity_key_pub", upload.identity_key_pub);
    JsonParser::getString(tree, "signed_prekey_pub", upload.signed_prekey_pub);
    JsonParser::getString(tree, "signed_prekey_sig", upload.signed_prekey_sig);
    if (!JsonParser::getStringArray(tree, "one_time_prekeys", upload.prekeys)) {
        return statusResponse(400, "one_time_prekeys must be an array");
    }

    UploadBundleResult result;
    ServiceError error;
    if (!services_.keys.uploadBundle(request.caller.user_id, upload, result, error)) {
        return errorResponse(error);
    }

    std::vector<std::string> ids;
    for (int64_t id : result.prekey_ids) {
        ids.push_back(std::to_string(id));
    }
    std::ostringstream oss;
    oss << "{\"success\":true"
        << ",\"device_id\":" << JsonParser::quote(result.device_id)
        << ",\"bundle_version\":" << result.bundle_version
        << ",\"prekeys_stored\":" << result.prekeys_stored
        << ",\"prekey_ids\":" << views::array(ids, [](const std::string& id) { return id; })
        << "}";
    return oss.str();
}

// GET /e2ee/keys/bundle?user_id=&bundle_version=
std::string RequestHandler::handleFetchBundle(const ApiRequest& request) {
    auto user = request.query.find("user_id");
    if (user == request.query.end() || user->second.empty()) {
        return statusResponse(400, "user_id is required");
    }
    int64_t known_version = -1;
    auto version = request.query.find("bundle_version");
    if (version != request.query.end() && !version->second.empty()) {
        known_version = queryInt(request, "bundle_version", -1);
        if (known_version < 0) {
            return statusResponse(400, "bundle_version must be a non-negative integer");
        }
    }

    std::vector<DeviceBundleView> devices;
    ServiceError error;
    if (!services_.keys.fetchBundles(request.caller.user_id, user->second, known_version, devices, error)) {
        return errorResponse(error);
    }
    return "{\"success\":true,\"user_id\":" + JsonParser::quote(user->second) +
           ",\"devices\":" + views::array(devices, views::deviceBundle) + "}";
}

std::string RequestHandler::handleListDevices(const ApiRequest& request) {
    std::vector<Device> devices;
    ServiceError error;
    if (!services_.keys.listDevices(request.caller.user_id, devices, error)) {
        return errorResponse(error);
    }
    return "{\"success\":true,\"devices\":" + views::array(devices, views::device) + "}";
}

// POST /e2ee/devices/revoke  { "device_id", "reason"? }
std::string RequestHandler::handleRevokeDevice(const ApiRequest& request) {
    boost::property_tree::ptree tree;
    std::string failure;
    if (!parseBody(request, tree, failure)) {
        return failure;
    }
    std::string device_id;
    std::string reason = "user_revoked";
    JsonParser::getString(tree, "device_id", device_id);
    JsonParser::getString(tree, "reason", reason);

    bool already_revoked = false;
    ServiceError error;
    if (!services_.keys.revokeDevice(request.caller.user_id, device_id, reason, already_revoked, error)) {
        return errorResponse(error);
    }
    return JsonParser::createSuccessResponse(already_revoked ? "Device already revoked" : "Device revoked",
                                             {{"device_id", device_id}});
}

// POST /e2ee/prekeys/claim  { "device_id", "prekey_id" }
std::string RequestHandler::handleClaimPrekey(const ApiRequest& request) {
    boost::property_tree::ptree tree;
    std::string failure;
    if (!parseBody(request, tree, failure)) {
        return failure;
    }
    std::string device_id;
    int64_t prekey_id = 0;
    JsonParser::getString(tree, "device_id", device_id);
    if (!JsonParser::getInt64(tree, "prekey_id", prekey_id)) {
        return statusResponse(400, "prekey_id must be an integer");
    }

    ClaimedPrekey claimed;
    ServiceError error;
    if (!services_.keys.claimPrekey(request.caller.user_id, device_id, prekey_id, claimed, error)) {
        return errorResponse(error);
    }
    std::ostringstream oss;
    oss << "{\"success\":true,\"claimed\":true"
        << ",\"device_id\":" << JsonParser::quote(claimed.device_id)
        << ",\"prekey_id\":" << claimed.prekey_id
        << ",\"prekey_pub\":" << JsonParser::quote(claimed.prekey_pub)
        << "}";
    return oss.str();
}

} // namespace sealgate
