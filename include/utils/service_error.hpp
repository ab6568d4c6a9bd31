#ifndef SERVICE_ERROR_HPP
#define SERVICE_ERROR_HPP

#include <string>
#include <map>
#include <stdexcept>

namespace sealgate {

// Stable machine-readable failure codes.
namespace codes {
constexpr const char* BLOCKED = "BLOCKED";
constexpr const char* DEVICE_REVOKED = "DEVICE_REVOKED";
constexpr const char* BUNDLE_STALE = "BUNDLE_STALE";
constexpr const char* PREKEYS_EXHAUSTED = "PREKEYS_EXHAUSTED";
constexpr const char* RELATIONSHIP_REQUIRED = "RELATIONSHIP_REQUIRED";
constexpr const char* IDENTITY_CHANGE_BLOCKED = "IDENTITY_CHANGE_BLOCKED";
constexpr const char* EPOCH_STALE = "EPOCH_STALE";
constexpr const char* GROUP_FULL = "GROUP_FULL";
constexpr const char* MAX_USES = "MAX_USES";
constexpr const char* NOT_INVITED = "NOT_INVITED";
constexpr const char* BANNED = "BANNED";
constexpr const char* TARGET_USER_REQUIRED = "TARGET_USER_REQUIRED";
constexpr const char* EXPIRY_IN_PAST = "EXPIRY_IN_PAST";
constexpr const char* RATE_LIMITED = "RATE_LIMITED";
constexpr const char* GONE = "GONE";
constexpr const char* NOT_MEMBER = "NOT_MEMBER";
constexpr const char* FORBIDDEN = "FORBIDDEN";
} // namespace codes

// Typed failure returned by every service operation.
// `code` is empty for failures without a stable code (plain 400/404/500).
struct ServiceError {
    int status = 500;
    std::string code;
    std::string message;
    std::map<std::string, std::string> headers;
    std::map<std::string, std::string> context;

    void set(int http_status, const std::string& error_code, const std::string& text) {
        status = http_status;
        code = error_code;
        message = text;
        headers.clear();
        context.clear();
        if (!code.empty()) {
            headers["X-Error-Code"] = code;
        }
    }
};

// Thrown by storage backends on infrastructure failure. The enclosing
// transaction is rolled back before it propagates.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace sealgate

#endif // SERVICE_ERROR_HPP
