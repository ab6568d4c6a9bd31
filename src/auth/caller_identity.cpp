#include "../../include/auth/caller_identity.hpp"
#include "../../include/utils/crypto_utils.hpp"
#include <algorithm>
#include <cctype>

namespace sealgate {

namespace {

const size_t kMaxUserIdLength = 128;

bool validUserId(const std::string& user_id) {
    if (user_id.empty() || user_id.size() > kMaxUserIdLength) {
        return false;
    }
    return std::all_of(user_id.begin(), user_id.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '@';
    });
}

} // namespace

CallerVerifier::CallerVerifier(const std::string& secret) : secret_(secret) {}

std::string CallerVerifier::sign(const std::string& secret, const std::string& user_id, const std::string& role) {
    return crypto::hmacSha256Hex(secret, user_id + "|" + role);
}

bool CallerVerifier::verify(const std::string& user_id, const std::string& role, const std::string& signature,
                            Caller& caller) const {
    if (!validUserId(user_id)) {
        return false;
    }
    if (!secret_.empty()) {
        std::string expected = sign(secret_, user_id, role);
        std::string presented = signature;
        std::transform(presented.begin(), presented.end(), presented.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (!crypto::constantTimeEquals(expected, presented)) {
            return false;
        }
    }
    caller.user_id = user_id;
    caller.role = role;
    return true;
}

} // namespace sealgate
