#ifndef CALLER_IDENTITY_HPP
#define CALLER_IDENTITY_HPP

#include <string>

namespace sealgate {

struct Caller {
    std::string user_id;
    std::string role;

    bool isOperator() const { return role == "operator"; }
};

// Checks the identity headers forwarded by the gateway. With a secret
// configured, X-Caller-Signature must be hex HMAC-SHA256 of "<id>|<role>";
// without one the headers are taken as-is.
class CallerVerifier {
public:
    explicit CallerVerifier(const std::string& secret);

    bool verify(const std::string& user_id, const std::string& role, const std::string& signature,
                Caller& caller) const;
    bool trustsHeaders() const { return secret_.empty(); }

    static std::string sign(const std::string& secret, const std::string& user_id, const std::string& role);

private:
    std::string secret_;
};

} // namespace sealgate

#endif // CALLER_IDENTITY_HPP
