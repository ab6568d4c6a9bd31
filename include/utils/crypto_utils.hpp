#ifndef CRYPTO_UTILS_HPP
#define CRYPTO_UTILS_HPP

#include <string>
#include <cstddef>

namespace sealgate {
namespace crypto {

// Strict standard-alphabet base64 decode. Returns false on any invalid input.
bool base64Decode(const std::string& encoded, std::string& decoded);

std::string sha256Hex(const std::string& data);
std::string hmacSha256Hex(const std::string& key, const std::string& data);
bool constantTimeEquals(const std::string& a, const std::string& b);

// Random v4 UUID from the OpenSSL CSPRNG.
std::string generateUuid();
// 8-4-4-4-12 hex layout, either case.
bool isUuid(const std::string& value);
// Upper-case URL-safe code of `length` characters.
std::string generateInviteCode(size_t length = 12);

} // namespace crypto
} // namespace sealgate

#endif // CRYPTO_UTILS_HPP
