#include "../../include/utils/crypto_utils.hpp"
#include <stdexcept>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <openssl/rand.h>
#include <openssl/crypto.h>
#include <sstream>
#include <iomanip>
#include <vector>
#include <cctype>

namespace sealgate {
namespace crypto {

namespace {

std::string toHex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    for (size_t i = 0; i < len; i++) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return oss.str();
}

void randomBytes(unsigned char* out, size_t len) {
    if (RAND_bytes(out, static_cast<int>(len)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
}

bool isBase64Char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '+' || c == '/';
}

} // namespace

bool base64Decode(const std::string& encoded, std::string& decoded) {
    decoded.clear();
    if (encoded.empty()) {
        return true;
    }
    if (encoded.size() % 4 != 0) {
        return false;
    }
    size_t padding = 0;
    for (size_t i = 0; i < encoded.size(); i++) {
        const char c = encoded[i];
        if (c == '=') {
            if (i < encoded.size() - 2) {
                return false;
            }
            padding++;
        } else if (padding > 0 || !isBase64Char(c)) {
            return false;
        }
    }

    std::vector<unsigned char> buffer(encoded.size() / 4 * 3);
    const int len = EVP_DecodeBlock(buffer.data(),
                                    reinterpret_cast<const unsigned char*>(encoded.data()),
                                    static_cast<int>(encoded.size()));
    if (len < 0) {
        return false;
    }
    // EVP_DecodeBlock counts padding bytes as zeros.
    decoded.assign(reinterpret_cast<const char*>(buffer.data()), static_cast<size_t>(len) - padding);
    return true;
}

std::string sha256Hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return toHex(hash, sizeof(hash));
}

std::string hmacSha256Hex(const std::string& key, const std::string& data) {
    unsigned int len = 0;
    unsigned char result[EVP_MAX_MD_SIZE];
    HMAC(EVP_sha256(),
         reinterpret_cast<const unsigned char*>(key.data()), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         result, &len);
    return toHex(result, len);
}

bool constantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string generateUuid() {
    unsigned char bytes[16];
    randomBytes(bytes, sizeof(bytes));
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

    const std::string hex = toHex(bytes, sizeof(bytes));
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

bool isUuid(const std::string& value) {
    if (value.size() != 36) {
        return false;
    }
    for (size_t i = 0; i < value.size(); i++) {
        const char c = value[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') {
                return false;
            }
        } else if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::string generateInviteCode(size_t length) {
    static const char alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789-_";
    const size_t alphabet_size = sizeof(alphabet) - 1;

    std::vector<unsigned char> bytes(length);
    randomBytes(bytes.data(), bytes.size());

    std::string code;
    code.reserve(length);
    for (unsigned char b : bytes) {
        code += alphabet[b % alphabet_size];
    }
    return code;
}

} // namespace crypto
} // namespace sealgate
