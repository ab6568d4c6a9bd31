#include <catch2/catch.hpp>
#include <algorithm>
#include <cctype>
#include "auth/caller_identity.hpp"
#include "utils/crypto_utils.hpp"

using namespace sealgate;

TEST_CASE("HMAC and SHA-256 helpers produce known digests", "[caller][crypto]") {
    CHECK(crypto::hmacSha256Hex("key", "The quick brown fox jumps over the lazy dog") ==
          "f7bc83f430538424b13298e6aa6fb143ef4d59a14946175997479dbc2d1a3cd8");
    CHECK(crypto::sha256Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("Signed caller headers are verified", "[caller]") {
    CallerVerifier verifier("gateway-secret");
    REQUIRE_FALSE(verifier.trustsHeaders());
    const std::string signature = CallerVerifier::sign("gateway-secret", "alice", "user");
    Caller caller;

    REQUIRE(verifier.verify("alice", "user", signature, caller));
    CHECK(caller.user_id == "alice");
    CHECK_FALSE(caller.isOperator());

    SECTION("signature case does not matter") {
        std::string upper = signature;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        CHECK(verifier.verify("alice", "user", upper, caller));
    }
    SECTION("the role is covered by the signature") {
        CHECK_FALSE(verifier.verify("alice", "operator", signature, caller));
    }
    SECTION("another user's signature is rejected") {
        CHECK_FALSE(verifier.verify("bob", "user", signature, caller));
    }
    SECTION("a missing signature is rejected") {
        CHECK_FALSE(verifier.verify("alice", "user", "", caller));
    }
}

TEST_CASE("Caller ids are restricted to a safe alphabet", "[caller]") {
    CallerVerifier verifier("");
    REQUIRE(verifier.trustsHeaders());
    Caller caller;
    CHECK(verifier.verify("user.name-1_x@host", "user", "", caller));
    CHECK_FALSE(verifier.verify("", "user", "", caller));
    CHECK_FALSE(verifier.verify("bad id", "user", "", caller));
    CHECK_FALSE(verifier.verify("a/b", "user", "", caller));
    CHECK_FALSE(verifier.verify(std::string(129, 'a'), "user", "", caller));
}

TEST_CASE("Without a secret the headers are taken as-is", "[caller]") {
    CallerVerifier verifier("");
    Caller caller;
    REQUIRE(verifier.verify("ops", "operator", "ignored", caller));
    CHECK(caller.isOperator());
}
