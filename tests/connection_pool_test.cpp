#include <catch2/catch.hpp>
#include <chrono>
#include "database/connection_pool.hpp"
#include "utils/service_error.hpp"

using namespace sealgate;

TEST_CASE("Acquiring from an exhausted pool times out with StorageError", "[database][pool]") {
    // Never opened, so no connection is ever idle.
    ConnectionPool pool("localhost", "5432", "sealgate", "sealgate", "sealgate", 1,
                        std::chrono::milliseconds(50));

    const auto started = std::chrono::steady_clock::now();
    CHECK_THROWS_AS(pool.acquire(), StorageError);
    const auto waited = std::chrono::steady_clock::now() - started;
    CHECK(waited >= std::chrono::milliseconds(50));
    CHECK(waited < std::chrono::seconds(5));
}
