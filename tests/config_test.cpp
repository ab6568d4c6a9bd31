#include <catch2/catch.hpp>
#include <map>
#include <string>
#include "config/config.hpp"

using namespace sealgate;

namespace {

Config load(const std::map<std::string, std::string>& env) {
    return Config::fromLookup([&env](const char* name) -> const char* {
        auto it = env.find(name);
        return it == env.end() ? nullptr : it->second.c_str();
    });
}

} // namespace

TEST_CASE("Defaults apply when nothing is set", "[config]") {
    Config config = load({});
    CHECK(config.server_port == 8080);
    CHECK(config.storage_backend == "postgres");
    CHECK(config.gateway_secret.empty());
    CHECK(config.dm_enabled);
    CHECK(config.groups_enabled);
    CHECK(config.keys.prekey_pool_size == 100);
    CHECK(config.keys.otpk_low_watermark == 5);
    CHECK(config.keys.otpk_critical_watermark == 2);
    CHECK(config.keys.identity_change_block_threshold == 5);
    CHECK(config.messaging.max_message_size == 65536);
    CHECK(config.messaging.dm_global.max_messages == 60);
    CHECK(config.messaging.dm_burst.max_messages == 10);
    CHECK(config.messaging.dm_burst.window_seconds == 5);
    CHECK(config.groups.max_participants == 256);
    CHECK(config.groups.invite_expiry_hours == 72);
}

TEST_CASE("Environment overrides are applied", "[config]") {
    Config config = load({{"SEALGATE_SERVER_PORT", "9443"},
                          {"SEALGATE_STORAGE", "memory"},
                          {"SEALGATE_GATEWAY_SECRET", "s3cret"},
                          {"SEALGATE_PREKEY_POOL_SIZE", "20"},
                          {"SEALGATE_DM_MAX_MESSAGES_PER_MINUTE", "30"},
                          {"SEALGATE_GROUP_MAX_PARTICIPANTS", "50"},
                          {"SEALGATE_GROUP_INVITE_EXPIRY_HOURS", "1"}});
    CHECK(config.server_port == 9443);
    CHECK(config.storage_backend == "memory");
    CHECK(config.gateway_secret == "s3cret");
    CHECK(config.keys.prekey_pool_size == 20);
    CHECK(config.messaging.dm_global.max_messages == 30);
    CHECK(config.groups.max_participants == 50);
    CHECK(config.groups.invite_expiry_hours == 1);
}

TEST_CASE("Invalid numbers keep the default", "[config]") {
    Config config = load({{"SEALGATE_SERVER_PORT", "70000"},
                          {"SEALGATE_PREKEY_POOL_SIZE", "abc"},
                          {"SEALGATE_DM_MAX_MESSAGE_SIZE", "0"},
                          {"SEALGATE_GROUP_MAX_PARTICIPANTS", "12x"}});
    CHECK(config.server_port == 8080);
    CHECK(config.keys.prekey_pool_size == 100);
    CHECK(config.messaging.max_message_size == 65536);
    CHECK(config.groups.max_participants == 256);
}

TEST_CASE("Feature switches accept the usual boolean spellings", "[config]") {
    CHECK_FALSE(load({{"SEALGATE_DM_ENABLED", "false"}}).dm_enabled);
    CHECK_FALSE(load({{"SEALGATE_DM_ENABLED", "OFF"}}).dm_enabled);
    CHECK_FALSE(load({{"SEALGATE_GROUPS_ENABLED", "0"}}).groups_enabled);
    CHECK(load({{"SEALGATE_GROUPS_ENABLED", "yes"}}).groups_enabled);
    CHECK(load({{"SEALGATE_DM_ENABLED", "maybe"}}).dm_enabled);
}

TEST_CASE("Watermarks and thresholds are clamped into order", "[config]") {
    Config config = load({{"SEALGATE_OTPK_LOW_WATERMARK", "3"},
                          {"SEALGATE_OTPK_CRITICAL_WATERMARK", "8"},
                          {"SEALGATE_IDENTITY_CHANGE_ALERT_THRESHOLD", "9"},
                          {"SEALGATE_IDENTITY_CHANGE_BLOCK_THRESHOLD", "4"}});
    CHECK(config.keys.otpk_low_watermark == 3);
    CHECK(config.keys.otpk_critical_watermark == 3);
    CHECK(config.keys.identity_change_block_threshold == 4);
    CHECK(config.keys.identity_change_alert_threshold == 4);
}
