#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <functional>
#include <cstdint>

namespace sealgate {

struct KeyPolicy {
    int prekey_pool_size = 100;
    int otpk_low_watermark = 5;
    int otpk_critical_watermark = 2;
    int signed_prekey_max_age_days = 30;
    int identity_change_alert_threshold = 3;
    int identity_change_block_threshold = 5;
    int identity_change_window_hours = 24;
};

struct RateRule {
    int max_messages = 60;
    int window_seconds = 60;
};

struct MessagingPolicy {
    int max_message_size = 65536;
    RateRule dm_global{60, 60};
    RateRule dm_burst{10, 5};
    RateRule group_global{60, 60};
    RateRule group_burst{10, 5};
};

struct GroupPolicy {
    int max_participants = 256;
    int invite_expiry_hours = 72;
};

struct Config {
    std::string server_address = "0.0.0.0";
    unsigned short server_port = 8080;
    std::string log_file = "/var/log/sealgate/server.log";
    std::string log_level = "INFO";

    std::string storage_backend = "postgres";
    std::string db_host = "localhost";
    std::string db_port = "5432";
    std::string db_name = "sealgate";
    std::string db_user = "sealgate";
    std::string db_password = "sealgate";
    int db_pool_size = 4;

    std::string gateway_secret;

    bool dm_enabled = true;
    bool groups_enabled = true;
    int metrics_cache_seconds = 30;

    KeyPolicy keys;
    MessagingPolicy messaging;
    GroupPolicy groups;

    static Config fromEnvironment();
    // `lookup` returns nullptr for unset variables.
    static Config fromLookup(const std::function<const char*(const char*)>& lookup);
};

} // namespace sealgate

#endif // CONFIG_HPP
