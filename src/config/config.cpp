#include "../../include/config/config.hpp"
#include "../../include/utils/logger.hpp"
#include <cstdlib>
#include <cerrno>
#include <algorithm>
#include <cctype>

namespace sealgate {

namespace {

class EnvReader {
public:
    explicit EnvReader(const std::function<const char*(const char*)>& lookup) : lookup_(lookup) {}

    void readString(const char* name, std::string& target) const {
        const char* value = lookup_(name);
        if (value) {
            target = value;
        }
    }

    void readInt(const char* name, int& target, int min_value) const {
        const char* value = lookup_(name);
        if (!value) {
            return;
        }
        errno = 0;
        char* end = nullptr;
        long parsed = std::strtol(value, &end, 10);
        if (errno != 0 || end == value || *end != '\0' || parsed < min_value || parsed > 1000000000L) {
            Logger::getInstance().warning(std::string("Ignoring invalid value for ") + name + ": " + value);
            return;
        }
        target = static_cast<int>(parsed);
    }

    void readBool(const char* name, bool& target) const {
        const char* value = lookup_(name);
        if (!value) {
            return;
        }
        std::string lower = value;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
            target = true;
        } else if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
            target = false;
        } else {
            Logger::getInstance().warning(std::string("Ignoring invalid boolean for ") + name + ": " + value);
        }
    }

private:
    const std::function<const char*(const char*)>& lookup_;
};

} // namespace

Config Config::fromEnvironment() {
    return fromLookup([](const char* name) -> const char* { return std::getenv(name); });
}

Config Config::fromLookup(const std::function<const char*(const char*)>& lookup) {
    Config config;
    EnvReader env(lookup);

    env.readString("SEALGATE_SERVER_ADDRESS", config.server_address);
    int port = config.server_port;
    env.readInt("SEALGATE_SERVER_PORT", port, 1);
    if (port <= 65535) {
        config.server_port = static_cast<unsigned short>(port);
    } else {
        Logger::getInstance().warning("Ignoring out-of-range SEALGATE_SERVER_PORT");
    }
    env.readString("SEALGATE_LOG_FILE", config.log_file);
    env.readString("SEALGATE_LOG_LEVEL", config.log_level);

    env.readString("SEALGATE_STORAGE", config.storage_backend);
    env.readString("SEALGATE_DB_HOST", config.db_host);
    env.readString("SEALGATE_DB_PORT", config.db_port);
    env.readString("SEALGATE_DB_NAME", config.db_name);
    env.readString("SEALGATE_DB_USER", config.db_user);
    env.readString("SEALGATE_DB_PASSWORD", config.db_password);
    env.readInt("SEALGATE_DB_POOL_SIZE", config.db_pool_size, 1);

    env.readString("SEALGATE_GATEWAY_SECRET", config.gateway_secret);
    env.readBool("SEALGATE_DM_ENABLED", config.dm_enabled);
    env.readBool("SEALGATE_GROUPS_ENABLED", config.groups_enabled);
    env.readInt("SEALGATE_METRICS_CACHE_SECONDS", config.metrics_cache_seconds, 0);

    env.readInt("SEALGATE_PREKEY_POOL_SIZE", config.keys.prekey_pool_size, 1);
    env.readInt("SEALGATE_OTPK_LOW_WATERMARK", config.keys.otpk_low_watermark, 0);
    env.readInt("SEALGATE_OTPK_CRITICAL_WATERMARK", config.keys.otpk_critical_watermark, 0);
    env.readInt("SEALGATE_SIGNED_PREKEY_MAX_AGE_DAYS", config.keys.signed_prekey_max_age_days, 1);
    env.readInt("SEALGATE_IDENTITY_CHANGE_ALERT_THRESHOLD", config.keys.identity_change_alert_threshold, 1);
    env.readInt("SEALGATE_IDENTITY_CHANGE_BLOCK_THRESHOLD", config.keys.identity_change_block_threshold, 1);
    env.readInt("SEALGATE_IDENTITY_CHANGE_WINDOW_HOURS", config.keys.identity_change_window_hours, 1);

    env.readInt("SEALGATE_DM_MAX_MESSAGE_SIZE", config.messaging.max_message_size, 1);
    env.readInt("SEALGATE_DM_MAX_MESSAGES_PER_MINUTE", config.messaging.dm_global.max_messages, 1);
    env.readInt("SEALGATE_DM_BURST_MESSAGES", config.messaging.dm_burst.max_messages, 1);
    env.readInt("SEALGATE_DM_BURST_WINDOW_SECONDS", config.messaging.dm_burst.window_seconds, 1);
    env.readInt("SEALGATE_GROUP_MESSAGES_PER_MINUTE", config.messaging.group_global.max_messages, 1);
    env.readInt("SEALGATE_GROUP_BURST_MESSAGES", config.messaging.group_burst.max_messages, 1);
    env.readInt("SEALGATE_GROUP_BURST_WINDOW_SECONDS", config.messaging.group_burst.window_seconds, 1);

    env.readInt("SEALGATE_GROUP_MAX_PARTICIPANTS", config.groups.max_participants, 2);
    env.readInt("SEALGATE_GROUP_INVITE_EXPIRY_HOURS", config.groups.invite_expiry_hours, 1);

    if (config.keys.otpk_critical_watermark > config.keys.otpk_low_watermark) {
        Logger::getInstance().warning("Critical prekey watermark exceeds low watermark; clamping");
        config.keys.otpk_critical_watermark = config.keys.otpk_low_watermark;
    }
    if (config.keys.identity_change_alert_threshold > config.keys.identity_change_block_threshold) {
        Logger::getInstance().warning("Identity-change alert threshold exceeds block threshold; clamping");
        config.keys.identity_change_alert_threshold = config.keys.identity_change_block_threshold;
    }

    return config;
}

} // namespace sealgate
