#include "../../include/database/db_manager.hpp"
#include "../../include/utils/logger.hpp"
#include "../../include/utils/service_error.hpp"
#include <sstream>

namespace sealgate {

namespace {

const char* const kSchema[] = {
    "CREATE TABLE IF NOT EXISTS users ("
    "  id TEXT PRIMARY KEY,"
    "  username TEXT NOT NULL DEFAULT '',"
    "  created_at TIMESTAMPTZ NOT NULL DEFAULT now()"
    ")",

    "CREATE TABLE IF NOT EXISTS user_blocks ("
    "  blocker_id TEXT NOT NULL,"
    "  blocked_id TEXT NOT NULL,"
    "  created_at TIMESTAMPTZ NOT NULL DEFAULT now(),"
    "  PRIMARY KEY (blocker_id, blocked_id)"
    ")",

    "CREATE TABLE IF NOT EXISTS e2ee_devices ("
    "  device_id TEXT PRIMARY KEY,"
    "  user_id TEXT NOT NULL,"
    "  display_name TEXT NOT NULL DEFAULT '',"
    "  status VARCHAR(16) NOT NULL DEFAULT 'active' CHECK (status IN ('active','revoked')),"
    "  created_at TIMESTAMPTZ NOT NULL DEFAULT now(),"
    "  last_seen_at TIMESTAMPTZ"
    ")",
    "CREATE INDEX IF NOT EXISTS idx_e2ee_devices_user ON e2ee_devices (user_id)",

    "CREATE TABLE IF NOT EXISTS e2ee_device_revocations ("
    "  id BIGSERIAL PRIMARY KEY,"
    "  user_id TEXT NOT NULL,"
    "  device_id TEXT NOT NULL,"
    "  reason TEXT NOT NULL DEFAULT '',"
    "  revoked_at TIMESTAMPTZ NOT NULL DEFAULT now()"
    ")",

    "CREATE TABLE IF NOT EXISTS e2ee_key_bundles ("
    "  device_id TEXT PRIMARY KEY REFERENCES e2ee_devices(device_id) ON DELETE CASCADE,"
    "  identity_key_pub TEXT NOT NULL,"
    "  signed_prekey_pub TEXT NOT NULL,"
    "  signed_prekey_sig TEXT NOT NULL,"
    "  bundle_version BIGINT NOT NULL DEFAULT 1,"
    "  prekeys_remaining INTEGER NOT NULL DEFAULT 0,"
    "  updated_at TIMESTAMPTZ NOT NULL DEFAULT now()"
    ")",

    "CREATE TABLE IF NOT EXISTS e2ee_one_time_prekeys ("
    "  id BIGSERIAL PRIMARY KEY,"
    "  device_id TEXT NOT NULL REFERENCES e2ee_devices(device_id) ON DELETE CASCADE,"
    "  prekey_pub TEXT NOT NULL,"
    "  claimed BOOLEAN NOT NULL DEFAULT FALSE,"
    "  claimed_at TIMESTAMPTZ,"
    "  created_at TIMESTAMPTZ NOT NULL DEFAULT now()"
    ")",
    "CREATE INDEX IF NOT EXISTS idx_e2ee_prekeys_device_claimed ON e2ee_one_time_prekeys (device_id, claimed)",

    "CREATE TABLE IF NOT EXISTS e2ee_identity_events ("
    "  id BIGSERIAL PRIMARY KEY,"
    "  user_id TEXT NOT NULL,"
    "  device_id TEXT NOT NULL,"
    "  reason VARCHAR(32) NOT NULL,"
    "  created_at TIMESTAMPTZ NOT NULL DEFAULT now()"
    ")",
    "CREATE INDEX IF NOT EXISTS idx_e2ee_identity_events_device ON e2ee_identity_events (device_id, reason, created_at)",

    "CREATE TABLE IF NOT EXISTS dm_conversations ("
    "  id TEXT PRIMARY KEY,"
    "  pair_key TEXT UNIQUE,"
    "  created_at TIMESTAMPTZ NOT NULL DEFAULT now(),"
    "  last_message_at TIMESTAMPTZ"
    ")",

    "CREATE TABLE IF NOT EXISTS dm_participants ("
    "  conversation_id TEXT NOT NULL REFERENCES dm_conversations(id) ON DELETE CASCADE,"
    "  user_id TEXT NOT NULL,"
    "  device_ids TEXT[] NOT NULL DEFAULT '{}',"
    "  PRIMARY KEY (conversation_id, user_id)"
    ")",
    "CREATE INDEX IF NOT EXISTS idx_dm_participants_user ON dm_participants (user_id)",

    "CREATE TABLE IF NOT EXISTS e2ee_groups ("
    "  id TEXT PRIMARY KEY,"
    "  title TEXT NOT NULL,"
    "  about TEXT NOT NULL DEFAULT '',"
    "  created_by TEXT NOT NULL,"
    "  max_participants INTEGER NOT NULL,"
    "  group_epoch BIGINT NOT NULL DEFAULT 0,"
    "  is_closed BOOLEAN NOT NULL DEFAULT FALSE,"
    "  created_at TIMESTAMPTZ NOT NULL DEFAULT now(),"
    "  updated_at TIMESTAMPTZ NOT NULL DEFAULT now()"
    ")",

    "CREATE TABLE IF NOT EXISTS group_participants ("
    "  group_id TEXT NOT NULL REFERENCES e2ee_groups(id) ON DELETE CASCADE,"
    "  user_id TEXT NOT NULL,"
    "  role VARCHAR(16) NOT NULL CHECK (role IN ('owner','admin','member')),"
    "  is_banned BOOLEAN NOT NULL DEFAULT FALSE,"
    "  joined_at TIMESTAMPTZ NOT NULL DEFAULT now(),"
    "  mute_until TIMESTAMPTZ,"
    "  PRIMARY KEY (group_id, user_id)"
    ")",
    "CREATE INDEX IF NOT EXISTS idx_group_participants_user ON group_participants (user_id)",

    "CREATE TABLE IF NOT EXISTS group_bans ("
    "  group_id TEXT NOT NULL REFERENCES e2ee_groups(id) ON DELETE CASCADE,"
    "  user_id TEXT NOT NULL,"
    "  banned_by TEXT NOT NULL,"
    "  reason TEXT NOT NULL DEFAULT '',"
    "  banned_at TIMESTAMPTZ NOT NULL DEFAULT now(),"
    "  PRIMARY KEY (group_id, user_id)"
    ")",

    "CREATE TABLE IF NOT EXISTS group_invites ("
    "  id TEXT PRIMARY KEY,"
    "  group_id TEXT NOT NULL REFERENCES e2ee_groups(id) ON DELETE CASCADE,"
    "  created_by TEXT NOT NULL,"
    "  type VARCHAR(16) NOT NULL CHECK (type IN ('link','direct')),"
    "  code VARCHAR(32) NOT NULL UNIQUE,"
    "  expires_at TIMESTAMPTZ NOT NULL,"
    "  max_uses INTEGER,"
    "  uses INTEGER NOT NULL DEFAULT 0,"
    "  target_user_id TEXT,"
    "  created_at TIMESTAMPTZ NOT NULL DEFAULT now()"
    ")",

    "CREATE TABLE IF NOT EXISTS group_epoch_changes ("
    "  id BIGSERIAL PRIMARY KEY,"
    "  group_id TEXT NOT NULL,"
    "  new_epoch BIGINT NOT NULL,"
    "  reason VARCHAR(32) NOT NULL,"
    "  changed_at TIMESTAMPTZ NOT NULL DEFAULT now()"
    ")",
    "CREATE INDEX IF NOT EXISTS idx_group_epoch_changes_time ON group_epoch_changes (changed_at)",

    "CREATE TABLE IF NOT EXISTS relay_messages ("
    "  id TEXT PRIMARY KEY,"
    "  seq BIGSERIAL UNIQUE,"
    "  kind VARCHAR(8) NOT NULL CHECK (kind IN ('dm','group')),"
    "  target_id TEXT NOT NULL,"
    "  sender_user_id TEXT NOT NULL,"
    "  sender_device_id TEXT NOT NULL,"
    "  ciphertext TEXT NOT NULL,"
    "  proto INTEGER NOT NULL DEFAULT 1,"
    "  client_message_id TEXT,"
    "  group_epoch BIGINT NOT NULL DEFAULT 0,"
    "  reply_to_message_id TEXT,"
    "  created_at TIMESTAMPTZ NOT NULL DEFAULT now()"
    ")",
    "CREATE INDEX IF NOT EXISTS idx_relay_messages_target ON relay_messages (kind, target_id, seq)",
    "CREATE INDEX IF NOT EXISTS idx_relay_messages_sender ON relay_messages (kind, sender_user_id, created_at)",
    "CREATE UNIQUE INDEX IF NOT EXISTS uq_relay_messages_client_id "
    "  ON relay_messages (kind, target_id, sender_user_id, client_message_id) "
    "  WHERE client_message_id IS NOT NULL",

    "CREATE TABLE IF NOT EXISTS relay_receipts ("
    "  message_id TEXT NOT NULL REFERENCES relay_messages(id) ON DELETE CASCADE,"
    "  recipient_user_id TEXT NOT NULL,"
    "  kind VARCHAR(8) NOT NULL,"
    "  delivered_at TIMESTAMPTZ,"
    "  read_at TIMESTAMPTZ,"
    "  PRIMARY KEY (message_id, recipient_user_id)"
    ")",
    "CREATE INDEX IF NOT EXISTS idx_relay_receipts_recipient ON relay_receipts (recipient_user_id, read_at)",
};

void runControl(DatabaseConnection& conn, const char* command) {
    PgResult res(conn.executeQuery(command));
    if (!res.ok()) {
        throw StorageError(std::string(command) + " failed: " + conn.getLastError());
    }
}

} // namespace

namespace sql {

std::string millis(const std::string& column) {
    return "(EXTRACT(EPOCH FROM " + column + ") * 1000)::bigint";
}

std::string timestamp(const std::string& param) {
    return "to_timestamp(" + param + "::bigint / 1000.0)";
}

} // namespace sql

DatabaseManager::DatabaseManager(const std::string& host,
                                const std::string& port,
                                const std::string& dbname,
                                const std::string& user,
                                const std::string& password,
                                int pool_size)
    : host_(host), port_(port), dbname_(dbname), user_(user), password_(password) {
    pool_ = std::make_unique<ConnectionPool>(host, port, dbname, user, password, pool_size);
}

bool DatabaseManager::initialize() {
    DatabaseConnection bootstrap(host_, port_, dbname_, user_, password_);
    if (!bootstrap.connect()) {
        Logger::getInstance().error("Failed to connect to database");
        return false;
    }
    if (!createSchema(bootstrap)) {
        return false;
    }
    bootstrap.disconnect();

    if (!pool_->open(&DatabaseManager::prepareStatements)) {
        Logger::getInstance().error("Failed to open database connection pool");
        return false;
    }
    Logger::getInstance().info("DatabaseManager initialized successfully");
    return true;
}

bool DatabaseManager::createSchema(DatabaseConnection& conn) {
    for (const char* statement : kSchema) {
        PgResult res(conn.executeQuery(statement));
        if (!res.ok()) {
            Logger::getInstance().error("Schema statement failed: " + conn.getLastError());
            return false;
        }
    }
    Logger::getInstance().info("Database schema ensured");
    return true;
}

bool DatabaseManager::prepareStatements(DatabaseConnection& conn) {
    return PgStore::prepareUserStatements(conn) &&
           PgStore::prepareKeyStatements(conn) &&
           PgStore::prepareConversationStatements(conn) &&
           PgStore::prepareGroupStatements(conn) &&
           PgStore::prepareMessageStatements(conn) &&
           PgStore::prepareMetricsStatements(conn);
}

bool DatabaseManager::transact(const std::function<bool(Store&)>& work) {
    ConnectionPool::Lease lease = pool_->acquire();
    DatabaseConnection& conn = lease.connection();

    runControl(conn, "BEGIN");
    PgStore store(conn);
    bool commit = false;
    try {
        commit = work(store);
    } catch (...) {
        PgResult rollback(conn.executeQuery("ROLLBACK"));
        if (!rollback.ok()) {
            Logger::getInstance().error("ROLLBACK failed after error: " + conn.getLastError());
        }
        throw;
    }

    if (!commit) {
        runControl(conn, "ROLLBACK");
        return false;
    }

    PgResult res(conn.executeQuery("COMMIT"));
    if (!res.ok()) {
        std::string error = conn.getLastError();
        PgResult rollback(conn.executeQuery("ROLLBACK"));
        throw StorageError("COMMIT failed: " + error);
    }
    return true;
}

// ========== PgStore helpers ==========

PgResult PgStore::exec(const std::string& stmt_name, const PgParams& params) {
    std::vector<const char*> values = params.pointers();
    PgResult res(conn_.executePrepared(stmt_name, params.size(), values.empty() ? nullptr : values.data()));
    if (!res.ok()) {
        throw StorageError("statement " + stmt_name + " failed");
    }
    return res;
}

const char* PgStore::kindName(MessageKind kind) {
    return kind == MessageKind::Group ? "group" : "dm";
}

std::vector<std::string> PgStore::splitList(const std::string& joined) {
    std::vector<std::string> parts;
    std::stringstream ss(joined);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            parts.push_back(item);
        }
    }
    return parts;
}

// ========== USERS & BLOCKS ==========

bool PgStore::prepareUserStatements(DatabaseConnection& conn) {
    return conn.prepareStatement("find_user",
               "SELECT id, username, " + sql::millis("created_at") + " FROM users WHERE id = $1") &&
           conn.prepareStatement("upsert_user",
               "INSERT INTO users (id, username, created_at) VALUES ($1, $2, " + sql::timestamp("$3") + ") "
               "ON CONFLICT (id) DO UPDATE SET username = COALESCE(NULLIF(EXCLUDED.username, ''), users.username)") &&
           conn.prepareStatement("is_blocked",
               "SELECT 1 FROM user_blocks WHERE blocker_id = $1 AND blocked_id = $2") &&
           conn.prepareStatement("insert_block",
               "INSERT INTO user_blocks (blocker_id, blocked_id, created_at) VALUES ($1, $2, " +
               sql::timestamp("$3") + ") ON CONFLICT DO NOTHING") &&
           conn.prepareStatement("delete_block",
               "DELETE FROM user_blocks WHERE blocker_id = $1 AND blocked_id = $2") &&
           conn.prepareStatement("list_blocks",
               "SELECT blocker_id, blocked_id, " + sql::millis("created_at") +
               " FROM user_blocks WHERE blocker_id = $1 ORDER BY created_at DESC") &&
           conn.prepareStatement("share_conversation",
               "SELECT 1 FROM dm_participants a JOIN dm_participants b ON a.conversation_id = b.conversation_id "
               "WHERE a.user_id = $1 AND b.user_id = $2 LIMIT 1") &&
           conn.prepareStatement("share_active_group",
               "SELECT 1 FROM group_participants a JOIN group_participants b ON a.group_id = b.group_id "
               "WHERE a.user_id = $1 AND b.user_id = $2 AND a.is_banned = FALSE AND b.is_banned = FALSE LIMIT 1");
}

bool PgStore::findUser(const std::string& user_id, User& out) {
    PgResult res = exec("find_user", PgParams().add(user_id));
    if (res.rows() == 0) {
        return false;
    }
    out.id = res.text(0, 0);
    out.username = res.text(0, 1);
    out.created_at = res.int64(0, 2);
    return true;
}

void PgStore::upsertUser(const User& user) {
    exec("upsert_user", PgParams().add(user.id).add(user.username).add(user.created_at));
}

bool PgStore::isBlocked(const std::string& blocker_id, const std::string& blocked_id) {
    return exec("is_blocked", PgParams().add(blocker_id).add(blocked_id)).rows() > 0;
}

bool PgStore::insertBlock(const BlockEntry& entry) {
    PgResult res = exec("insert_block", PgParams().add(entry.blocker_id).add(entry.blocked_id).add(entry.created_at));
    return res.affected() > 0;
}

bool PgStore::deleteBlock(const std::string& blocker_id, const std::string& blocked_id) {
    return exec("delete_block", PgParams().add(blocker_id).add(blocked_id)).affected() > 0;
}

std::vector<BlockEntry> PgStore::listBlocks(const std::string& blocker_id) {
    PgResult res = exec("list_blocks", PgParams().add(blocker_id));
    std::vector<BlockEntry> blocks;
    for (int i = 0; i < res.rows(); i++) {
        BlockEntry entry;
        entry.blocker_id = res.text(i, 0);
        entry.blocked_id = res.text(i, 1);
        entry.created_at = res.int64(i, 2);
        blocks.push_back(entry);
    }
    return blocks;
}

bool PgStore::shareConversation(const std::string& user_a, const std::string& user_b) {
    return exec("share_conversation", PgParams().add(user_a).add(user_b)).rows() > 0;
}

bool PgStore::shareActiveGroup(const std::string& user_a, const std::string& user_b) {
    return exec("share_active_group", PgParams().add(user_a).add(user_b)).rows() > 0;
}

} // namespace sealgate
