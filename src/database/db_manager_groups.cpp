#include "../../include/database/db_manager.hpp"
#include "../../include/utils/logger.hpp"

namespace sealgate {

namespace {

const std::string kGroupColumns =
    "g.id, g.title, g.about, g.created_by, g.max_participants, g.group_epoch, g.is_closed, " +
    sql::millis("g.created_at") + ", " + sql::millis("g.updated_at");

const std::string kParticipantColumns =
    "group_id, user_id, role, is_banned, " + sql::millis("joined_at") + ", " + sql::millis("mute_until");

const std::string kInviteColumns =
    "id, group_id, created_by, type, code, " + sql::millis("expires_at") +
    ", COALESCE(max_uses, 0), uses, COALESCE(target_user_id, ''), " + sql::millis("created_at");

Group readGroup(const PgResult& res, int row) {
    Group group;
    group.id = res.text(row, 0);
    group.title = res.text(row, 1);
    group.about = res.text(row, 2);
    group.created_by = res.text(row, 3);
    group.max_participants = static_cast<int>(res.int64(row, 4));
    group.group_epoch = res.int64(row, 5);
    group.is_closed = res.boolean(row, 6);
    group.created_at = res.int64(row, 7);
    group.updated_at = res.int64(row, 8);
    return group;
}

GroupParticipant readParticipant(const PgResult& res, int row) {
    GroupParticipant participant;
    participant.group_id = res.text(row, 0);
    participant.user_id = res.text(row, 1);
    participant.role = res.text(row, 2);
    participant.is_banned = res.boolean(row, 3);
    participant.joined_at = res.int64(row, 4);
    participant.mute_until = res.int64(row, 5);
    return participant;
}

GroupInvite readInvite(const PgResult& res, int row) {
    GroupInvite invite;
    invite.id = res.text(row, 0);
    invite.group_id = res.text(row, 1);
    invite.created_by = res.text(row, 2);
    invite.type = res.text(row, 3);
    invite.code = res.text(row, 4);
    invite.expires_at = res.int64(row, 5);
    invite.max_uses = static_cast<int>(res.int64(row, 6));
    invite.uses = static_cast<int>(res.int64(row, 7));
    invite.target_user_id = res.text(row, 8);
    invite.created_at = res.int64(row, 9);
    return invite;
}

} // namespace

bool PgStore::prepareGroupStatements(DatabaseConnection& conn) {
    return conn.prepareStatement("insert_group",
               "INSERT INTO e2ee_groups (id, title, about, created_by, max_participants, group_epoch, is_closed, "
               "created_at, updated_at) VALUES ($1, $2, $3, $4, $5, $6, $7, " + sql::timestamp("$8") + ", " +
               sql::timestamp("$9") + ")") &&
           conn.prepareStatement("find_group",
               "SELECT " + kGroupColumns + " FROM e2ee_groups g WHERE g.id = $1") &&
           conn.prepareStatement("find_group_for_update",
               "SELECT " + kGroupColumns + " FROM e2ee_groups g WHERE g.id = $1 FOR UPDATE") &&
           conn.prepareStatement("update_group",
               "UPDATE e2ee_groups SET title = $2, about = $3, max_participants = $4, group_epoch = $5, "
               "is_closed = $6, updated_at = " + sql::timestamp("$7") + " WHERE id = $1") &&
           conn.prepareStatement("list_groups_for_user",
               "SELECT " + kGroupColumns + " FROM e2ee_groups g "
               "JOIN group_participants p ON p.group_id = g.id "
               "WHERE p.user_id = $1 AND p.is_banned = FALSE ORDER BY g.updated_at DESC") &&
           conn.prepareStatement("find_group_participant",
               "SELECT " + kParticipantColumns + " FROM group_participants WHERE group_id = $1 AND user_id = $2") &&
           conn.prepareStatement("upsert_group_participant",
               "INSERT INTO group_participants (group_id, user_id, role, is_banned, joined_at, mute_until) "
               "VALUES ($1, $2, $3, $4, " + sql::timestamp("$5") + ", " + sql::timestamp("$6") + ") "
               "ON CONFLICT (group_id, user_id) DO UPDATE SET role = EXCLUDED.role, is_banned = EXCLUDED.is_banned, "
               "joined_at = EXCLUDED.joined_at, mute_until = EXCLUDED.mute_until") &&
           conn.prepareStatement("delete_group_participant",
               "DELETE FROM group_participants WHERE group_id = $1 AND user_id = $2") &&
           conn.prepareStatement("count_active_group_participants",
               "SELECT COUNT(*) FROM group_participants WHERE group_id = $1 AND is_banned = FALSE") &&
           conn.prepareStatement("list_active_group_participants",
               "SELECT " + kParticipantColumns + " FROM group_participants "
               "WHERE group_id = $1 AND is_banned = FALSE ORDER BY joined_at, user_id") &&
           conn.prepareStatement("find_group_ban",
               "SELECT group_id, user_id, banned_by, reason, " + sql::millis("banned_at") +
               " FROM group_bans WHERE group_id = $1 AND user_id = $2") &&
           conn.prepareStatement("upsert_group_ban",
               "INSERT INTO group_bans (group_id, user_id, banned_by, reason, banned_at) "
               "VALUES ($1, $2, $3, $4, " + sql::timestamp("$5") + ") "
               "ON CONFLICT (group_id, user_id) DO UPDATE SET banned_by = EXCLUDED.banned_by, "
               "reason = EXCLUDED.reason, banned_at = EXCLUDED.banned_at") &&
           conn.prepareStatement("delete_group_ban",
               "DELETE FROM group_bans WHERE group_id = $1 AND user_id = $2") &&
           conn.prepareStatement("insert_epoch_change",
               "INSERT INTO group_epoch_changes (group_id, new_epoch, reason, changed_at) "
               "VALUES ($1, $2, $3, " + sql::timestamp("$4") + ")") &&
           conn.prepareStatement("insert_invite",
               "INSERT INTO group_invites (id, group_id, created_by, type, code, expires_at, max_uses, uses, "
               "target_user_id, created_at) VALUES ($1, $2, $3, $4, $5, " + sql::timestamp("$6") +
               ", $7, $8, $9, " + sql::timestamp("$10") + ") ON CONFLICT (code) DO NOTHING RETURNING id") &&
           conn.prepareStatement("find_invite_by_code",
               "SELECT " + kInviteColumns + " FROM group_invites WHERE code = $1") &&
           conn.prepareStatement("list_invites",
               "SELECT " + kInviteColumns + " FROM group_invites WHERE group_id = $1 ORDER BY created_at DESC") &&
           conn.prepareStatement("increment_invite_uses",
               "UPDATE group_invites SET uses = uses + 1 WHERE id = $1") &&
           conn.prepareStatement("delete_invite",
               "DELETE FROM group_invites WHERE group_id = $1 AND id = $2");
}

void PgStore::insertGroup(const Group& group) {
    exec("insert_group", PgParams()
        .add(group.id)
        .add(group.title)
        .add(group.about)
        .add(group.created_by)
        .add(static_cast<int64_t>(group.max_participants))
        .add(group.group_epoch)
        .addBool(group.is_closed)
        .add(group.created_at)
        .add(group.updated_at));
}

bool PgStore::findGroup(const std::string& group_id, Group& out, bool for_update) {
    PgResult res = exec(for_update ? "find_group_for_update" : "find_group", PgParams().add(group_id));
    if (res.rows() == 0) {
        return false;
    }
    out = readGroup(res, 0);
    return true;
}

void PgStore::updateGroup(const Group& group) {
    exec("update_group", PgParams()
        .add(group.id)
        .add(group.title)
        .add(group.about)
        .add(static_cast<int64_t>(group.max_participants))
        .add(group.group_epoch)
        .addBool(group.is_closed)
        .add(group.updated_at));
}

std::vector<Group> PgStore::listGroupsForUser(const std::string& user_id) {
    PgResult res = exec("list_groups_for_user", PgParams().add(user_id));
    std::vector<Group> groups;
    for (int i = 0; i < res.rows(); i++) {
        groups.push_back(readGroup(res, i));
    }
    return groups;
}

bool PgStore::findGroupParticipant(const std::string& group_id, const std::string& user_id,
                                   GroupParticipant& out) {
    PgResult res = exec("find_group_participant", PgParams().add(group_id).add(user_id));
    if (res.rows() == 0) {
        return false;
    }
    out = readParticipant(res, 0);
    return true;
}

void PgStore::upsertGroupParticipant(const GroupParticipant& participant) {
    exec("upsert_group_participant", PgParams()
        .add(participant.group_id)
        .add(participant.user_id)
        .add(participant.role)
        .addBool(participant.is_banned)
        .add(participant.joined_at)
        .addMillis(participant.mute_until));
}

bool PgStore::deleteGroupParticipant(const std::string& group_id, const std::string& user_id) {
    return exec("delete_group_participant", PgParams().add(group_id).add(user_id)).affected() > 0;
}

int PgStore::countActiveGroupParticipants(const std::string& group_id) {
    PgResult res = exec("count_active_group_participants", PgParams().add(group_id));
    return static_cast<int>(res.int64(0, 0));
}

std::vector<GroupParticipant> PgStore::listActiveGroupParticipants(const std::string& group_id) {
    PgResult res = exec("list_active_group_participants", PgParams().add(group_id));
    std::vector<GroupParticipant> participants;
    for (int i = 0; i < res.rows(); i++) {
        participants.push_back(readParticipant(res, i));
    }
    return participants;
}

bool PgStore::findGroupBan(const std::string& group_id, const std::string& user_id, GroupBan& out) {
    PgResult res = exec("find_group_ban", PgParams().add(group_id).add(user_id));
    if (res.rows() == 0) {
        return false;
    }
    out.group_id = res.text(0, 0);
    out.user_id = res.text(0, 1);
    out.banned_by = res.text(0, 2);
    out.reason = res.text(0, 3);
    out.banned_at = res.int64(0, 4);
    return true;
}

void PgStore::upsertGroupBan(const GroupBan& ban) {
    exec("upsert_group_ban", PgParams()
        .add(ban.group_id)
        .add(ban.user_id)
        .add(ban.banned_by)
        .add(ban.reason)
        .add(ban.banned_at));
}

bool PgStore::deleteGroupBan(const std::string& group_id, const std::string& user_id) {
    return exec("delete_group_ban", PgParams().add(group_id).add(user_id)).affected() > 0;
}

void PgStore::insertEpochChange(const std::string& group_id, int64_t new_epoch, const std::string& reason,
                                int64_t changed_at) {
    exec("insert_epoch_change", PgParams().add(group_id).add(new_epoch).add(reason).add(changed_at));
}

bool PgStore::insertInvite(const GroupInvite& invite) {
    PgParams params;
    params.add(invite.id)
        .add(invite.group_id)
        .add(invite.created_by)
        .add(invite.type)
        .add(invite.code)
        .add(invite.expires_at);
    if (invite.max_uses > 0) {
        params.add(static_cast<int64_t>(invite.max_uses));
    } else {
        params.addOptional("");
    }
    params.add(static_cast<int64_t>(invite.uses))
        .addOptional(invite.target_user_id)
        .add(invite.created_at);
    return exec("insert_invite", params).rows() > 0;
}

bool PgStore::findInviteByCode(const std::string& code, GroupInvite& out) {
    PgResult res = exec("find_invite_by_code", PgParams().add(code));
    if (res.rows() == 0) {
        return false;
    }
    out = readInvite(res, 0);
    return true;
}

std::vector<GroupInvite> PgStore::listInvites(const std::string& group_id) {
    PgResult res = exec("list_invites", PgParams().add(group_id));
    std::vector<GroupInvite> invites;
    for (int i = 0; i < res.rows(); i++) {
        invites.push_back(readInvite(res, i));
    }
    return invites;
}

void PgStore::incrementInviteUses(const std::string& invite_id) {
    exec("increment_invite_uses", PgParams().add(invite_id));
}

bool PgStore::deleteInvite(const std::string& group_id, const std::string& invite_id) {
    return exec("delete_invite", PgParams().add(group_id).add(invite_id)).affected() > 0;
}

} // namespace sealgate
