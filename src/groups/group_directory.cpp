#include "../../include/groups/group_directory.hpp"
#include "../../include/storage/transaction.hpp"
#include "../../include/utils/crypto_utils.hpp"
#include "../../include/utils/json_parser.hpp"
#include "../../include/utils/logger.hpp"
#include <algorithm>
#include <set>

namespace sealgate {

namespace {

const size_t kMaxTitleLength = 100;
const size_t kMaxAboutLength = 500;
const int kInviteCodeAttempts = 5;

const std::vector<std::string> kAnyRole;
const std::vector<std::string> kManagers = {"owner", "admin"};
const std::vector<std::string> kOwnerOnly = {"owner"};

bool validTitle(const std::string& title) {
    return !title.empty() && title.size() <= kMaxTitleLength &&
           title.find_first_not_of(" \t\r\n") != std::string::npos;
}

} // namespace

GroupDirectory::GroupDirectory(Storage& storage, const Clock& clock, const GroupPolicy& policy,
                               EventPublisher* publisher)
    : storage_(storage), clock_(clock), policy_(policy), publisher_(publisher) {}

bool GroupDirectory::isActiveMember(Store& store, const std::string& group_id, const std::string& user_id,
                                    GroupParticipant& participant) {
    return store.findGroupParticipant(group_id, user_id, participant) && !participant.is_banned;
}

bool GroupDirectory::lockGroup(Store& store, const std::string& group_id, Group& group, ServiceError& error) {
    if (!store.findGroup(group_id, group, true)) {
        error.set(404, "", "Group not found");
        return false;
    }
    return true;
}

bool GroupDirectory::requireRole(Store& store, const std::string& group_id, const std::string& caller,
                                 const std::vector<std::string>& roles, GroupParticipant& participant,
                                 ServiceError& error) {
    if (!isActiveMember(store, group_id, caller, participant)) {
        error.set(403, codes::NOT_MEMBER, "Not a member of this group");
        return false;
    }
    if (!roles.empty() && std::find(roles.begin(), roles.end(), participant.role) == roles.end()) {
        error.set(403, codes::FORBIDDEN, "Insufficient permissions");
        return false;
    }
    return true;
}

int64_t GroupDirectory::bumpEpoch(Store& store, Group& group, const std::string& reason, int64_t now,
                                  std::vector<std::string>& recipients) {
    group.group_epoch += 1;
    group.updated_at = now;
    store.updateGroup(group);
    store.insertEpochChange(group.id, group.group_epoch, reason, now);

    recipients.clear();
    for (const auto& member : store.listActiveGroupParticipants(group.id)) {
        recipients.push_back(member.user_id);
    }
    return group.group_epoch;
}

void GroupDirectory::broadcastEpoch(const std::string& group_id, int64_t new_epoch,
                                    const std::vector<std::string>& recipients) {
    Logger::getInstance().info("Group " + group_id + " moved to epoch " + std::to_string(new_epoch));
    const std::string event = "{\"type\":\"epoch_changed\",\"group_id\":" + JsonParser::quote(group_id) +
                              ",\"new_epoch\":" + std::to_string(new_epoch) + "}";
    for (const auto& user_id : recipients) {
        publishQuietly(publisher_, user_id, event);
    }
}

// ========== GROUPS ==========

bool GroupDirectory::createGroup(const std::string& caller, const std::string& title, const std::string& about,
                                 GroupView& view, ServiceError& error) {
    if (!validTitle(title)) {
        error.set(400, "", "title must be 1-100 characters");
        return false;
    }
    if (about.size() > kMaxAboutLength) {
        error.set(400, "", "about must be at most 500 characters");
        return false;
    }
    const int64_t now = clock_.nowMillis();

    Group group;
    group.id = crypto::generateUuid();
    group.title = title;
    group.about = about;
    group.created_by = caller;
    group.max_participants = policy_.max_participants;
    group.group_epoch = 0;
    group.created_at = now;
    group.updated_at = now;

    bool ok = runTransaction(storage_, "createGroup", error, [&](Store& store) {
        store.insertGroup(group);
        GroupParticipant owner;
        owner.group_id = group.id;
        owner.user_id = caller;
        owner.role = "owner";
        owner.joined_at = now;
        store.upsertGroupParticipant(owner);
        return true;
    });
    if (!ok) {
        return false;
    }

    view.group = group;
    view.my_role = "owner";
    view.participant_count = 1;
    Logger::getInstance().info("Group " + group.id + " created by " + caller);
    return true;
}

bool GroupDirectory::listGroups(const std::string& caller, std::vector<GroupView>& groups, ServiceError& error) {
    groups.clear();
    return runTransaction(storage_, "listGroups", error, [&](Store& store) {
        for (const auto& group : store.listGroupsForUser(caller)) {
            GroupParticipant self;
            if (!isActiveMember(store, group.id, caller, self)) {
                continue;
            }
            GroupView view;
            view.group = group;
            view.my_role = self.role;
            view.participant_count = store.countActiveGroupParticipants(group.id);
            groups.push_back(view);
        }
        return true;
    });
}

bool GroupDirectory::getGroup(const std::string& caller, const std::string& group_id, GroupView& view,
                              ServiceError& error) {
    return runTransaction(storage_, "getGroup", error, [&](Store& store) {
        if (!store.findGroup(group_id, view.group)) {
            error.set(404, "", "Group not found");
            return false;
        }
        GroupParticipant self;
        if (!requireRole(store, group_id, caller, kAnyRole, self, error)) {
            return false;
        }
        view.my_role = self.role;
        view.participant_count = store.countActiveGroupParticipants(group_id);
        return true;
    });
}

bool GroupDirectory::updateGroup(const std::string& caller, const std::string& group_id,
                                 const std::optional<std::string>& title, const std::optional<std::string>& about,
                                 GroupView& view, ServiceError& error) {
    if (title && !validTitle(*title)) {
        error.set(400, "", "title must be 1-100 characters");
        return false;
    }
    if (about && about->size() > kMaxAboutLength) {
        error.set(400, "", "about must be at most 500 characters");
        return false;
    }
    const int64_t now = clock_.nowMillis();

    return runTransaction(storage_, "updateGroup", error, [&](Store& store) {
        Group group;
        if (!lockGroup(store, group_id, group, error)) {
            return false;
        }
        if (group.is_closed) {
            error.set(409, "", "Group is closed");
            return false;
        }
        GroupParticipant self;
        if (!requireRole(store, group_id, caller, kManagers, self, error)) {
            return false;
        }
        if (title) {
            group.title = *title;
        }
        if (about) {
            group.about = *about;
        }
        group.updated_at = now;
        store.updateGroup(group);

        view.group = group;
        view.my_role = self.role;
        view.participant_count = store.countActiveGroupParticipants(group_id);
        return true;
    });
}

bool GroupDirectory::closeGroup(const std::string& caller, const std::string& group_id, ServiceError& error) {
    const int64_t now = clock_.nowMillis();
    bool closed_now = false;

    bool ok = runTransaction(storage_, "closeGroup", error, [&](Store& store) {
        Group group;
        if (!lockGroup(store, group_id, group, error)) {
            return false;
        }
        GroupParticipant self;
        if (!requireRole(store, group_id, caller, kOwnerOnly, self, error)) {
            return false;
        }
        if (group.is_closed) {
            return true;
        }
        group.is_closed = true;
        group.updated_at = now;
        store.updateGroup(group);
        closed_now = true;
        return true;
    });

    if (ok && closed_now) {
        Logger::getInstance().info("Group " + group_id + " closed by " + caller);
    }
    return ok;
}

// ========== MEMBERSHIP ==========

bool GroupDirectory::listMembers(const std::string& caller, const std::string& group_id,
                                 std::vector<GroupParticipant>& members, ServiceError& error) {
    return runTransaction(storage_, "listMembers", error, [&](Store& store) {
        Group group;
        if (!store.findGroup(group_id, group)) {
            error.set(404, "", "Group not found");
            return false;
        }
        GroupParticipant self;
        if (!requireRole(store, group_id, caller, kAnyRole, self, error)) {
            return false;
        }
        members = store.listActiveGroupParticipants(group_id);
        return true;
    });
}

bool GroupDirectory::addMembers(const std::string& caller, const std::string& group_id,
                                const std::vector<std::string>& user_ids, MembershipChange& change,
                                ServiceError& error) {
    if (user_ids.empty()) {
        error.set(400, "", "user_ids must not be empty");
        return false;
    }
    const int64_t now = clock_.nowMillis();
    std::vector<std::string> recipients;
    change = MembershipChange();

    bool ok = runTransaction(storage_, "addMembers", error, [&](Store& store) {
        Group group;
        if (!lockGroup(store, group_id, group, error)) {
            return false;
        }
        if (group.is_closed) {
            error.set(403, "", "Group is closed");
            return false;
        }
        GroupParticipant self;
        if (!requireRole(store, group_id, caller, kManagers, self, error)) {
            return false;
        }

        std::vector<std::string> pending;
        std::set<std::string> seen;
        for (const auto& user_id : user_ids) {
            if (user_id.empty() || !seen.insert(user_id).second) {
                continue;
            }
            User user;
            if (!store.findUser(user_id, user)) {
                continue;
            }
            GroupBan ban;
            if (store.findGroupBan(group_id, user_id, ban)) {
                continue;
            }
            GroupParticipant existing;
            if (store.findGroupParticipant(group_id, user_id, existing)) {
                if (!existing.is_banned) {
                    continue;
                }
            }
            pending.push_back(user_id);
        }

        change.new_epoch = group.group_epoch;
        if (pending.empty()) {
            return true;
        }
        if (store.countActiveGroupParticipants(group_id) + static_cast<int>(pending.size()) >
            group.max_participants) {
            error.set(409, codes::GROUP_FULL, "GROUP_FULL");
            error.context["max_participants"] = std::to_string(group.max_participants);
            return false;
        }

        for (const auto& user_id : pending) {
            GroupParticipant participant;
            participant.group_id = group_id;
            participant.user_id = user_id;
            participant.role = "member";
            participant.joined_at = now;
            store.upsertGroupParticipant(participant);
        }
        change.added_user_ids = pending;
        change.new_epoch = bumpEpoch(store, group, "member_add", now, recipients);
        change.epoch_changed = true;
        return true;
    });

    if (ok && change.epoch_changed) {
        broadcastEpoch(group_id, change.new_epoch, recipients);
    }
    return ok;
}

bool GroupDirectory::removeMember(const std::string& caller, const std::string& group_id,
                                  const std::string& user_id, MembershipChange& change, ServiceError& error) {
    if (user_id.empty()) {
        error.set(400, "", "user_id is required");
        return false;
    }
    const int64_t now = clock_.nowMillis();
    std::vector<std::string> recipients;
    change = MembershipChange();

    bool ok = runTransaction(storage_, "removeMember", error, [&](Store& store) {
        Group group;
        if (!lockGroup(store, group_id, group, error)) {
            return false;
        }
        GroupParticipant self;
        if (!requireRole(store, group_id, caller, kManagers, self, error)) {
            return false;
        }
        GroupParticipant target;
        if (!isActiveMember(store, group_id, user_id, target)) {
            error.set(404, "", "User is not a member");
            return false;
        }
        if (target.role == "owner") {
            error.set(403, codes::FORBIDDEN, "Cannot remove owner");
            return false;
        }
        store.deleteGroupParticipant(group_id, user_id);
        change.new_epoch = bumpEpoch(store, group, "member_remove", now, recipients);
        change.epoch_changed = true;
        return true;
    });

    if (ok) {
        Logger::getInstance().info("User " + user_id + " removed from group " + group_id + " by " + caller);
        broadcastEpoch(group_id, change.new_epoch, recipients);
    }
    return ok;
}

bool GroupDirectory::leave(const std::string& caller, const std::string& group_id, MembershipChange& change,
                           ServiceError& error) {
    const int64_t now = clock_.nowMillis();
    std::vector<std::string> recipients;
    change = MembershipChange();

    bool ok = runTransaction(storage_, "leave", error, [&](Store& store) {
        Group group;
        if (!lockGroup(store, group_id, group, error)) {
            return false;
        }
        GroupParticipant self;
        if (!requireRole(store, group_id, caller, kAnyRole, self, error)) {
            return false;
        }
        if (self.role == "owner") {
            error.set(403, codes::FORBIDDEN, "Owner cannot leave. Transfer ownership or close group.");
            return false;
        }
        store.deleteGroupParticipant(group_id, caller);
        change.new_epoch = bumpEpoch(store, group, "member_leave", now, recipients);
        change.epoch_changed = true;
        return true;
    });

    if (ok) {
        broadcastEpoch(group_id, change.new_epoch, recipients);
    }
    return ok;
}

bool GroupDirectory::promote(const std::string& caller, const std::string& group_id, const std::string& user_id,
                             ServiceError& error) {
    if (user_id.empty()) {
        error.set(400, "", "user_id is required");
        return false;
    }
    return runTransaction(storage_, "promote", error, [&](Store& store) {
        Group group;
        if (!lockGroup(store, group_id, group, error)) {
            return false;
        }
        GroupParticipant self;
        if (!requireRole(store, group_id, caller, kManagers, self, error)) {
            return false;
        }
        GroupParticipant target;
        if (!isActiveMember(store, group_id, user_id, target)) {
            error.set(404, "", "User is not a member");
            return false;
        }
        if (target.role == "owner") {
            error.set(403, codes::FORBIDDEN, "Cannot change the owner's role");
            return false;
        }
        if (target.role != "admin") {
            target.role = "admin";
            store.upsertGroupParticipant(target);
        }
        return true;
    });
}

bool GroupDirectory::demote(const std::string& caller, const std::string& group_id, const std::string& user_id,
                            ServiceError& error) {
    if (user_id.empty()) {
        error.set(400, "", "user_id is required");
        return false;
    }
    return runTransaction(storage_, "demote", error, [&](Store& store) {
        Group group;
        if (!lockGroup(store, group_id, group, error)) {
            return false;
        }
        GroupParticipant self;
        if (!requireRole(store, group_id, caller, kOwnerOnly, self, error)) {
            return false;
        }
        GroupParticipant target;
        if (!isActiveMember(store, group_id, user_id, target)) {
            error.set(404, "", "User is not a member");
            return false;
        }
        if (target.role == "owner") {
            error.set(403, codes::FORBIDDEN, "Cannot change the owner's role");
            return false;
        }
        if (target.role == "admin") {
            target.role = "member";
            store.upsertGroupParticipant(target);
        }
        return true;
    });
}

bool GroupDirectory::ban(const std::string& caller, const std::string& group_id, const std::string& user_id,
                         const std::string& reason, MembershipChange& change, ServiceError& error) {
    if (user_id.empty()) {
        error.set(400, "", "user_id is required");
        return false;
    }
    const int64_t now = clock_.nowMillis();
    std::vector<std::string> recipients;
    change = MembershipChange();

    bool ok = runTransaction(storage_, "ban", error, [&](Store& store) {
        Group group;
        if (!lockGroup(store, group_id, group, error)) {
            return false;
        }
        GroupParticipant self;
        if (!requireRole(store, group_id, caller, kManagers, self, error)) {
            return false;
        }
        GroupParticipant target;
        if (store.findGroupParticipant(group_id, user_id, target)) {
            if (target.role == "owner") {
                error.set(403, codes::FORBIDDEN, "Cannot ban owner");
                return false;
            }
        } else {
            target.group_id = group_id;
            target.user_id = user_id;
            target.role = "member";
            target.joined_at = now;
        }
        target.is_banned = true;
        store.upsertGroupParticipant(target);

        GroupBan existing;
        if (!store.findGroupBan(group_id, user_id, existing)) {
            GroupBan entry;
            entry.group_id = group_id;
            entry.user_id = user_id;
            entry.banned_by = caller;
            entry.reason = reason;
            entry.banned_at = now;
            store.upsertGroupBan(entry);
        }
        change.new_epoch = bumpEpoch(store, group, "member_ban", now, recipients);
        change.epoch_changed = true;
        return true;
    });

    if (ok) {
        Logger::getInstance().audit("group_ban", "group=" + group_id + " user=" + user_id + " by=" + caller +
                                    (reason.empty() ? std::string() : " reason=" + reason));
        broadcastEpoch(group_id, change.new_epoch, recipients);
    }
    return ok;
}

bool GroupDirectory::unban(const std::string& caller, const std::string& group_id, const std::string& user_id,
                           ServiceError& error) {
    if (user_id.empty()) {
        error.set(400, "", "user_id is required");
        return false;
    }
    return runTransaction(storage_, "unban", error, [&](Store& store) {
        Group group;
        if (!lockGroup(store, group_id, group, error)) {
            return false;
        }
        GroupParticipant self;
        if (!requireRole(store, group_id, caller, kManagers, self, error)) {
            return false;
        }
        store.deleteGroupBan(group_id, user_id);
        // The banned row goes too: coming back takes a fresh add or join.
        GroupParticipant target;
        if (store.findGroupParticipant(group_id, user_id, target) && target.is_banned) {
            store.deleteGroupParticipant(group_id, user_id);
        }
        Logger::getInstance().info("User " + user_id + " unbanned from group " + group_id + " by " + caller);
        return true;
    });
}

bool GroupDirectory::mute(const std::string& caller, const std::string& group_id, int64_t mute_until,
                          ServiceError& error) {
    return runTransaction(storage_, "mute", error, [&](Store& store) {
        Group group;
        if (!store.findGroup(group_id, group)) {
            error.set(404, "", "Group not found");
            return false;
        }
        GroupParticipant self;
        if (!requireRole(store, group_id, caller, kAnyRole, self, error)) {
            return false;
        }
        self.mute_until = mute_until;
        store.upsertGroupParticipant(self);
        return true;
    });
}

// ========== INVITES ==========

bool GroupDirectory::createInvite(const std::string& caller, const std::string& group_id,
                                  const CreateInviteRequest& request, GroupInvite& invite, ServiceError& error) {
    if (request.type != "link" && request.type != "direct") {
        error.set(400, "", "type must be 'link' or 'direct'");
        return false;
    }
    if (request.type == "direct" && request.target_user_id.empty()) {
        error.set(400, codes::TARGET_USER_REQUIRED, "Direct invites require target_user_id");
        return false;
    }
    if (request.max_uses && *request.max_uses < 1) {
        error.set(400, "", "max_uses must be at least 1");
        return false;
    }
    const int64_t now = clock_.nowMillis();
    if (request.expires_at != 0 && request.expires_at <= now) {
        error.set(400, codes::EXPIRY_IN_PAST, "Invite expiry is in the past");
        return false;
    }

    invite = GroupInvite();
    invite.id = crypto::generateUuid();
    invite.group_id = group_id;
    invite.created_by = caller;
    invite.type = request.type;
    invite.target_user_id = request.type == "direct" ? request.target_user_id : std::string();
    invite.expires_at = request.expires_at != 0
                            ? request.expires_at
                            : now + static_cast<int64_t>(policy_.invite_expiry_hours) * 3600 * 1000;
    invite.max_uses = request.max_uses ? static_cast<int>(*request.max_uses) : 0;
    invite.uses = 0;
    invite.created_at = now;

    bool ok = runTransaction(storage_, "createInvite", error, [&](Store& store) {
        Group group;
        if (!store.findGroup(group_id, group)) {
            error.set(404, "", "Group not found");
            return false;
        }
        if (group.is_closed) {
            error.set(403, "", "Group is closed");
            return false;
        }
        GroupParticipant self;
        if (!requireRole(store, group_id, caller, kManagers, self, error)) {
            return false;
        }
        for (int attempt = 0; attempt < kInviteCodeAttempts; ++attempt) {
            invite.code = crypto::generateInviteCode();
            if (store.insertInvite(invite)) {
                return true;
            }
            Logger::getInstance().debug("Invite code collision, retrying");
        }
        error.set(409, "", "Could not allocate a unique invite code");
        return false;
    });

    if (ok) {
        Logger::getInstance().info("Invite " + invite.id + " (" + invite.type + ") created for group " + group_id);
    }
    return ok;
}

bool GroupDirectory::listInvites(const std::string& caller, const std::string& group_id,
                                 std::vector<GroupInvite>& invites, ServiceError& error) {
    const int64_t now = clock_.nowMillis();
    invites.clear();
    return runTransaction(storage_, "listInvites", error, [&](Store& store) {
        Group group;
        if (!store.findGroup(group_id, group)) {
            error.set(404, "", "Group not found");
            return false;
        }
        GroupParticipant self;
        if (!requireRole(store, group_id, caller, kManagers, self, error)) {
            return false;
        }
        for (const auto& invite : store.listInvites(group_id)) {
            if (invite.expires_at > now && !invite.exhausted()) {
                invites.push_back(invite);
            }
        }
        return true;
    });
}

bool GroupDirectory::revokeInvite(const std::string& caller, const std::string& group_id,
                                  const std::string& invite_id, ServiceError& error) {
    return runTransaction(storage_, "revokeInvite", error, [&](Store& store) {
        Group group;
        if (!store.findGroup(group_id, group)) {
            error.set(404, "", "Group not found");
            return false;
        }
        GroupParticipant self;
        if (!requireRole(store, group_id, caller, kManagers, self, error)) {
            return false;
        }
        if (!store.deleteInvite(group_id, invite_id)) {
            error.set(404, "", "Invite not found");
            return false;
        }
        return true;
    });
}

bool GroupDirectory::joinByCode(const std::string& caller, const std::string& code, std::string& group_id,
                                MembershipChange& change, ServiceError& error) {
    if (code.empty()) {
        error.set(400, "", "code is required");
        return false;
    }
    const int64_t now = clock_.nowMillis();
    std::vector<std::string> recipients;
    change = MembershipChange();

    bool ok = runTransaction(storage_, "joinByCode", error, [&](Store& store) {
        GroupInvite invite;
        if (!store.findInviteByCode(code, invite)) {
            error.set(404, "", "Invalid invite code");
            return false;
        }
        if (invite.expires_at != 0 && invite.expires_at < now) {
            error.set(410, codes::GONE, "GONE");
            return false;
        }
        if (invite.exhausted()) {
            error.set(409, codes::MAX_USES, "MAX_USES");
            return false;
        }
        group_id = invite.group_id;

        Group group;
        if (!lockGroup(store, group_id, group, error)) {
            return false;
        }
        if (group.is_closed) {
            error.set(403, "", "Group is closed");
            return false;
        }
        GroupBan ban;
        GroupParticipant existing;
        bool has_row = store.findGroupParticipant(group_id, caller, existing);
        if (store.findGroupBan(group_id, caller, ban) || (has_row && existing.is_banned)) {
            error.set(403, codes::BANNED, "BANNED");
            return false;
        }
        change.new_epoch = group.group_epoch;
        if (has_row) {
            return true;
        }
        if (store.countActiveGroupParticipants(group_id) >= group.max_participants) {
            error.set(409, codes::GROUP_FULL, "GROUP_FULL");
            error.context["max_participants"] = std::to_string(group.max_participants);
            return false;
        }
        if (invite.type == "direct" && invite.target_user_id != caller) {
            error.set(403, codes::NOT_INVITED, "NOT_INVITED");
            return false;
        }

        GroupParticipant participant;
        participant.group_id = group_id;
        participant.user_id = caller;
        participant.role = "member";
        participant.joined_at = now;
        store.upsertGroupParticipant(participant);
        store.incrementInviteUses(invite.id);
        change.added_user_ids.push_back(caller);
        change.new_epoch = bumpEpoch(store, group, "invite_join", now, recipients);
        change.epoch_changed = true;
        return true;
    });

    if (ok && change.epoch_changed) {
        Logger::getInstance().info("User " + caller + " joined group " + group_id + " by invite");
        broadcastEpoch(group_id, change.new_epoch, recipients);
    }
    return ok;
}

} // namespace sealgate
