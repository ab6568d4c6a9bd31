#ifndef GROUP_DIRECTORY_HPP
#define GROUP_DIRECTORY_HPP

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include "../config/config.hpp"
#include "../storage/storage.hpp"
#include "../messaging/event_publisher.hpp"
#include "../utils/clock.hpp"
#include "../utils/service_error.hpp"

namespace sealgate {

struct GroupView {
    Group group;
    std::string my_role;
    int participant_count = 0;
};

// Result of a membership mutation. new_epoch is the epoch after the call.
struct MembershipChange {
    std::vector<std::string> added_user_ids;
    int64_t new_epoch = 0;
    bool epoch_changed = false;
};

struct CreateInviteRequest {
    std::string type = "link";
    std::string target_user_id;
    int64_t expires_at = 0;        // 0: use the configured default
    std::optional<int64_t> max_uses;
};

/**
 * Groups, roles, bans, invites and the per-group epoch.
 *
 * Every membership mutation reads the group row under a lock before looking at
 * capacity or the epoch, so concurrent changes on one group serialize. The
 * epoch moves by exactly one for add, join, remove, leave and ban; promote,
 * demote, unban and mute leave it alone. epoch_changed events are published
 * only after the mutation has committed.
 */
class GroupDirectory {
public:
    GroupDirectory(Storage& storage, const Clock& clock, const GroupPolicy& policy,
                   EventPublisher* publisher = nullptr);

    bool createGroup(const std::string& caller, const std::string& title, const std::string& about,
                     GroupView& view, ServiceError& error);
    bool listGroups(const std::string& caller, std::vector<GroupView>& groups, ServiceError& error);
    bool getGroup(const std::string& caller, const std::string& group_id, GroupView& view, ServiceError& error);
    bool updateGroup(const std::string& caller, const std::string& group_id,
                     const std::optional<std::string>& title, const std::optional<std::string>& about,
                     GroupView& view, ServiceError& error);
    // Owner only; closing twice succeeds.
    bool closeGroup(const std::string& caller, const std::string& group_id, ServiceError& error);

    bool listMembers(const std::string& caller, const std::string& group_id,
                     std::vector<GroupParticipant>& members, ServiceError& error);
    bool addMembers(const std::string& caller, const std::string& group_id, const std::vector<std::string>& user_ids,
                    MembershipChange& change, ServiceError& error);
    bool removeMember(const std::string& caller, const std::string& group_id, const std::string& user_id,
                      MembershipChange& change, ServiceError& error);
    bool leave(const std::string& caller, const std::string& group_id, MembershipChange& change,
               ServiceError& error);
    bool promote(const std::string& caller, const std::string& group_id, const std::string& user_id,
                 ServiceError& error);
    bool demote(const std::string& caller, const std::string& group_id, const std::string& user_id,
                ServiceError& error);
    bool ban(const std::string& caller, const std::string& group_id, const std::string& user_id,
             const std::string& reason, MembershipChange& change, ServiceError& error);
    bool unban(const std::string& caller, const std::string& group_id, const std::string& user_id,
               ServiceError& error);
    // mute_until 0 clears the mute.
    bool mute(const std::string& caller, const std::string& group_id, int64_t mute_until, ServiceError& error);

    bool createInvite(const std::string& caller, const std::string& group_id, const CreateInviteRequest& request,
                      GroupInvite& invite, ServiceError& error);
    // Unexpired invites that still have uses left.
    bool listInvites(const std::string& caller, const std::string& group_id, std::vector<GroupInvite>& invites,
                     ServiceError& error);
    bool revokeInvite(const std::string& caller, const std::string& group_id, const std::string& invite_id,
                      ServiceError& error);
    bool joinByCode(const std::string& caller, const std::string& code, std::string& group_id,
                    MembershipChange& change, ServiceError& error);

    static bool isActiveMember(Store& store, const std::string& group_id, const std::string& user_id,
                               GroupParticipant& participant);

private:
    // Loads and locks the group; 404 when it does not exist.
    bool lockGroup(Store& store, const std::string& group_id, Group& group, ServiceError& error);
    // 403 NOT_MEMBER when the caller is absent or banned, 403 FORBIDDEN when
    // the caller's role is not in `roles` (empty: any role).
    bool requireRole(Store& store, const std::string& group_id, const std::string& caller,
                     const std::vector<std::string>& roles, GroupParticipant& participant, ServiceError& error);
    // Increments the epoch once, records the change and collects the active
    // members that must hear about it.
    int64_t bumpEpoch(Store& store, Group& group, const std::string& reason, int64_t now,
                      std::vector<std::string>& recipients);
    void broadcastEpoch(const std::string& group_id, int64_t new_epoch, const std::vector<std::string>& recipients);

    Storage& storage_;
    const Clock& clock_;
    GroupPolicy policy_;
    EventPublisher* publisher_;
};

} // namespace sealgate

#endif // GROUP_DIRECTORY_HPP
