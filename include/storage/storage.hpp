#ifndef STORAGE_HPP
#define STORAGE_HPP

#include <string>
#include <vector>
#include <functional>
#include <cstdint>
#include "records.hpp"

namespace sealgate {

/**
 * Row-level operations available inside one storage transaction.
 *
 * A Store is only valid for the duration of the Storage::transact callback that
 * received it. Methods throw StorageError on infrastructure failure; "not found"
 * and "lost a uniqueness race" are reported through return values.
 */
class Store {
public:
    virtual ~Store() = default;

    // ========== USERS & BLOCKS ==========
    virtual bool findUser(const std::string& user_id, User& out) = 0;
    virtual void upsertUser(const User& user) = 0;
    virtual bool isBlocked(const std::string& blocker_id, const std::string& blocked_id) = 0;
    // false when the block already exists
    virtual bool insertBlock(const BlockEntry& entry) = 0;
    virtual bool deleteBlock(const std::string& blocker_id, const std::string& blocked_id) = 0;
    virtual std::vector<BlockEntry> listBlocks(const std::string& blocker_id) = 0;
    virtual bool shareConversation(const std::string& user_a, const std::string& user_b) = 0;
    // Both users are active (non-banned) members of at least one common group.
    virtual bool shareActiveGroup(const std::string& user_a, const std::string& user_b) = 0;

    // ========== DEVICES ==========
    // for_update locks the device row until commit.
    virtual bool findDevice(const std::string& device_id, Device& out, bool for_update = false) = 0;
    virtual void insertDevice(const Device& device) = 0;
    virtual void touchDevice(const std::string& device_id, const std::string& display_name, int64_t seen_at) = 0;
    virtual void markDeviceRevoked(const std::string& device_id) = 0;
    virtual void insertRevocation(const DeviceRevocation& revocation) = 0;
    virtual std::vector<Device> listDevices(const std::string& user_id) = 0;
    virtual std::vector<std::string> activeDeviceIds(const std::string& user_id) = 0;

    // ========== KEY BUNDLES & PREKEYS ==========
    virtual bool findBundle(const std::string& device_id, KeyBundle& out) = 0;
    // Inserts or replaces the bundle of bundle.device_id.
    virtual void saveBundle(const KeyBundle& bundle) = 0;
    virtual void setPrekeysRemaining(const std::string& device_id, int remaining) = 0;
    virtual int deleteUnclaimedPrekeys(const std::string& device_id) = 0;
    // Returns the assigned ids in input order.
    virtual std::vector<int64_t> insertPrekeys(const std::string& device_id,
                                               const std::vector<std::string>& prekey_pubs) = 0;
    virtual int countUnclaimedPrekeys(const std::string& device_id) = 0;
    // Conditional flip claimed=false -> true. Returns false when the prekey does not
    // exist for this device or was already claimed.
    virtual bool claimPrekey(const std::string& device_id, int64_t prekey_id, int64_t claimed_at,
                             OneTimePrekey& out) = 0;
    virtual void insertIdentityChangeEvent(const IdentityChangeEvent& event) = 0;
    virtual int countIdentityChangeEvents(const std::string& device_id, const std::string& reason,
                                          int64_t since) = 0;

    // ========== CONVERSATIONS ==========
    virtual bool findConversation(const std::string& conversation_id, Conversation& out) = 0;
    virtual bool findConversationByPairKey(const std::string& pair_key, Conversation& out) = 0;
    // Rows created before pair keys were populated.
    virtual bool findConversationByMembers(const std::string& user_a, const std::string& user_b,
                                           Conversation& out) = 0;
    // false when the pair key is already taken
    virtual bool insertConversation(const Conversation& conversation) = 0;
    virtual void insertParticipant(const Participant& participant) = 0;
    virtual std::vector<Participant> listParticipants(const std::string& conversation_id) = 0;
    virtual void updateParticipantDevices(const std::string& conversation_id, const std::string& user_id,
                                          const std::vector<std::string>& device_ids) = 0;
    virtual void touchConversation(const std::string& conversation_id, int64_t last_message_at) = 0;
    // Newest activity first.
    virtual std::vector<ConversationSummary> listConversations(const std::string& user_id,
                                                               int limit, int offset) = 0;

    // ========== GROUPS ==========
    virtual void insertGroup(const Group& group) = 0;
    // for_update holds a row lock on the group until commit; every membership
    // mutation takes it before reading capacity or the epoch.
    virtual bool findGroup(const std::string& group_id, Group& out, bool for_update = false) = 0;
    virtual void updateGroup(const Group& group) = 0;
    virtual std::vector<Group> listGroupsForUser(const std::string& user_id) = 0;
    virtual bool findGroupParticipant(const std::string& group_id, const std::string& user_id,
                                      GroupParticipant& out) = 0;
    virtual void upsertGroupParticipant(const GroupParticipant& participant) = 0;
    virtual bool deleteGroupParticipant(const std::string& group_id, const std::string& user_id) = 0;
    virtual int countActiveGroupParticipants(const std::string& group_id) = 0;
    virtual std::vector<GroupParticipant> listActiveGroupParticipants(const std::string& group_id) = 0;
    virtual bool findGroupBan(const std::string& group_id, const std::string& user_id, GroupBan& out) = 0;
    virtual void upsertGroupBan(const GroupBan& ban) = 0;
    virtual bool deleteGroupBan(const std::string& group_id, const std::string& user_id) = 0;
    virtual void insertEpochChange(const std::string& group_id, int64_t new_epoch,
                                   const std::string& reason, int64_t changed_at) = 0;

    // false when the code is already taken
    virtual bool insertInvite(const GroupInvite& invite) = 0;
    virtual bool findInviteByCode(const std::string& code, GroupInvite& out) = 0;
    virtual std::vector<GroupInvite> listInvites(const std::string& group_id) = 0;
    virtual void incrementInviteUses(const std::string& invite_id) = 0;
    virtual bool deleteInvite(const std::string& group_id, const std::string& invite_id) = 0;

    // ========== MESSAGES & RECEIPTS ==========
    virtual bool findMessage(MessageKind kind, const std::string& message_id, Message& out) = 0;
    virtual bool findMessageByClientId(MessageKind kind, const std::string& target_id,
                                       const std::string& sender_user_id,
                                       const std::string& client_message_id, Message& out) = 0;
    // Assigns message.seq. false when (kind, target, sender, client_message_id)
    // already exists.
    virtual bool insertMessage(Message& message) = 0;
    // Sends by `sender_user_id` since `since`; an empty target counts every target of the kind.
    virtual WindowUsage senderWindowUsage(MessageKind kind, const std::string& sender_user_id,
                                          const std::string& target_id, int64_t since) = 0;
    // Chronological page. before_seq > 0 returns the newest messages older than it,
    // after_seq > 0 returns the oldest messages newer than it, neither returns the latest page.
    virtual std::vector<Message> listMessages(MessageKind kind, const std::string& target_id, int limit,
                                              int64_t before_seq, int64_t after_seq) = 0;
    virtual void insertReceipt(const DeliveryReceipt& receipt) = 0;
    virtual bool findReceipt(MessageKind kind, const std::string& message_id,
                             const std::string& recipient_user_id, DeliveryReceipt& out) = 0;
    virtual void updateReceipt(const DeliveryReceipt& receipt) = 0;

    // ========== METRICS ==========
    virtual PrekeyPoolStats prekeyPoolStats(int low_watermark, int critical_watermark, size_t sample_limit) = 0;
    virtual int64_t countBundlesUpdatedBefore(int64_t cutoff) = 0;
    virtual int64_t countMessagesSince(MessageKind kind, int64_t since) = 0;
    virtual DeliveryStats deliveryStats(int64_t latency_since) = 0;
    virtual DeviceCounts deviceCounts() = 0;
    virtual GroupCounts groupCounts(int64_t epoch_changes_since) = 0;
};

/**
 * Transactional storage seam shared by every component.
 *
 * transact() runs `work` inside one transaction. The transaction commits when
 * `work` returns true and rolls back when it returns false or throws; a thrown
 * exception is rethrown after rollback.
 */
class Storage {
public:
    virtual ~Storage() = default;

    virtual bool initialize() = 0;
    virtual bool transact(const std::function<bool(Store&)>& work) = 0;
};

} // namespace sealgate

#endif // STORAGE_HPP
