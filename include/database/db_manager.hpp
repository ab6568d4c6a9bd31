#ifndef DB_MANAGER_HPP
#define DB_MANAGER_HPP

#include <string>
#include <vector>
#include <memory>
#include "connection_pool.hpp"
#include "../storage/storage.hpp"

namespace sealgate {

/**
 * PostgreSQL storage backend.
 *
 * initialize() creates the schema idempotently and opens the connection pool,
 * preparing every statement on each pooled connection. transact() leases one
 * connection and wraps the callback in BEGIN / COMMIT (ROLLBACK on false or throw).
 */
class DatabaseManager : public Storage {
public:
    DatabaseManager(const std::string& host,
                    const std::string& port,
                    const std::string& dbname,
                    const std::string& user,
                    const std::string& password,
                    int pool_size);

    bool initialize() override;
    bool transact(const std::function<bool(Store&)>& work) override;

private:
    bool createSchema(DatabaseConnection& conn);
    static bool prepareStatements(DatabaseConnection& conn);

    std::string host_;
    std::string port_;
    std::string dbname_;
    std::string user_;
    std::string password_;
    std::unique_ptr<ConnectionPool> pool_;
};

// Store over one leased connection inside an open transaction.
class PgStore : public Store {
public:
    explicit PgStore(DatabaseConnection& conn) : conn_(conn) {}

    // Statement registration, one per area.
    static bool prepareUserStatements(DatabaseConnection& conn);
    static bool prepareKeyStatements(DatabaseConnection& conn);
    static bool prepareConversationStatements(DatabaseConnection& conn);
    static bool prepareGroupStatements(DatabaseConnection& conn);
    static bool prepareMessageStatements(DatabaseConnection& conn);
    static bool prepareMetricsStatements(DatabaseConnection& conn);

    // ========== USERS & BLOCKS ==========
    bool findUser(const std::string& user_id, User& out) override;
    void upsertUser(const User& user) override;
    bool isBlocked(const std::string& blocker_id, const std::string& blocked_id) override;
    bool insertBlock(const BlockEntry& entry) override;
    bool deleteBlock(const std::string& blocker_id, const std::string& blocked_id) override;
    std::vector<BlockEntry> listBlocks(const std::string& blocker_id) override;
    bool shareConversation(const std::string& user_a, const std::string& user_b) override;
    bool shareActiveGroup(const std::string& user_a, const std::string& user_b) override;

    // ========== DEVICES ==========
    bool findDevice(const std::string& device_id, Device& out, bool for_update = false) override;
    void insertDevice(const Device& device) override;
    void touchDevice(const std::string& device_id, const std::string& display_name, int64_t seen_at) override;
    void markDeviceRevoked(const std::string& device_id) override;
    void insertRevocation(const DeviceRevocation& revocation) override;
    std::vector<Device> listDevices(const std::string& user_id) override;
    std::vector<std::string> activeDeviceIds(const std::string& user_id) override;

    // ========== KEY BUNDLES & PREKEYS ==========
    bool findBundle(const std::string& device_id, KeyBundle& out) override;
    void saveBundle(const KeyBundle& bundle) override;
    void setPrekeysRemaining(const std::string& device_id, int remaining) override;
    int deleteUnclaimedPrekeys(const std::string& device_id) override;
    std::vector<int64_t> insertPrekeys(const std::string& device_id,
                                       const std::vector<std::string>& prekey_pubs) override;
    int countUnclaimedPrekeys(const std::string& device_id) override;
    bool claimPrekey(const std::string& device_id, int64_t prekey_id, int64_t claimed_at,
                     OneTimePrekey& out) override;
    void insertIdentityChangeEvent(const IdentityChangeEvent& event) override;
    int countIdentityChangeEvents(const std::string& device_id, const std::string& reason,
                                  int64_t since) override;

    // ========== CONVERSATIONS ==========
    bool findConversation(const std::string& conversation_id, Conversation& out) override;
    bool findConversationByPairKey(const std::string& pair_key, Conversation& out) override;
    bool findConversationByMembers(const std::string& user_a, const std::string& user_b,
                                   Conversation& out) override;
    bool insertConversation(const Conversation& conversation) override;
    void insertParticipant(const Participant& participant) override;
    std::vector<Participant> listParticipants(const std::string& conversation_id) override;
    void updateParticipantDevices(const std::string& conversation_id, const std::string& user_id,
                                  const std::vector<std::string>& device_ids) override;
    void touchConversation(const std::string& conversation_id, int64_t last_message_at) override;
    std::vector<ConversationSummary> listConversations(const std::string& user_id,
                                                       int limit, int offset) override;

    // ========== GROUPS ==========
    void insertGroup(const Group& group) override;
    bool findGroup(const std::string& group_id, Group& out, bool for_update = false) override;
    void updateGroup(const Group& group) override;
    std::vector<Group> listGroupsForUser(const std::string& user_id) override;
    bool findGroupParticipant(const std::string& group_id, const std::string& user_id,
                              GroupParticipant& out) override;
    void upsertGroupParticipant(const GroupParticipant& participant) override;
    bool deleteGroupParticipant(const std::string& group_id, const std::string& user_id) override;
    int countActiveGroupParticipants(const std::string& group_id) override;
    std::vector<GroupParticipant> listActiveGroupParticipants(const std::string& group_id) override;
    bool findGroupBan(const std::string& group_id, const std::string& user_id, GroupBan& out) override;
    void upsertGroupBan(const GroupBan& ban) override;
    bool deleteGroupBan(const std::string& group_id, const std::string& user_id) override;
    void insertEpochChange(const std::string& group_id, int64_t new_epoch,
                           const std::string& reason, int64_t changed_at) override;
    bool insertInvite(const GroupInvite& invite) override;
    bool findInviteByCode(const std::string& code, GroupInvite& out) override;
    std::vector<GroupInvite> listInvites(const std::string& group_id) override;
    void incrementInviteUses(const std::string& invite_id) override;
    bool deleteInvite(const std::string& group_id, const std::string& invite_id) override;

    // ========== MESSAGES & RECEIPTS ==========
    bool findMessage(MessageKind kind, const std::string& message_id, Message& out) override;
    bool findMessageByClientId(MessageKind kind, const std::string& target_id,
                               const std::string& sender_user_id,
                               const std::string& client_message_id, Message& out) override;
    bool insertMessage(Message& message) override;
    WindowUsage senderWindowUsage(MessageKind kind, const std::string& sender_user_id,
                                  const std::string& target_id, int64_t since) override;
    std::vector<Message> listMessages(MessageKind kind, const std::string& target_id, int limit,
                                      int64_t before_seq, int64_t after_seq) override;
    void insertReceipt(const DeliveryReceipt& receipt) override;
    bool findReceipt(MessageKind kind, const std::string& message_id,
                     const std::string& recipient_user_id, DeliveryReceipt& out) override;
    void updateReceipt(const DeliveryReceipt& receipt) override;

    // ========== METRICS ==========
    PrekeyPoolStats prekeyPoolStats(int low_watermark, int critical_watermark, size_t sample_limit) override;
    int64_t countBundlesUpdatedBefore(int64_t cutoff) override;
    int64_t countMessagesSince(MessageKind kind, int64_t since) override;
    DeliveryStats deliveryStats(int64_t latency_since) override;
    DeviceCounts deviceCounts() override;
    GroupCounts groupCounts(int64_t epoch_changes_since) override;

private:
    // Runs a prepared statement; throws StorageError when it fails.
    PgResult exec(const std::string& stmt_name, const PgParams& params);

    static const char* kindName(MessageKind kind);
    static std::vector<std::string> splitList(const std::string& joined);

    DatabaseConnection& conn_;
};

// SQL fragments shared by the statement definitions.
namespace sql {
// Epoch milliseconds of a TIMESTAMPTZ column, NULL-preserving.
std::string millis(const std::string& column);
// TIMESTAMPTZ from a bigint epoch-milliseconds parameter such as "$3".
std::string timestamp(const std::string& param);
} // namespace sql

} // namespace sealgate

#endif // DB_MANAGER_HPP
