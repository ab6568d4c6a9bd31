#ifndef RECORDS_HPP
#define RECORDS_HPP

#include <string>
#include <vector>
#include <cstdint>

namespace sealgate {

// All timestamps are milliseconds since the Unix epoch; 0 means "unset".

struct User {
    std::string id;
    std::string username;
    int64_t created_at = 0;
};

struct BlockEntry {
    std::string blocker_id;
    std::string blocked_id;
    int64_t created_at = 0;
};

struct Device {
    std::string id;
    std::string owner_user_id;
    std::string display_name;
    std::string status;            // "active" | "revoked"
    int64_t created_at = 0;
    int64_t last_seen_at = 0;

    bool isRevoked() const { return status == "revoked"; }
};

struct KeyBundle {
    std::string device_id;
    std::string identity_key_pub;
    std::string signed_prekey_pub;
    std::string signed_prekey_sig;
    int64_t bundle_version = 0;
    int prekeys_remaining = 0;
    int64_t updated_at = 0;
};

struct OneTimePrekey {
    int64_t id = 0;
    std::string device_id;
    std::string prekey_pub;
    bool claimed = false;
    int64_t claimed_at = 0;
};

struct IdentityChangeEvent {
    std::string user_id;
    std::string device_id;
    std::string reason;            // "identity_change" | "identity_change_block"
    int64_t created_at = 0;
};

struct DeviceRevocation {
    std::string user_id;
    std::string device_id;
    std::string reason;
    int64_t revoked_at = 0;
};

struct Conversation {
    std::string id;
    std::string pair_key;
    int64_t created_at = 0;
    int64_t last_message_at = 0;
};

struct Participant {
    std::string conversation_id;
    std::string user_id;
    std::vector<std::string> device_ids;
};

struct ConversationSummary {
    std::string conversation_id;
    std::string peer_user_id;
    std::string peer_username;
    int64_t created_at = 0;
    int64_t last_message_at = 0;
    int unread_count = 0;
};

enum class MessageKind {
    Direct,
    Group
};

struct Message {
    std::string id;
    int64_t seq = 0;               // storage-assigned insertion order, used as page cursor
    MessageKind kind = MessageKind::Direct;
    std::string target_id;         // conversation id or group id
    std::string sender_user_id;
    std::string sender_device_id;
    std::string ciphertext;        // base64 text, opaque to the server
    int proto = 0;
    int64_t created_at = 0;
    std::string client_message_id;
    int64_t group_epoch = 0;
    std::string reply_to_message_id;
};

struct DeliveryReceipt {
    std::string message_id;
    MessageKind kind = MessageKind::Direct;
    std::string recipient_user_id;
    int64_t delivered_at = 0;
    int64_t read_at = 0;
};

struct Group {
    std::string id;
    std::string title;
    std::string about;
    std::string created_by;
    int max_participants = 0;
    int64_t group_epoch = 0;
    bool is_closed = false;
    int64_t created_at = 0;
    int64_t updated_at = 0;
};

struct GroupParticipant {
    std::string group_id;
    std::string user_id;
    std::string role;              // "owner" | "admin" | "member"
    bool is_banned = false;
    int64_t joined_at = 0;
    int64_t mute_until = 0;
};

struct GroupBan {
    std::string group_id;
    std::string user_id;
    std::string banned_by;
    std::string reason;
    int64_t banned_at = 0;
};

struct GroupInvite {
    std::string id;
    std::string group_id;
    std::string created_by;
    std::string type;              // "link" | "direct"
    std::string code;
    int64_t expires_at = 0;
    int max_uses = 0;              // 0 = unlimited
    int uses = 0;
    std::string target_user_id;
    int64_t created_at = 0;

    bool exhausted() const { return max_uses > 0 && uses >= max_uses; }
};

// Count and oldest timestamp of a sender's messages inside a window.
struct WindowUsage {
    int count = 0;
    int64_t oldest_at = 0;
};

struct PrekeyPoolStats {
    int64_t total_available = 0;
    int64_t total_claimed = 0;
    int64_t low_devices = 0;       // critical <= available < low
    int64_t critical_devices = 0;  // available < critical
    std::vector<std::string> low_device_ids;
    std::vector<std::string> critical_device_ids;
};

struct DeliveryStats {
    int64_t undelivered = 0;
    int64_t delivered_unread = 0;
    double avg_delivery_ms = 0.0;
};

struct DeviceCounts {
    int64_t total = 0;
    int64_t active = 0;
    int64_t revoked = 0;
};

struct GroupCounts {
    int64_t total = 0;
    int64_t active = 0;
    int64_t closed = 0;
    int64_t epoch_changes = 0;
};

} // namespace sealgate

#endif // RECORDS_HPP
