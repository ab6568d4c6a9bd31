#include "../../include/storage/in_memory_storage.hpp"
#include "../../include/utils/logger.hpp"
#include "../../include/utils/service_error.hpp"
#include <algorithm>
#include <set>

namespace sealgate {

namespace {

class MemoryStore : public Store {
public:
    explicit MemoryStore(InMemoryStorage::State& state) : s_(state) {}

    // ========== USERS & BLOCKS ==========

    bool findUser(const std::string& user_id, User& out) override {
        auto it = s_.users.find(user_id);
        if (it == s_.users.end()) {
            return false;
        }
        out = it->second;
        return true;
    }

    void upsertUser(const User& user) override {
        auto it = s_.users.find(user.id);
        if (it == s_.users.end()) {
            s_.users[user.id] = user;
        } else if (!user.username.empty()) {
            it->second.username = user.username;
        }
    }

    bool isBlocked(const std::string& blocker_id, const std::string& blocked_id) override {
        return s_.blocks.count({blocker_id, blocked_id}) > 0;
    }

    bool insertBlock(const BlockEntry& entry) override {
        return s_.blocks.emplace(std::make_pair(entry.blocker_id, entry.blocked_id), entry).second;
    }

    bool deleteBlock(const std::string& blocker_id, const std::string& blocked_id) override {
        return s_.blocks.erase({blocker_id, blocked_id}) > 0;
    }

    std::vector<BlockEntry> listBlocks(const std::string& blocker_id) override {
        std::vector<BlockEntry> result;
        for (const auto& entry : s_.blocks) {
            if (entry.first.first == blocker_id) {
                result.push_back(entry.second);
            }
        }
        std::sort(result.begin(), result.end(), [](const BlockEntry& a, const BlockEntry& b) {
            return a.created_at > b.created_at;
        });
        return result;
    }

    bool shareConversation(const std::string& user_a, const std::string& user_b) override {
        std::set<std::string> conversations_a;
        for (const auto& p : s_.participants) {
            if (p.user_id == user_a) {
                conversations_a.insert(p.conversation_id);
            }
        }
        for (const auto& p : s_.participants) {
            if (p.user_id == user_b && conversations_a.count(p.conversation_id)) {
                return true;
            }
        }
        return false;
    }

    bool shareActiveGroup(const std::string& user_a, const std::string& user_b) override {
        for (const auto& entry : s_.group_participants) {
            const GroupParticipant& a = entry.second;
            if (a.user_id != user_a || a.is_banned) {
                continue;
            }
            auto other = s_.group_participants.find({a.group_id, user_b});
            if (other != s_.group_participants.end() && !other->second.is_banned) {
                return true;
            }
        }
        return false;
    }

    // ========== DEVICES ==========

    bool findDevice(const std::string& device_id, Device& out, bool) override {
        auto it = s_.devices.find(device_id);
        if (it == s_.devices.end()) {
            return false;
        }
        out = it->second;
        return true;
    }

    void insertDevice(const Device& device) override {
        s_.devices[device.id] = device;
    }

    void touchDevice(const std::string& device_id, const std::string& display_name, int64_t seen_at) override {
        auto it = s_.devices.find(device_id);
        if (it != s_.devices.end()) {
            if (!display_name.empty()) {
                it->second.display_name = display_name;
            }
            it->second.last_seen_at = seen_at;
        }
    }

    void markDeviceRevoked(const std::string& device_id) override {
        auto it = s_.devices.find(device_id);
        if (it != s_.devices.end()) {
            it->second.status = "revoked";
        }
    }

    void insertRevocation(const DeviceRevocation& revocation) override {
        s_.revocations.push_back(revocation);
    }

    std::vector<Device> listDevices(const std::string& user_id) override {
        std::vector<Device> result;
        for (const auto& entry : s_.devices) {
            if (entry.second.owner_user_id == user_id) {
                result.push_back(entry.second);
            }
        }
        std::sort(result.begin(), result.end(), [](const Device& a, const Device& b) {
            return a.created_at < b.created_at;
        });
        return result;
    }

    std::vector<std::string> activeDeviceIds(const std::string& user_id) override {
        std::vector<std::string> ids;
        for (const auto& device : listDevices(user_id)) {
            if (!device.isRevoked()) {
                ids.push_back(device.id);
            }
        }
        return ids;
    }

    // ========== KEY BUNDLES & PREKEYS ==========

    bool findBundle(const std::string& device_id, KeyBundle& out) override {
        auto it = s_.bundles.find(device_id);
        if (it == s_.bundles.end()) {
            return false;
        }
        out = it->second;
        return true;
    }

    void saveBundle(const KeyBundle& bundle) override {
        s_.bundles[bundle.device_id] = bundle;
    }

    void setPrekeysRemaining(const std::string& device_id, int remaining) override {
        auto it = s_.bundles.find(device_id);
        if (it != s_.bundles.end()) {
            it->second.prekeys_remaining = remaining;
        }
    }

    int deleteUnclaimedPrekeys(const std::string& device_id) override {
        int removed = 0;
        for (auto it = s_.prekeys.begin(); it != s_.prekeys.end();) {
            if (it->second.device_id == device_id && !it->second.claimed) {
                it = s_.prekeys.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    std::vector<int64_t> insertPrekeys(const std::string& device_id,
                                       const std::vector<std::string>& prekey_pubs) override {
        std::vector<int64_t> ids;
        ids.reserve(prekey_pubs.size());
        for (const auto& pub : prekey_pubs) {
            OneTimePrekey prekey;
            prekey.id = s_.next_prekey_id++;
            prekey.device_id = device_id;
            prekey.prekey_pub = pub;
            s_.prekeys[prekey.id] = prekey;
            ids.push_back(prekey.id);
        }
        return ids;
    }

    int countUnclaimedPrekeys(const std::string& device_id) override {
        int count = 0;
        for (const auto& entry : s_.prekeys) {
            if (entry.second.device_id == device_id && !entry.second.claimed) {
                ++count;
            }
        }
        return count;
    }

    bool claimPrekey(const std::string& device_id, int64_t prekey_id, int64_t claimed_at,
                     OneTimePrekey& out) override {
        auto it = s_.prekeys.find(prekey_id);
        if (it == s_.prekeys.end() || it->second.device_id != device_id || it->second.claimed) {
            return false;
        }
        it->second.claimed = true;
        it->second.claimed_at = claimed_at;
        out = it->second;
        return true;
    }

    void insertIdentityChangeEvent(const IdentityChangeEvent& event) override {
        s_.identity_events.push_back(event);
    }

    int countIdentityChangeEvents(const std::string& device_id, const std::string& reason,
                                  int64_t since) override {
        int count = 0;
        for (const auto& event : s_.identity_events) {
            if (event.device_id == device_id && event.reason == reason && event.created_at >= since) {
                ++count;
            }
        }
        return count;
    }

    // ========== CONVERSATIONS ==========

    bool findConversation(const std::string& conversation_id, Conversation& out) override {
        auto it = s_.conversations.find(conversation_id);
        if (it == s_.conversations.end()) {
            return false;
        }
        out = it->second;
        return true;
    }

    bool findConversationByPairKey(const std::string& pair_key, Conversation& out) override {
        for (const auto& entry : s_.conversations) {
            if (!pair_key.empty() && entry.second.pair_key == pair_key) {
                out = entry.second;
                return true;
            }
        }
        return false;
    }

    bool findConversationByMembers(const std::string& user_a, const std::string& user_b,
                                   Conversation& out) override {
        for (const auto& entry : s_.conversations) {
            bool has_a = false;
            bool has_b = false;
            int members = 0;
            for (const auto& p : s_.participants) {
                if (p.conversation_id != entry.first) {
                    continue;
                }
                ++members;
                has_a = has_a || p.user_id == user_a;
                has_b = has_b || p.user_id == user_b;
            }
            if (members == 2 && has_a && has_b) {
                out = entry.second;
                return true;
            }
        }
        return false;
    }

    bool insertConversation(const Conversation& conversation) override {
        Conversation existing;
        if (!conversation.pair_key.empty() && findConversationByPairKey(conversation.pair_key, existing)) {
            return false;
        }
        s_.conversations[conversation.id] = conversation;
        return true;
    }

    void insertParticipant(const Participant& participant) override {
        for (const auto& p : s_.participants) {
            if (p.conversation_id == participant.conversation_id && p.user_id == participant.user_id) {
                throw StorageError("duplicate participant " + participant.user_id);
            }
        }
        s_.participants.push_back(participant);
    }

    std::vector<Participant> listParticipants(const std::string& conversation_id) override {
        std::vector<Participant> result;
        for (const auto& p : s_.participants) {
            if (p.conversation_id == conversation_id) {
                result.push_back(p);
            }
        }
        return result;
    }

    void updateParticipantDevices(const std::string& conversation_id, const std::string& user_id,
                                  const std::vector<std::string>& device_ids) override {
        for (auto& p : s_.participants) {
            if (p.conversation_id == conversation_id && p.user_id == user_id) {
                p.device_ids = device_ids;
            }
        }
    }

    void touchConversation(const std::string& conversation_id, int64_t last_message_at) override {
        auto it = s_.conversations.find(conversation_id);
        if (it != s_.conversations.end()) {
            it->second.last_message_at = last_message_at;
        }
    }

    std::vector<ConversationSummary> listConversations(const std::string& user_id, int limit,
                                                       int offset) override {
        std::vector<ConversationSummary> all;
        for (const auto& p : s_.participants) {
            if (p.user_id != user_id) {
                continue;
            }
            auto conv = s_.conversations.find(p.conversation_id);
            if (conv == s_.conversations.end()) {
                continue;
            }
            ConversationSummary summary;
            summary.conversation_id = conv->second.id;
            summary.created_at = conv->second.created_at;
            summary.last_message_at = conv->second.last_message_at;
            for (const auto& other : s_.participants) {
                if (other.conversation_id == p.conversation_id && other.user_id != user_id) {
                    summary.peer_user_id = other.user_id;
                }
            }
            auto peer = s_.users.find(summary.peer_user_id);
            if (peer != s_.users.end()) {
                summary.peer_username = peer->second.username;
            }
            for (const auto& entry : s_.messages) {
                const Message& m = entry.second;
                if (m.kind != MessageKind::Direct || m.target_id != summary.conversation_id ||
                    m.sender_user_id != summary.peer_user_id) {
                    continue;
                }
                auto receipt = s_.receipts.find({m.id, user_id});
                if (receipt != s_.receipts.end() && receipt->second.read_at == 0) {
                    ++summary.unread_count;
                }
            }
            all.push_back(summary);
        }
        std::sort(all.begin(), all.end(), [](const ConversationSummary& a, const ConversationSummary& b) {
            int64_t activity_a = a.last_message_at ? a.last_message_at : a.created_at;
            int64_t activity_b = b.last_message_at ? b.last_message_at : b.created_at;
            if (activity_a != activity_b) {
                return activity_a > activity_b;
            }
            return a.conversation_id < b.conversation_id;
        });
        std::vector<ConversationSummary> page;
        for (size_t i = static_cast<size_t>(std::max(offset, 0));
             i < all.size() && page.size() < static_cast<size_t>(limit); ++i) {
            page.push_back(all[i]);
        }
        return page;
    }

    // ========== GROUPS ==========

    void insertGroup(const Group& group) override {
        s_.groups[group.id] = group;
    }

    bool findGroup(const std::string& group_id, Group& out, bool) override {
        auto it = s_.groups.find(group_id);
        if (it == s_.groups.end()) {
            return false;
        }
        out = it->second;
        return true;
    }

    void updateGroup(const Group& group) override {
        auto it = s_.groups.find(group.id);
        if (it == s_.groups.end()) {
            throw StorageError("group " + group.id + " vanished during update");
        }
        it->second = group;
    }

    std::vector<Group> listGroupsForUser(const std::string& user_id) override {
        std::vector<Group> result;
        for (const auto& entry : s_.group_participants) {
            const GroupParticipant& p = entry.second;
            if (p.user_id != user_id || p.is_banned) {
                continue;
            }
            auto group = s_.groups.find(p.group_id);
            if (group != s_.groups.end()) {
                result.push_back(group->second);
            }
        }
        std::sort(result.begin(), result.end(), [](const Group& a, const Group& b) {
            return a.updated_at > b.updated_at;
        });
        return result;
    }

    bool findGroupParticipant(const std::string& group_id, const std::string& user_id,
                              GroupParticipant& out) override {
        auto it = s_.group_participants.find({group_id, user_id});
        if (it == s_.group_participants.end()) {
            return false;
        }
        out = it->second;
        return true;
    }

    void upsertGroupParticipant(const GroupParticipant& participant) override {
        s_.group_participants[{participant.group_id, participant.user_id}] = participant;
    }

    bool deleteGroupParticipant(const std::string& group_id, const std::string& user_id) override {
        return s_.group_participants.erase({group_id, user_id}) > 0;
    }

    int countActiveGroupParticipants(const std::string& group_id) override {
        return static_cast<int>(listActiveGroupParticipants(group_id).size());
    }

    std::vector<GroupParticipant> listActiveGroupParticipants(const std::string& group_id) override {
        std::vector<GroupParticipant> result;
        for (const auto& entry : s_.group_participants) {
            if (entry.first.first == group_id && !entry.second.is_banned) {
                result.push_back(entry.second);
            }
        }
        std::sort(result.begin(), result.end(), [](const GroupParticipant& a, const GroupParticipant& b) {
            return a.joined_at < b.joined_at;
        });
        return result;
    }

    bool findGroupBan(const std::string& group_id, const std::string& user_id, GroupBan& out) override {
        auto it = s_.group_bans.find({group_id, user_id});
        if (it == s_.group_bans.end()) {
            return false;
        }
        out = it->second;
        return true;
    }

    void upsertGroupBan(const GroupBan& ban) override {
        s_.group_bans[{ban.group_id, ban.user_id}] = ban;
    }

    bool deleteGroupBan(const std::string& group_id, const std::string& user_id) override {
        return s_.group_bans.erase({group_id, user_id}) > 0;
    }

    void insertEpochChange(const std::string& group_id, int64_t new_epoch, const std::string& reason,
                           int64_t changed_at) override {
        s_.epoch_changes.push_back({group_id, new_epoch, reason, changed_at});
    }

    bool insertInvite(const GroupInvite& invite) override {
        for (const auto& entry : s_.invites) {
            if (entry.second.code == invite.code) {
                return false;
            }
        }
        s_.invites[invite.id] = invite;
        return true;
    }

    bool findInviteByCode(const std::string& code, GroupInvite& out) override {
        for (const auto& entry : s_.invites) {
            if (entry.second.code == code) {
                out = entry.second;
                return true;
            }
        }
        return false;
    }

    std::vector<GroupInvite> listInvites(const std::string& group_id) override {
        std::vector<GroupInvite> result;
        for (const auto& entry : s_.invites) {
            if (entry.second.group_id == group_id) {
                result.push_back(entry.second);
            }
        }
        std::sort(result.begin(), result.end(), [](const GroupInvite& a, const GroupInvite& b) {
            return a.created_at > b.created_at;
        });
        return result;
    }

    void incrementInviteUses(const std::string& invite_id) override {
        auto it = s_.invites.find(invite_id);
        if (it != s_.invites.end()) {
            ++it->second.uses;
        }
    }

    bool deleteInvite(const std::string& group_id, const std::string& invite_id) override {
        auto it = s_.invites.find(invite_id);
        if (it == s_.invites.end() || it->second.group_id != group_id) {
            return false;
        }
        s_.invites.erase(it);
        return true;
    }

    // ========== MESSAGES & RECEIPTS ==========

    bool findMessage(MessageKind kind, const std::string& message_id, Message& out) override {
        auto it = s_.messages.find(message_id);
        if (it == s_.messages.end() || it->second.kind != kind) {
            return false;
        }
        out = it->second;
        return true;
    }

    bool findMessageByClientId(MessageKind kind, const std::string& target_id,
                               const std::string& sender_user_id, const std::string& client_message_id,
                               Message& out) override {
        for (const auto& entry : s_.messages) {
            const Message& m = entry.second;
            if (m.kind == kind && m.target_id == target_id && m.sender_user_id == sender_user_id &&
                !client_message_id.empty() && m.client_message_id == client_message_id) {
                out = m;
                return true;
            }
        }
        return false;
    }

    bool insertMessage(Message& message) override {
        Message existing;
        if (findMessageByClientId(message.kind, message.target_id, message.sender_user_id,
                                  message.client_message_id, existing)) {
            return false;
        }
        message.seq = s_.next_message_seq++;
        s_.messages[message.id] = message;
        return true;
    }

    WindowUsage senderWindowUsage(MessageKind kind, const std::string& sender_user_id,
                                  const std::string& target_id, int64_t since) override {
        WindowUsage usage;
        for (const auto& entry : s_.messages) {
            const Message& m = entry.second;
            if (m.kind != kind || m.sender_user_id != sender_user_id || m.created_at < since) {
                continue;
            }
            if (!target_id.empty() && m.target_id != target_id) {
                continue;
            }
            if (usage.count == 0 || m.created_at < usage.oldest_at) {
                usage.oldest_at = m.created_at;
            }
            ++usage.count;
        }
        return usage;
    }

    std::vector<Message> listMessages(MessageKind kind, const std::string& target_id, int limit,
                                      int64_t before_seq, int64_t after_seq) override {
        std::vector<Message> matching;
        for (const auto& entry : s_.messages) {
            const Message& m = entry.second;
            if (m.kind != kind || m.target_id != target_id) {
                continue;
            }
            if (after_seq > 0 && m.seq <= after_seq) {
                continue;
            }
            if (after_seq <= 0 && before_seq > 0 && m.seq >= before_seq) {
                continue;
            }
            matching.push_back(m);
        }
        std::sort(matching.begin(), matching.end(), [](const Message& a, const Message& b) {
            return a.seq < b.seq;
        });
        size_t count = std::min(matching.size(), static_cast<size_t>(std::max(limit, 0)));
        if (after_seq > 0) {
            return std::vector<Message>(matching.begin(), matching.begin() + count);
        }
        return std::vector<Message>(matching.end() - count, matching.end());
    }

    void insertReceipt(const DeliveryReceipt& receipt) override {
        s_.receipts[{receipt.message_id, receipt.recipient_user_id}] = receipt;
    }

    bool findReceipt(MessageKind kind, const std::string& message_id, const std::string& recipient_user_id,
                     DeliveryReceipt& out) override {
        auto it = s_.receipts.find({message_id, recipient_user_id});
        if (it == s_.receipts.end() || it->second.kind != kind) {
            return false;
        }
        out = it->second;
        return true;
    }

    void updateReceipt(const DeliveryReceipt& receipt) override {
        auto it = s_.receipts.find({receipt.message_id, receipt.recipient_user_id});
        if (it == s_.receipts.end()) {
            return;
        }
        if (it->second.delivered_at == 0) {
            it->second.delivered_at = receipt.delivered_at;
        }
        if (it->second.read_at == 0) {
            it->second.read_at = receipt.read_at;
        }
    }

    // ========== METRICS ==========

    PrekeyPoolStats prekeyPoolStats(int low_watermark, int critical_watermark, size_t sample_limit) override {
        std::map<std::string, std::pair<int64_t, int64_t>> per_device;   // available, claimed
        for (const auto& entry : s_.prekeys) {
            auto& counts = per_device[entry.second.device_id];
            if (entry.second.claimed) {
                ++counts.second;
            } else {
                ++counts.first;
            }
        }
        PrekeyPoolStats stats;
        for (const auto& entry : per_device) {
            stats.total_available += entry.second.first;
            stats.total_claimed += entry.second.second;
            if (entry.second.first < critical_watermark) {
                ++stats.critical_devices;
                if (stats.critical_device_ids.size() < sample_limit) {
                    stats.critical_device_ids.push_back(entry.first);
                }
            } else if (entry.second.first < low_watermark) {
                ++stats.low_devices;
                if (stats.low_device_ids.size() < sample_limit) {
                    stats.low_device_ids.push_back(entry.first);
                }
            }
        }
        return stats;
    }

    int64_t countBundlesUpdatedBefore(int64_t cutoff) override {
        int64_t count = 0;
        for (const auto& entry : s_.bundles) {
            if (entry.second.updated_at < cutoff) {
                ++count;
            }
        }
        return count;
    }

    int64_t countMessagesSince(MessageKind kind, int64_t since) override {
        int64_t count = 0;
        for (const auto& entry : s_.messages) {
            if (entry.second.kind == kind && entry.second.created_at >= since) {
                ++count;
            }
        }
        return count;
    }

    DeliveryStats deliveryStats(int64_t latency_since) override {
        DeliveryStats stats;
        int64_t latency_total = 0;
        int64_t latency_samples = 0;
        for (const auto& entry : s_.receipts) {
            const DeliveryReceipt& r = entry.second;
            if (r.delivered_at == 0) {
                ++stats.undelivered;
                continue;
            }
            if (r.read_at == 0) {
                ++stats.delivered_unread;
            }
            if (r.delivered_at >= latency_since) {
                auto message = s_.messages.find(r.message_id);
                if (message != s_.messages.end()) {
                    latency_total += r.delivered_at - message->second.created_at;
                    ++latency_samples;
                }
            }
        }
        if (latency_samples > 0) {
            stats.avg_delivery_ms = static_cast<double>(latency_total) / static_cast<double>(latency_samples);
        }
        return stats;
    }

    DeviceCounts deviceCounts() override {
        DeviceCounts counts;
        for (const auto& entry : s_.devices) {
            ++counts.total;
            if (entry.second.isRevoked()) {
                ++counts.revoked;
            } else {
                ++counts.active;
            }
        }
        return counts;
    }

    GroupCounts groupCounts(int64_t epoch_changes_since) override {
        GroupCounts counts;
        for (const auto& entry : s_.groups) {
            ++counts.total;
            if (entry.second.is_closed) {
                ++counts.closed;
            } else {
                ++counts.active;
            }
        }
        for (const auto& change : s_.epoch_changes) {
            if (change.changed_at >= epoch_changes_since) {
                ++counts.epoch_changes;
            }
        }
        return counts;
    }

private:
    InMemoryStorage::State& s_;
};

} // namespace

bool InMemoryStorage::initialize() {
    std::lock_guard<std::mutex> lock(storage_mutex_);
    Logger::getInstance().info("InMemoryStorage initialized successfully");
    return true;
}

bool InMemoryStorage::transact(const std::function<bool(Store&)>& work) {
    std::lock_guard<std::mutex> lock(storage_mutex_);
    State working = state_;
    MemoryStore store(working);
    if (!work(store)) {
        return false;
    }
    state_ = std::move(working);
    return true;
}

InMemoryStorage::State InMemoryStorage::snapshot() {
    std::lock_guard<std::mutex> lock(storage_mutex_);
    return state_;
}

} // namespace sealgate
