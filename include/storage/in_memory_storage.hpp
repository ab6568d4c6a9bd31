#ifndef IN_MEMORY_STORAGE_HPP
#define IN_MEMORY_STORAGE_HPP

#include <string>
#include <vector>
#include <map>
#include <utility>
#include <mutex>
#include "storage.hpp"

namespace sealgate {

/**
 * In-memory storage backend.
 *
 * Transactions are serialized by one mutex and run against a copy of the state;
 * the copy replaces the live state only on commit, so a rolled-back or throwing
 * transaction leaves no trace. Used by the tests and by SEALGATE_STORAGE=memory.
 */
class InMemoryStorage : public Storage {
public:
    InMemoryStorage() = default;

    bool initialize() override;
    bool transact(const std::function<bool(Store&)>& work) override;

    struct EpochChange {
        std::string group_id;
        int64_t new_epoch = 0;
        std::string reason;
        int64_t changed_at = 0;
    };

    using UserPair = std::pair<std::string, std::string>;

    struct State {
        std::map<std::string, User> users;
        std::map<UserPair, BlockEntry> blocks;

        std::map<std::string, Device> devices;
        std::vector<DeviceRevocation> revocations;
        std::map<std::string, KeyBundle> bundles;
        std::map<int64_t, OneTimePrekey> prekeys;
        int64_t next_prekey_id = 1;
        std::vector<IdentityChangeEvent> identity_events;

        std::map<std::string, Conversation> conversations;
        std::vector<Participant> participants;

        std::map<std::string, Group> groups;
        std::map<UserPair, GroupParticipant> group_participants;   // (group, user)
        std::map<UserPair, GroupBan> group_bans;                   // (group, user)
        std::map<std::string, GroupInvite> invites;
        std::vector<EpochChange> epoch_changes;

        std::map<std::string, Message> messages;
        int64_t next_message_seq = 1;
        std::map<UserPair, DeliveryReceipt> receipts;              // (message, recipient)
    };

    // Copy of the committed state, for assertions in tests.
    State snapshot();

private:
    std::mutex storage_mutex_;
    State state_;
};

} // namespace sealgate

#endif // IN_MEMORY_STORAGE_HPP
