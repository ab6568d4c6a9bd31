#ifndef CONVERSATION_DIRECTORY_HPP
#define CONVERSATION_DIRECTORY_HPP

#include <string>
#include <vector>
#include "../storage/storage.hpp"
#include "../utils/clock.hpp"
#include "../utils/service_error.hpp"

namespace sealgate {

struct ConversationView {
    Conversation conversation;
    std::vector<Participant> participants;   // device_ids re-derived from the device table
};

// Pairwise conversations. One row per unordered pair of users, enforced by a
// unique pair key; concurrent creates for the same pair converge on that row.
class ConversationDirectory {
public:
    ConversationDirectory(Storage& storage, const Clock& clock);

    bool findOrCreate(const std::string& caller, const std::string& peer_user_id, ConversationView& view,
                      bool& created, ServiceError& error);
    bool getConversation(const std::string& caller, const std::string& conversation_id, ConversationView& view,
                         ServiceError& error);
    bool listConversations(const std::string& caller, int limit, int offset,
                           std::vector<ConversationSummary>& conversations, ServiceError& error);

    // Order-independent: pairKey(a, b) == pairKey(b, a).
    static std::string pairKey(const std::string& user_a, const std::string& user_b);

    // Rewrites each participant's cached device list from the device table.
    static void refreshDevices(Store& store, const std::string& conversation_id,
                               std::vector<Participant>& participants);

private:
    Storage& storage_;
    const Clock& clock_;
};

} // namespace sealgate

#endif // CONVERSATION_DIRECTORY_HPP
