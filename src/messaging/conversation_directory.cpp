#include "../../include/messaging/conversation_directory.hpp"
#include "../../include/messaging/relationship_service.hpp"
#include "../../include/storage/transaction.hpp"
#include "../../include/utils/crypto_utils.hpp"
#include "../../include/utils/logger.hpp"
#include <algorithm>

namespace sealgate {

namespace {

const int kDefaultPageSize = 50;
const int kMaxPageSize = 100;

bool isParticipant(const std::vector<Participant>& participants, const std::string& user_id) {
    for (const auto& p : participants) {
        if (p.user_id == user_id) {
            return true;
        }
    }
    return false;
}

} // namespace

ConversationDirectory::ConversationDirectory(Storage& storage, const Clock& clock)
    : storage_(storage), clock_(clock) {}

std::string ConversationDirectory::pairKey(const std::string& user_a, const std::string& user_b) {
    const std::string& low = std::min(user_a, user_b);
    const std::string& high = std::max(user_a, user_b);
    return crypto::sha256Hex(low + "|" + high);
}

void ConversationDirectory::refreshDevices(Store& store, const std::string& conversation_id,
                                           std::vector<Participant>& participants) {
    for (auto& participant : participants) {
        std::vector<std::string> current = store.activeDeviceIds(participant.user_id);
        if (current != participant.device_ids) {
            store.updateParticipantDevices(conversation_id, participant.user_id, current);
            participant.device_ids = current;
        }
    }
}

bool ConversationDirectory::findOrCreate(const std::string& caller, const std::string& peer_user_id,
                                         ConversationView& view, bool& created, ServiceError& error) {
    if (peer_user_id.empty()) {
        error.set(400, "", "peer_user_id is required");
        return false;
    }
    if (peer_user_id == caller) {
        error.set(400, "", "Cannot create a conversation with yourself");
        return false;
    }
    created = false;
    const std::string key = pairKey(caller, peer_user_id);
    const int64_t now = clock_.nowMillis();

    return runTransaction(storage_, "findOrCreate", error, [&](Store& store) {
        User peer;
        if (!store.findUser(peer_user_id, peer)) {
            error.set(404, "", "User not found");
            return false;
        }
        if (RelationshipService::blockedEitherWay(store, caller, peer_user_id)) {
            error.set(403, codes::BLOCKED, "BLOCKED");
            return false;
        }

        Conversation conversation;
        bool found = store.findConversationByPairKey(key, conversation) ||
                     store.findConversationByMembers(caller, peer_user_id, conversation);
        if (!found) {
            conversation.id = crypto::generateUuid();
            conversation.pair_key = key;
            conversation.created_at = now;
            conversation.last_message_at = 0;
            if (store.insertConversation(conversation)) {
                Participant self;
                self.conversation_id = conversation.id;
                self.user_id = caller;
                store.insertParticipant(self);
                Participant other;
                other.conversation_id = conversation.id;
                other.user_id = peer_user_id;
                store.insertParticipant(other);
                created = true;
            } else if (!store.findConversationByPairKey(key, conversation)) {
                // The winner of the race must be visible once our insert has conflicted.
                throw StorageError("conversation for pair " + key + " conflicted but cannot be read");
            }
        }

        view.conversation = conversation;
        view.participants = store.listParticipants(conversation.id);
        refreshDevices(store, conversation.id, view.participants);
        return true;
    });
}

bool ConversationDirectory::getConversation(const std::string& caller, const std::string& conversation_id,
                                            ConversationView& view, ServiceError& error) {
    return runTransaction(storage_, "getConversation", error, [&](Store& store) {
        if (!store.findConversation(conversation_id, view.conversation)) {
            error.set(404, "", "Conversation not found");
            return false;
        }
        view.participants = store.listParticipants(conversation_id);
        if (!isParticipant(view.participants, caller)) {
            error.set(404, "", "Conversation not found");
            return false;
        }
        refreshDevices(store, conversation_id, view.participants);
        return true;
    });
}

bool ConversationDirectory::listConversations(const std::string& caller, int limit, int offset,
                                              std::vector<ConversationSummary>& conversations,
                                              ServiceError& error) {
    if (limit <= 0) {
        limit = kDefaultPageSize;
    }
    limit = std::min(limit, kMaxPageSize);
    offset = std::max(offset, 0);
    return runTransaction(storage_, "listConversations", error, [&](Store& store) {
        conversations = store.listConversations(caller, limit, offset);
        return true;
    });
}

} // namespace sealgate
