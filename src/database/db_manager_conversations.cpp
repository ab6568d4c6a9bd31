#include "../../include/database/db_manager.hpp"
#include "../../include/utils/logger.hpp"

namespace sealgate {

namespace {

const std::string kConversationColumns =
    "c.id, COALESCE(c.pair_key, ''), " + sql::millis("c.created_at") + ", " + sql::millis("c.last_message_at");

Conversation readConversation(const PgResult& res, int row) {
    Conversation conversation;
    conversation.id = res.text(row, 0);
    conversation.pair_key = res.text(row, 1);
    conversation.created_at = res.int64(row, 2);
    conversation.last_message_at = res.int64(row, 3);
    return conversation;
}

} // namespace

bool PgStore::prepareConversationStatements(DatabaseConnection& conn) {
    return conn.prepareStatement("find_conversation",
               "SELECT " + kConversationColumns + " FROM dm_conversations c WHERE c.id = $1") &&
           conn.prepareStatement("find_conversation_by_pair_key",
               "SELECT " + kConversationColumns + " FROM dm_conversations c WHERE c.pair_key = $1") &&
           conn.prepareStatement("find_conversation_by_members",
               "SELECT " + kConversationColumns + " FROM dm_conversations c "
               "JOIN dm_participants a ON a.conversation_id = c.id AND a.user_id = $1 "
               "JOIN dm_participants b ON b.conversation_id = c.id AND b.user_id = $2 "
               "WHERE (SELECT COUNT(*) FROM dm_participants p WHERE p.conversation_id = c.id) = 2 "
               "ORDER BY c.created_at LIMIT 1") &&
           conn.prepareStatement("insert_conversation",
               "INSERT INTO dm_conversations (id, pair_key, created_at) VALUES ($1, $2, " +
               sql::timestamp("$3") + ") ON CONFLICT (pair_key) DO NOTHING RETURNING id") &&
           conn.prepareStatement("insert_participant",
               "INSERT INTO dm_participants (conversation_id, user_id, device_ids) VALUES ($1, $2, $3::text[])") &&
           conn.prepareStatement("list_participants",
               "SELECT conversation_id, user_id, array_to_string(device_ids, ',') FROM dm_participants "
               "WHERE conversation_id = $1 ORDER BY user_id") &&
           conn.prepareStatement("update_participant_devices",
               "UPDATE dm_participants SET device_ids = $3::text[] WHERE conversation_id = $1 AND user_id = $2") &&
           conn.prepareStatement("touch_conversation",
               "UPDATE dm_conversations SET last_message_at = " + sql::timestamp("$2") + " WHERE id = $1") &&
           conn.prepareStatement("list_conversations",
               "SELECT c.id, peer.user_id, COALESCE(u.username, ''), " + sql::millis("c.created_at") + ", " +
               sql::millis("c.last_message_at") + ", "
               "(SELECT COUNT(*) FROM relay_messages m JOIN relay_receipts r "
               "   ON r.message_id = m.id AND r.recipient_user_id = me.user_id "
               " WHERE m.kind = 'dm' AND m.target_id = c.id AND m.sender_user_id = peer.user_id "
               "   AND r.read_at IS NULL) "
               "FROM dm_participants me "
               "JOIN dm_conversations c ON c.id = me.conversation_id "
               "JOIN dm_participants peer ON peer.conversation_id = c.id AND peer.user_id <> me.user_id "
               "LEFT JOIN users u ON u.id = peer.user_id "
               "WHERE me.user_id = $1 "
               "ORDER BY COALESCE(c.last_message_at, c.created_at) DESC, c.id "
               "LIMIT $2 OFFSET $3");
}

bool PgStore::findConversation(const std::string& conversation_id, Conversation& out) {
    PgResult res = exec("find_conversation", PgParams().add(conversation_id));
    if (res.rows() == 0) {
        return false;
    }
    out = readConversation(res, 0);
    return true;
}

bool PgStore::findConversationByPairKey(const std::string& pair_key, Conversation& out) {
    PgResult res = exec("find_conversation_by_pair_key", PgParams().add(pair_key));
    if (res.rows() == 0) {
        return false;
    }
    out = readConversation(res, 0);
    return true;
}

bool PgStore::findConversationByMembers(const std::string& user_a, const std::string& user_b,
                                        Conversation& out) {
    PgResult res = exec("find_conversation_by_members", PgParams().add(user_a).add(user_b));
    if (res.rows() == 0) {
        return false;
    }
    out = readConversation(res, 0);
    return true;
}

bool PgStore::insertConversation(const Conversation& conversation) {
    PgResult res = exec("insert_conversation", PgParams()
        .add(conversation.id)
        .addOptional(conversation.pair_key)
        .add(conversation.created_at));
    return res.rows() > 0;
}

void PgStore::insertParticipant(const Participant& participant) {
    exec("insert_participant", PgParams()
        .add(participant.conversation_id)
        .add(participant.user_id)
        .addArray(participant.device_ids));
}

std::vector<Participant> PgStore::listParticipants(const std::string& conversation_id) {
    PgResult res = exec("list_participants", PgParams().add(conversation_id));
    std::vector<Participant> participants;
    for (int i = 0; i < res.rows(); i++) {
        Participant participant;
        participant.conversation_id = res.text(i, 0);
        participant.user_id = res.text(i, 1);
        participant.device_ids = splitList(res.text(i, 2));
        participants.push_back(participant);
    }
    return participants;
}

void PgStore::updateParticipantDevices(const std::string& conversation_id, const std::string& user_id,
                                       const std::vector<std::string>& device_ids) {
    exec("update_participant_devices", PgParams().add(conversation_id).add(user_id).addArray(device_ids));
}

void PgStore::touchConversation(const std::string& conversation_id, int64_t last_message_at) {
    exec("touch_conversation", PgParams().add(conversation_id).add(last_message_at));
}

std::vector<ConversationSummary> PgStore::listConversations(const std::string& user_id, int limit, int offset) {
    PgResult res = exec("list_conversations", PgParams()
        .add(user_id)
        .add(static_cast<int64_t>(limit))
        .add(static_cast<int64_t>(offset)));
    std::vector<ConversationSummary> summaries;
    for (int i = 0; i < res.rows(); i++) {
        ConversationSummary summary;
        summary.conversation_id = res.text(i, 0);
        summary.peer_user_id = res.text(i, 1);
        summary.peer_username = res.text(i, 2);
        summary.created_at = res.int64(i, 3);
        summary.last_message_at = res.int64(i, 4);
        summary.unread_count = static_cast<int>(res.int64(i, 5));
        summaries.push_back(summary);
    }
    return summaries;
}

} // namespace sealgate
