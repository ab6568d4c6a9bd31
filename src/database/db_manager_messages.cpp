#include "../../include/database/db_manager.hpp"
#include "../../include/utils/logger.hpp"
#include <algorithm>

namespace sealgate {

namespace {

const std::string kMessageColumns =
    "id, seq, kind, target_id, sender_user_id, sender_device_id, ciphertext, proto, " + sql::millis("created_at") +
    ", COALESCE(client_message_id, ''), group_epoch, COALESCE(reply_to_message_id, '')";

Message readMessage(const PgResult& res, int row) {
    Message message;
    message.id = res.text(row, 0);
    message.seq = res.int64(row, 1);
    message.kind = res.text(row, 2) == "group" ? MessageKind::Group : MessageKind::Direct;
    message.target_id = res.text(row, 3);
    message.sender_user_id = res.text(row, 4);
    message.sender_device_id = res.text(row, 5);
    message.ciphertext = res.text(row, 6);
    message.proto = static_cast<int>(res.int64(row, 7));
    message.created_at = res.int64(row, 8);
    message.client_message_id = res.text(row, 9);
    message.group_epoch = res.int64(row, 10);
    message.reply_to_message_id = res.text(row, 11);
    return message;
}

} // namespace

bool PgStore::prepareMessageStatements(DatabaseConnection& conn) {
    return conn.prepareStatement("find_message",
               "SELECT " + kMessageColumns + " FROM relay_messages WHERE kind = $1 AND id = $2") &&
           conn.prepareStatement("find_message_by_client_id",
               "SELECT " + kMessageColumns + " FROM relay_messages "
               "WHERE kind = $1 AND target_id = $2 AND sender_user_id = $3 AND client_message_id = $4") &&
           conn.prepareStatement("insert_message",
               "INSERT INTO relay_messages (id, kind, target_id, sender_user_id, sender_device_id, ciphertext, "
               "proto, client_message_id, group_epoch, reply_to_message_id, created_at) "
               "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, " + sql::timestamp("$11") + ") "
               "ON CONFLICT (kind, target_id, sender_user_id, client_message_id) "
               "WHERE client_message_id IS NOT NULL DO NOTHING RETURNING seq") &&
           conn.prepareStatement("sender_window_usage",
               "SELECT COUNT(*), " + sql::millis("MIN(created_at)") + " FROM relay_messages "
               "WHERE kind = $1 AND sender_user_id = $2 AND ($3 = '' OR target_id = $3) "
               "AND created_at >= " + sql::timestamp("$4")) &&
           conn.prepareStatement("list_messages_before",
               "SELECT " + kMessageColumns + " FROM relay_messages "
               "WHERE kind = $1 AND target_id = $2 AND ($4::bigint <= 0 OR seq < $4) "
               "ORDER BY seq DESC LIMIT $3") &&
           conn.prepareStatement("list_messages_after",
               "SELECT " + kMessageColumns + " FROM relay_messages "
               "WHERE kind = $1 AND target_id = $2 AND seq > $4 ORDER BY seq ASC LIMIT $3") &&
           conn.prepareStatement("insert_receipt",
               "INSERT INTO relay_receipts (message_id, recipient_user_id, kind, delivered_at, read_at) "
               "VALUES ($1, $2, $3, " + sql::timestamp("$4") + ", " + sql::timestamp("$5") + ") "
               "ON CONFLICT DO NOTHING") &&
           conn.prepareStatement("find_receipt",
               "SELECT message_id, recipient_user_id, " + sql::millis("delivered_at") + ", " +
               sql::millis("read_at") + " FROM relay_receipts "
               "WHERE kind = $1 AND message_id = $2 AND recipient_user_id = $3 FOR UPDATE") &&
           // Timestamps are write-once; a concurrent writer that committed first keeps its value.
           conn.prepareStatement("update_receipt",
               "UPDATE relay_receipts SET delivered_at = COALESCE(delivered_at, " + sql::timestamp("$3") +
               "), read_at = COALESCE(read_at, " + sql::timestamp("$4") + ") "
               "WHERE message_id = $1 AND recipient_user_id = $2");
}

bool PgStore::findMessage(MessageKind kind, const std::string& message_id, Message& out) {
    PgResult res = exec("find_message", PgParams().add(std::string(kindName(kind))).add(message_id));
    if (res.rows() == 0) {
        return false;
    }
    out = readMessage(res, 0);
    return true;
}

bool PgStore::findMessageByClientId(MessageKind kind, const std::string& target_id,
                                    const std::string& sender_user_id, const std::string& client_message_id,
                                    Message& out) {
    if (client_message_id.empty()) {
        return false;
    }
    PgResult res = exec("find_message_by_client_id", PgParams()
        .add(std::string(kindName(kind)))
        .add(target_id)
        .add(sender_user_id)
        .add(client_message_id));
    if (res.rows() == 0) {
        return false;
    }
    out = readMessage(res, 0);
    return true;
}

bool PgStore::insertMessage(Message& message) {
    PgResult res = exec("insert_message", PgParams()
        .add(message.id)
        .add(std::string(kindName(message.kind)))
        .add(message.target_id)
        .add(message.sender_user_id)
        .add(message.sender_device_id)
        .add(message.ciphertext)
        .add(static_cast<int64_t>(message.proto))
        .addOptional(message.client_message_id)
        .add(message.group_epoch)
        .addOptional(message.reply_to_message_id)
        .add(message.created_at));
    if (res.rows() == 0) {
        return false;
    }
    message.seq = res.int64(0, 0);
    return true;
}

WindowUsage PgStore::senderWindowUsage(MessageKind kind, const std::string& sender_user_id,
                                       const std::string& target_id, int64_t since) {
    PgResult res = exec("sender_window_usage", PgParams()
        .add(std::string(kindName(kind)))
        .add(sender_user_id)
        .add(target_id)
        .add(since));
    WindowUsage usage;
    usage.count = static_cast<int>(res.int64(0, 0));
    usage.oldest_at = res.int64(0, 1);
    return usage;
}

std::vector<Message> PgStore::listMessages(MessageKind kind, const std::string& target_id, int limit,
                                           int64_t before_seq, int64_t after_seq) {
    std::vector<Message> messages;
    if (after_seq > 0) {
        PgResult res = exec("list_messages_after", PgParams()
            .add(std::string(kindName(kind)))
            .add(target_id)
            .add(static_cast<int64_t>(limit))
            .add(after_seq));
        for (int i = 0; i < res.rows(); i++) {
            messages.push_back(readMessage(res, i));
        }
        return messages;
    }

    // Newest first for correct paging, then flipped to chronological order
    PgResult res = exec("list_messages_before", PgParams()
        .add(std::string(kindName(kind)))
        .add(target_id)
        .add(static_cast<int64_t>(limit))
        .add(before_seq));
    for (int i = 0; i < res.rows(); i++) {
        messages.push_back(readMessage(res, i));
    }
    std::reverse(messages.begin(), messages.end());
    return messages;
}

void PgStore::insertReceipt(const DeliveryReceipt& receipt) {
    exec("insert_receipt", PgParams()
        .add(receipt.message_id)
        .add(receipt.recipient_user_id)
        .add(std::string(kindName(receipt.kind)))
        .addMillis(receipt.delivered_at)
        .addMillis(receipt.read_at));
}

bool PgStore::findReceipt(MessageKind kind, const std::string& message_id, const std::string& recipient_user_id,
                          DeliveryReceipt& out) {
    PgResult res = exec("find_receipt", PgParams()
        .add(std::string(kindName(kind)))
        .add(message_id)
        .add(recipient_user_id));
    if (res.rows() == 0) {
        return false;
    }
    out.message_id = res.text(0, 0);
    out.recipient_user_id = res.text(0, 1);
    out.kind = kind;
    out.delivered_at = res.int64(0, 2);
    out.read_at = res.int64(0, 3);
    return true;
}

void PgStore::updateReceipt(const DeliveryReceipt& receipt) {
    exec("update_receipt", PgParams()
        .add(receipt.message_id)
        .add(receipt.recipient_user_id)
        .addMillis(receipt.delivered_at)
        .addMillis(receipt.read_at));
}

} // namespace sealgate
