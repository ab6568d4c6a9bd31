#include "../../include/messaging/message_relay.hpp"
#include "../../include/groups/group_directory.hpp"
#include "../../include/messaging/relationship_service.hpp"
#include "../../include/storage/transaction.hpp"
#include "../../include/utils/crypto_utils.hpp"
#include "../../include/utils/json_parser.hpp"
#include "../../include/utils/logger.hpp"
#include <algorithm>
#include <sstream>

namespace sealgate {

namespace {

const size_t kMaxClientMessageIdLength = 128;

std::string directEvent(const Message& message) {
    std::ostringstream oss;
    oss << "{\"type\":\"dm\""
        << ",\"message_id\":" << JsonParser::quote(message.id)
        << ",\"conversation_id\":" << JsonParser::quote(message.target_id)
        << ",\"sender_user_id\":" << JsonParser::quote(message.sender_user_id)
        << ",\"sender_device_id\":" << JsonParser::quote(message.sender_device_id)
        << ",\"ciphertext\":" << JsonParser::quote(message.ciphertext)
        << ",\"proto\":" << message.proto
        << ",\"created_at\":" << JsonParser::quote(formatTimestamp(message.created_at))
        << "}";
    return oss.str();
}

std::string groupEvent(const Message& message) {
    std::ostringstream oss;
    oss << "{\"type\":\"group_message\""
        << ",\"message_id\":" << JsonParser::quote(message.id)
        << ",\"group_id\":" << JsonParser::quote(message.target_id)
        << ",\"sender_user_id\":" << JsonParser::quote(message.sender_user_id)
        << ",\"sender_device_id\":" << JsonParser::quote(message.sender_device_id)
        << ",\"ciphertext\":" << JsonParser::quote(message.ciphertext)
        << ",\"proto\":" << message.proto
        << ",\"group_epoch\":" << message.group_epoch;
    if (!message.reply_to_message_id.empty()) {
        oss << ",\"reply_to_message_id\":" << JsonParser::quote(message.reply_to_message_id);
    }
    oss << ",\"created_at\":" << JsonParser::quote(formatTimestamp(message.created_at)) << "}";
    return oss.str();
}

bool isConversationParticipant(Store& store, const std::string& conversation_id, const std::string& user_id,
                               std::string& peer_user_id) {
    bool member = false;
    for (const auto& participant : store.listParticipants(conversation_id)) {
        if (participant.user_id == user_id) {
            member = true;
        } else {
            peer_user_id = participant.user_id;
        }
    }
    return member;
}

} // namespace

MessageRelay::MessageRelay(Storage& storage, const Clock& clock, const MessagingPolicy& policy,
                           EventPublisher* publisher)
    : storage_(storage),
      clock_(clock),
      policy_(policy),
      publisher_(publisher),
      direct_limiter_(MessageKind::Direct, policy.dm_global, policy.dm_burst),
      group_limiter_(MessageKind::Group, policy.group_global, policy.group_burst) {}

bool MessageRelay::validate(const SendMessageRequest& request, ServiceError& error) const {
    if (request.ciphertext.empty()) {
        error.set(400, "", "ciphertext is required");
        return false;
    }
    if (request.client_message_id.size() > kMaxClientMessageIdLength) {
        error.set(400, "", "client_message_id is too long");
        return false;
    }
    std::string decoded;
    if (!crypto::base64Decode(request.ciphertext, decoded)) {
        error.set(400, "", "Invalid base64 ciphertext");
        return false;
    }
    if (decoded.size() > static_cast<size_t>(policy_.max_message_size)) {
        error.set(413, "", "Message exceeds maximum size of " + std::to_string(policy_.max_message_size) +
                           " bytes");
        error.context["max_message_size"] = std::to_string(policy_.max_message_size);
        return false;
    }
    return true;
}

bool MessageRelay::resolveSenderDevice(Store& store, const std::string& caller, const std::string& device_id,
                                       Device& device, ServiceError& error) const {
    if (device_id.empty()) {
        std::vector<std::string> active = store.activeDeviceIds(caller);
        if (active.empty()) {
            error.set(400, "", "No active device found. Please register a device first.");
            return false;
        }
        if (!store.findDevice(active.front(), device)) {
            error.set(400, "", "No active device found. Please register a device first.");
            return false;
        }
        return true;
    }
    if (!store.findDevice(device_id, device) || device.owner_user_id != caller) {
        error.set(400, "", "Unknown sender device");
        return false;
    }
    if (device.isRevoked()) {
        Logger::getInstance().audit("revoked_device_use",
                                    "user=" + caller + " device=" + device_id + " op=send");
        error.set(409, codes::DEVICE_REVOKED, "DEVICE_REVOKED");
        return false;
    }
    return true;
}

bool MessageRelay::sendDirect(const std::string& caller, const std::string& conversation_id,
                              const SendMessageRequest& request, SendResult& result, ServiceError& error) {
    if (!validate(request, error)) {
        return false;
    }
    const int64_t now = clock_.nowMillis();
    std::string peer_user_id;
    result = SendResult();

    bool ok = runTransaction(storage_, "sendDirect", error, [&](Store& store) {
        Conversation conversation;
        if (!store.findConversation(conversation_id, conversation) ||
            !isConversationParticipant(store, conversation_id, caller, peer_user_id)) {
            error.set(404, "", "Conversation not found");
            return false;
        }
        Device device;
        if (!resolveSenderDevice(store, caller, request.sender_device_id, device, error)) {
            return false;
        }
        if (!request.client_message_id.empty() &&
            store.findMessageByClientId(MessageKind::Direct, conversation_id, caller, request.client_message_id,
                                        result.message)) {
            result.duplicate = true;
            return true;
        }
        if (!direct_limiter_.allow(store, caller, conversation_id, now, error)) {
            return false;
        }
        if (peer_user_id.empty()) {
            error.set(400, "", "Recipient not found in conversation");
            return false;
        }
        if (RelationshipService::blockedEitherWay(store, caller, peer_user_id)) {
            error.set(403, codes::BLOCKED, "BLOCKED");
            return false;
        }

        Message& message = result.message;
        message.id = crypto::generateUuid();
        message.kind = MessageKind::Direct;
        message.target_id = conversation_id;
        message.sender_user_id = caller;
        message.sender_device_id = device.id;
        message.ciphertext = request.ciphertext;
        message.proto = request.proto;
        message.created_at = now;
        message.client_message_id = request.client_message_id;
        if (!store.insertMessage(message)) {
            // A concurrent send with the same client_message_id committed first.
            if (!store.findMessageByClientId(MessageKind::Direct, conversation_id, caller,
                                             request.client_message_id, result.message)) {
                throw StorageError("duplicate message " + request.client_message_id + " cannot be read");
            }
            result.duplicate = true;
            return true;
        }

        DeliveryReceipt receipt;
        receipt.message_id = message.id;
        receipt.kind = MessageKind::Direct;
        receipt.recipient_user_id = peer_user_id;
        store.insertReceipt(receipt);
        store.touchConversation(conversation_id, now);
        return true;
    });

    if (!ok) {
        return false;
    }
    if (result.duplicate) {
        Logger::getInstance().debug("Duplicate message detected: " + request.client_message_id);
        return true;
    }
    publishQuietly(publisher_, peer_user_id, directEvent(result.message));
    return true;
}

bool MessageRelay::sendGroup(const std::string& caller, const std::string& group_id,
                             const SendMessageRequest& request, SendResult& result, ServiceError& error) {
    if (!validate(request, error)) {
        return false;
    }
    if (request.group_epoch < 0) {
        error.set(400, "", "group_epoch is required");
        return false;
    }
    const int64_t now = clock_.nowMillis();
    std::vector<std::string> notify;
    result = SendResult();

    bool ok = runTransaction(storage_, "sendGroup", error, [&](Store& store) {
        Group group;
        if (!store.findGroup(group_id, group)) {
            error.set(404, "", "Group not found");
            return false;
        }
        if (group.is_closed) {
            error.set(403, "", "Group is closed");
            return false;
        }
        GroupParticipant self;
        if (!GroupDirectory::isActiveMember(store, group_id, caller, self)) {
            error.set(403, codes::NOT_MEMBER, "Not a member of this group");
            return false;
        }
        Device device;
        if (!resolveSenderDevice(store, caller, request.sender_device_id, device, error)) {
            return false;
        }
        if (!request.client_message_id.empty() &&
            store.findMessageByClientId(MessageKind::Group, group_id, caller, request.client_message_id,
                                        result.message)) {
            result.duplicate = true;
            return true;
        }
        if (request.group_epoch != group.group_epoch) {
            error.set(409, codes::EPOCH_STALE, "EPOCH_STALE");
            error.headers["X-Current-Epoch"] = std::to_string(group.group_epoch);
            error.context["current_epoch"] = std::to_string(group.group_epoch);
            return false;
        }
        if (!request.reply_to_message_id.empty()) {
            Message parent;
            if (!store.findMessage(MessageKind::Group, request.reply_to_message_id, parent) ||
                parent.target_id != group_id) {
                error.set(404, "", "Reply target not found in this group");
                return false;
            }
        }
        if (!group_limiter_.allow(store, caller, group_id, now, error)) {
            return false;
        }

        Message& message = result.message;
        message.id = crypto::generateUuid();
        message.kind = MessageKind::Group;
        message.target_id = group_id;
        message.sender_user_id = caller;
        message.sender_device_id = device.id;
        message.ciphertext = request.ciphertext;
        message.proto = request.proto;
        message.created_at = now;
        message.client_message_id = request.client_message_id;
        message.group_epoch = group.group_epoch;
        message.reply_to_message_id = request.reply_to_message_id;
        if (!store.insertMessage(message)) {
            if (!store.findMessageByClientId(MessageKind::Group, group_id, caller, request.client_message_id,
                                             result.message)) {
                throw StorageError("duplicate message " + request.client_message_id + " cannot be read");
            }
            result.duplicate = true;
            return true;
        }

        for (const auto& member : store.listActiveGroupParticipants(group_id)) {
            if (member.user_id == caller) {
                continue;
            }
            DeliveryReceipt receipt;
            receipt.message_id = message.id;
            receipt.kind = MessageKind::Group;
            receipt.recipient_user_id = member.user_id;
            store.insertReceipt(receipt);
            if (member.mute_until <= now) {
                notify.push_back(member.user_id);
            }
        }
        return true;
    });

    if (!ok) {
        return false;
    }
    if (result.duplicate) {
        Logger::getInstance().debug("Duplicate group message detected: " + request.client_message_id);
        return true;
    }
    const std::string event = groupEvent(result.message);
    for (const auto& user_id : notify) {
        publishQuietly(publisher_, user_id, event);
    }
    return true;
}

bool MessageRelay::listMessages(const std::string& caller, MessageKind kind, const std::string& target_id,
                                const MessageQuery& query, std::vector<Message>& messages, ServiceError& error) {
    int limit = query.limit <= 0 ? kDefaultPageSize : std::min(query.limit, kMaxPageSize);
    messages.clear();

    return runTransaction(storage_, "listMessages", error, [&](Store& store) {
        if (kind == MessageKind::Direct) {
            Conversation conversation;
            std::string peer;
            if (!store.findConversation(target_id, conversation) ||
                !isConversationParticipant(store, target_id, caller, peer)) {
                error.set(404, "", "Conversation not found");
                return false;
            }
        } else {
            Group group;
            if (!store.findGroup(target_id, group)) {
                error.set(404, "", "Group not found");
                return false;
            }
            GroupParticipant self;
            if (!GroupDirectory::isActiveMember(store, target_id, caller, self)) {
                error.set(403, codes::NOT_MEMBER, "Not a member of this group");
                return false;
            }
        }

        // Cursors that do not name a message of this target are ignored.
        int64_t before_seq = 0;
        int64_t after_seq = 0;
        Message anchor;
        if (!query.after.empty() && store.findMessage(kind, query.after, anchor) && anchor.target_id == target_id) {
            after_seq = anchor.seq;
        } else if (!query.cursor.empty() && store.findMessage(kind, query.cursor, anchor) &&
                   anchor.target_id == target_id) {
            before_seq = anchor.seq;
        }
        messages = store.listMessages(kind, target_id, limit, before_seq, after_seq);
        return true;
    });
}

bool MessageRelay::markDelivered(const std::string& caller, MessageKind kind, const std::string& message_id,
                                 DeliveryReceipt& receipt, ServiceError& error) {
    return updateReceipt(caller, kind, message_id, false, receipt, error);
}

bool MessageRelay::markRead(const std::string& caller, MessageKind kind, const std::string& message_id,
                            DeliveryReceipt& receipt, ServiceError& error) {
    return updateReceipt(caller, kind, message_id, true, receipt, error);
}

bool MessageRelay::updateReceipt(const std::string& caller, MessageKind kind, const std::string& message_id,
                                 bool read, DeliveryReceipt& receipt, ServiceError& error) {
    if (message_id.empty()) {
        error.set(400, "", "message_id is required");
        return false;
    }
    const int64_t now = clock_.nowMillis();

    return runTransaction(storage_, read ? "markRead" : "markDelivered", error, [&](Store& store) {
        Message message;
        if (!store.findMessage(kind, message_id, message)) {
            error.set(404, "", "Message not found");
            return false;
        }
        if (!store.findReceipt(kind, message_id, caller, receipt)) {
            error.set(403, codes::FORBIDDEN,
                      read ? "Not authorized to mark this message as read"
                           : "Not authorized to mark this message as delivered");
            return false;
        }
        // Each timestamp is written once. A read does not imply delivery.
        int64_t& stamp = read ? receipt.read_at : receipt.delivered_at;
        if (stamp == 0) {
            stamp = now;
            store.updateReceipt(receipt);
        }
        return true;
    });
}

} // namespace sealgate
