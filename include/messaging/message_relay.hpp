#ifndef MESSAGE_RELAY_HPP
#define MESSAGE_RELAY_HPP

#include <string>
#include <vector>
#include <cstdint>
#include "../config/config.hpp"
#include "../security/rate_limiter.hpp"
#include "../storage/storage.hpp"
#include "event_publisher.hpp"
#include "../utils/clock.hpp"
#include "../utils/service_error.hpp"

namespace sealgate {

struct SendMessageRequest {
    std::string sender_device_id;       // empty: the caller's oldest active device
    std::string ciphertext;             // base64
    int proto = 0;
    std::string client_message_id;      // idempotency key, optional
    int64_t group_epoch = -1;           // group sends only
    std::string reply_to_message_id;    // group sends only, optional
};

struct SendResult {
    Message message;
    bool duplicate = false;
};

struct MessageQuery {
    int limit = 0;                      // <= 0: default page size
    std::string cursor;                 // page to messages older than this id
    std::string after;                  // catch up on messages newer than this id
};

/**
 * Persists ciphertext envelopes for 1:1 conversations and groups and tracks
 * per-recipient delivery and read receipts.
 *
 * A send stores the message and every receipt in one transaction. The live
 * notification is published afterwards; a publish failure is logged and does
 * not affect the stored message.
 */
class MessageRelay {
public:
    MessageRelay(Storage& storage, const Clock& clock, const MessagingPolicy& policy,
                 EventPublisher* publisher = nullptr);

    bool sendDirect(const std::string& caller, const std::string& conversation_id,
                    const SendMessageRequest& request, SendResult& result, ServiceError& error);
    bool sendGroup(const std::string& caller, const std::string& group_id, const SendMessageRequest& request,
                   SendResult& result, ServiceError& error);

    // Chronological page of envelopes; the caller must be an active participant.
    bool listMessages(const std::string& caller, MessageKind kind, const std::string& target_id,
                      const MessageQuery& query, std::vector<Message>& messages, ServiceError& error);

    // Each timestamp is written at most once; repeated calls return the stored receipt.
    bool markDelivered(const std::string& caller, MessageKind kind, const std::string& message_id,
                       DeliveryReceipt& receipt, ServiceError& error);
    bool markRead(const std::string& caller, MessageKind kind, const std::string& message_id,
                  DeliveryReceipt& receipt, ServiceError& error);

    static constexpr int kDefaultPageSize = 50;
    static constexpr int kMaxPageSize = 100;

private:
    bool validate(const SendMessageRequest& request, ServiceError& error) const;
    bool resolveSenderDevice(Store& store, const std::string& caller, const std::string& device_id,
                             Device& device, ServiceError& error) const;
    bool updateReceipt(const std::string& caller, MessageKind kind, const std::string& message_id, bool read,
                       DeliveryReceipt& receipt, ServiceError& error);

    Storage& storage_;
    const Clock& clock_;
    MessagingPolicy policy_;
    EventPublisher* publisher_;
    RateLimiter direct_limiter_;
    RateLimiter group_limiter_;
};

} // namespace sealgate

#endif // MESSAGE_RELAY_HPP
