#ifndef RESPONSE_WRITER_HPP
#define RESPONSE_WRITER_HPP

#include <string>
#include <vector>
#include "../groups/group_directory.hpp"
#include "../keys/key_service.hpp"
#include "../messaging/conversation_directory.hpp"
#include "../metrics/metrics_aggregator.hpp"
#include "../storage/records.hpp"

namespace sealgate {

// JSON renderings of service results. Timestamps are ISO-8601 UTC, unset ones null.
namespace views {

std::string timestamp(int64_t millis);

std::string device(const Device& device);
std::string deviceBundle(const DeviceBundleView& bundle);
std::string conversation(const ConversationView& view);
std::string conversationSummary(const ConversationSummary& summary);
std::string message(const Message& message);
std::string receipt(const DeliveryReceipt& receipt);
std::string block(const BlockEntry& entry);
std::string group(const GroupView& view);
std::string participant(const GroupParticipant& participant);
std::string invite(const GroupInvite& invite);
std::string metrics(const MetricsSnapshot& snapshot);

template <typename T, typename Render>
std::string array(const std::vector<T>& items, Render render) {
    std::string out = "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += ",";
        }
        out += render(items[i]);
    }
    out += "]";
    return out;
}

} // namespace views
} // namespace sealgate

#endif // RESPONSE_WRITER_HPP
