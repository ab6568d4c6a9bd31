#include "../../include/server/response_writer.hpp"
#include "../../include/utils/clock.hpp"
#include "../../include/utils/json_parser.hpp"
#include <iomanip>
#include <sstream>

namespace sealgate {
namespace views {

namespace {

std::string q(const std::string& value) {
    return JsonParser::quote(value);
}

std::string optionalString(const std::string& value) {
    return value.empty() ? "null" : q(value);
}

const char* boolText(bool value) {
    return value ? "true" : "false";
}

} // namespace

std::string timestamp(int64_t millis) {
    return millis == 0 ? "null" : q(formatTimestamp(millis));
}

std::string device(const Device& device) {
    std::ostringstream oss;
    oss << "{\"device_id\":" << q(device.id)
        << ",\"device_name\":" << optionalString(device.display_name)
        << ",\"status\":" << q(device.status)
        << ",\"created_at\":" << timestamp(device.created_at)
        << ",\"last_seen_at\":" << timestamp(device.last_seen_at)
        << "}";
    return oss.str();
}

std::string deviceBundle(const DeviceBundleView& bundle) {
    std::ostringstream oss;
    oss << "{\"device_id\":" << q(bundle.device_id)
        << ",\"device_name\":" << optionalString(bundle.device_name)
        << ",\"identity_key_pub\":" << q(bundle.identity_key_pub)
        << ",\"signed_prekey_pub\":" << q(bundle.signed_prekey_pub)
        << ",\"signed_prekey_sig\":" << q(bundle.signed_prekey_sig)
        << ",\"bundle_version\":" << bundle.bundle_version
        << ",\"prekeys_available\":" << bundle.prekeys_available
        << "}";
    return oss.str();
}

std::string conversation(const ConversationView& view) {
    std::ostringstream oss;
    oss << "{\"conversation_id\":" << q(view.conversation.id)
        << ",\"created_at\":" << timestamp(view.conversation.created_at)
        << ",\"last_message_at\":" << timestamp(view.conversation.last_message_at)
        << ",\"participants\":[";
    for (size_t i = 0; i < view.participants.size(); ++i) {
        const Participant& p = view.participants[i];
        if (i > 0) {
            oss << ",";
        }
        oss << "{\"user_id\":" << q(p.user_id)
            << ",\"device_ids\":" << JsonParser::stringArray(p.device_ids) << "}";
    }
    oss << "]}";
    return oss.str();
}

std::string conversationSummary(const ConversationSummary& summary) {
    std::ostringstream oss;
    oss << "{\"conversation_id\":" << q(summary.conversation_id)
        << ",\"peer_user_id\":" << q(summary.peer_user_id)
        << ",\"peer_username\":" << optionalString(summary.peer_username)
        << ",\"created_at\":" << timestamp(summary.created_at)
        << ",\"last_message_at\":" << timestamp(summary.last_message_at)
        << ",\"unread_count\":" << summary.unread_count
        << "}";
    return oss.str();
}

std::string message(const Message& message) {
    std::ostringstream oss;
    oss << "{\"id\":" << q(message.id)
        << ",\"sender_user_id\":" << q(message.sender_user_id)
        << ",\"sender_device_id\":" << q(message.sender_device_id)
        << ",\"ciphertext\":" << q(message.ciphertext)
        << ",\"proto\":" << message.proto
        << ",\"created_at\":" << timestamp(message.created_at)
        << ",\"client_message_id\":" << optionalString(message.client_message_id);
    if (message.kind == MessageKind::Group) {
        oss << ",\"group_epoch\":" << message.group_epoch
            << ",\"reply_to_message_id\":" << optionalString(message.reply_to_message_id);
    }
    oss << "}";
    return oss.str();
}

std::string receipt(const DeliveryReceipt& receipt) {
    std::ostringstream oss;
    oss << "{\"message_id\":" << q(receipt.message_id)
        << ",\"delivered_at\":" << timestamp(receipt.delivered_at)
        << ",\"read_at\":" << timestamp(receipt.read_at)
        << "}";
    return oss.str();
}

std::string block(const BlockEntry& entry) {
    return "{\"user_id\":" + q(entry.blocked_id) + ",\"blocked_at\":" + timestamp(entry.created_at) + "}";
}

std::string group(const GroupView& view) {
    const Group& g = view.group;
    std::ostringstream oss;
    oss << "{\"id\":" << q(g.id)
        << ",\"title\":" << q(g.title)
        << ",\"about\":" << optionalString(g.about)
        << ",\"created_by\":" << q(g.created_by)
        << ",\"created_at\":" << timestamp(g.created_at)
        << ",\"updated_at\":" << timestamp(g.updated_at)
        << ",\"max_participants\":" << g.max_participants
        << ",\"participant_count\":" << view.participant_count
        << ",\"group_epoch\":" << g.group_epoch
        << ",\"is_closed\":" << boolText(g.is_closed)
        << ",\"my_role\":" << optionalString(view.my_role)
        << "}";
    return oss.str();
}

std::string participant(const GroupParticipant& participant) {
    std::ostringstream oss;
    oss << "{\"user_id\":" << q(participant.user_id)
        << ",\"role\":" << q(participant.role)
        << ",\"joined_at\":" << timestamp(participant.joined_at)
        << ",\"mute_until\":" << timestamp(participant.mute_until)
        << "}";
    return oss.str();
}

std::string invite(const GroupInvite& invite) {
    std::ostringstream oss;
    oss << "{\"id\":" << q(invite.id)
        << ",\"group_id\":" << q(invite.group_id)
        << ",\"type\":" << q(invite.type)
        << ",\"code\":" << q(invite.code)
        << ",\"created_by\":" << q(invite.created_by)
        << ",\"target_user_id\":" << optionalString(invite.target_user_id)
        << ",\"expires_at\":" << timestamp(invite.expires_at)
        << ",\"max_uses\":" << (invite.max_uses > 0 ? std::to_string(invite.max_uses) : std::string("null"))
        << ",\"uses\":" << invite.uses
        << ",\"created_at\":" << timestamp(invite.created_at)
        << "}";
    return oss.str();
}

std::string metrics(const MetricsSnapshot& snapshot) {
    std::ostringstream oss;
    oss << "{\"success\":true"
        << ",\"timestamp\":" << timestamp(snapshot.generated_at)
        << ",\"stale\":" << boolText(snapshot.stale)
        << ",\"metrics\":{";

    oss << "\"ws_connections\":{\"total\":" << snapshot.connections.total << ",\"per_user\":{";
    bool first = true;
    for (const auto& entry : snapshot.connections.per_user) {
        if (!first) {
            oss << ",";
        }
        first = false;
        oss << q(entry.first) << ":" << entry.second;
    }
    oss << "}}";

    const PrekeyPoolStats& pools = snapshot.prekeys;
    oss << ",\"otpk_pools\":{\"total_available\":" << pools.total_available
        << ",\"total_claimed\":" << pools.total_claimed
        << ",\"devices_low_watermark\":" << pools.low_devices
        << ",\"devices_critical_watermark\":" << pools.critical_devices
        << ",\"device_ids_low\":" << JsonParser::stringArray(pools.low_device_ids)
        << ",\"device_ids_critical\":" << JsonParser::stringArray(pools.critical_device_ids)
        << "}";

    oss << ",\"signed_prekeys\":{\"old_prekeys_count\":" << snapshot.stale_signed_prekeys
        << ",\"max_age_days\":" << snapshot.signed_prekey_max_age_days << "}";

    oss << ",\"messages\":{\"today\":" << snapshot.direct_messages.today
        << ",\"last_hour\":" << snapshot.direct_messages.last_hour << "}";
    oss << ",\"group_messages\":{\"today\":" << snapshot.group_messages.today
        << ",\"last_hour\":" << snapshot.group_messages.last_hour << "}";

    oss << ",\"delivery\":{\"undelivered\":" << snapshot.delivery.undelivered
        << ",\"unread\":" << snapshot.delivery.delivered_unread
        << ",\"avg_delivery_ms\":" << std::fixed << std::setprecision(2) << snapshot.delivery.avg_delivery_ms
        << "}";

    oss << ",\"devices\":{\"total\":" << snapshot.devices.total
        << ",\"active\":" << snapshot.devices.active
        << ",\"revoked\":" << snapshot.devices.revoked << "}";

    oss << ",\"groups\":{\"total\":" << snapshot.groups.total
        << ",\"active\":" << snapshot.groups.active
        << ",\"closed\":" << snapshot.groups.closed
        << ",\"epoch_changes_24h\":" << snapshot.groups.epoch_changes << "}";

    oss << "}}";
    return oss.str();
}

} // namespace views
} // namespace sealgate
