#include "../../include/server/request_handler.hpp"
#include "../../include/server/response_writer.hpp"
#include "../../include/utils/json_parser.hpp"
#include <sstream>

namespace sealgate {

namespace {

std::string membershipResult(const MembershipChange& change) {
    std::ostringstream oss;
    oss << "{\"success\":true"
        << ",\"added_user_ids\":" << JsonParser::stringArray(change.added_user_ids)
        << ",\"group_epoch\":" << change.new_epoch
        << ",\"epoch_changed\":" << (change.epoch_changed ? "true" : "false")
        << "}";
    return oss.str();
}

// Absent or null means "not given"; anything else must be an ISO-8601 time.
bool readOptionalTimestamp(const boost::property_tree::ptree& tree, const std::string& key, int64_t& millis,
                           bool& present) {
    std::string raw;
    present = JsonParser::getString(tree, key, raw) && !raw.empty();
    millis = 0;
    if (!present) {
        return true;
    }
    return parseTimestamp(raw, millis);
}

} // namespace

std::string RequestHandler::routeGroups(const ApiRequest& request) {
    const auto& s = request.segments;
    const std::string& m = request.method;

    if (s.size() == 1) {
        if (m == "POST") return handleCreateGroup(request);
        if (m == "GET") return handleListGroups(request);
        return statusResponse(404, "Not found");
    }
    if (s.size() == 2 && s[1] == "join" && m == "POST") {
        return handleJoin(request);
    }
    if (s.size() == 4 && s[1] == "group-messages" && m == "POST") {
        if (s[3] == "delivered") return handleReceipt(request, MessageKind::Group, s[2], false);
        if (s[3] == "read") return handleReceipt(request, MessageKind::Group, s[2], true);
        return statusResponse(404, "Not found");
    }

    const std::string& group_id = s[1];
    if (s.size() == 2) {
        if (m == "GET") return handleGetGroup(request, group_id);
        if (m == "PATCH" || m == "PUT") return handleUpdateGroup(request, group_id);
        if (m == "DELETE") return handleCloseGroup(request, group_id);
        return statusResponse(404, "Not found");
    }

    const std::string& action = s[2];
    if (s.size() == 3) {
        if (action == "members" && m == "GET") return handleListMembers(request, group_id);
        if (action == "members" && m == "POST") return handleAddMembers(request, group_id);
        if (action == "leave" && m == "POST") return handleLeave(request, group_id);
        if (action == "promote" && m == "POST") return handleRoleChange(request, group_id, true);
        if (action == "demote" && m == "POST") return handleRoleChange(request, group_id, false);
        if (action == "ban" && m == "POST") return handleBan(request, group_id);
        if (action == "mute" && m == "POST") return handleMute(request, group_id);
        if (action == "invites" && m == "POST") return handleCreateInvite(request, group_id);
        if (action == "invites" && m == "GET") return handleListInvites(request, group_id);
        if (action == "messages" && m == "POST") return handleSendGroup(request, group_id);
        if (action == "messages" && m == "GET") return handleListMessages(request, MessageKind::Group, group_id);
    } else if (s.size() == 4 && m == "DELETE") {
        if (action == "members") return handleRemoveMember(request, group_id, s[3]);
        if (action == "ban") return handleUnban(request, group_id, s[3]);
        if (action == "invites") return handleRevokeInvite(request, group_id, s[3]);
    }
    return statusResponse(404, "Not found");
}

// POST /groups  { "title", "about"? }
std::string RequestHandler::handleCreateGroup(const ApiRequest& request) {
    boost::property_tree::ptree tree;
    std::string failure;
    if (!parseBody(request, tree, failure)) {
        return failure;
    }
    std::string title;
    std::string about;
    JsonParser::getString(tree, "title", title);
    JsonParser::getString(tree, "about", about);

    GroupView view;
    ServiceError error;
    if (!services_.groups.createGroup(request.caller.user_id, title, about, view, error)) {
        return errorResponse(error);
    }
    return "{\"success\":true,\"group\":" + views::group(view) + "}";
}

std::string RequestHandler::handleListGroups(const ApiRequest& request) {
    std::vector<GroupView> groups;
    ServiceError error;
    if (!services_.groups.listGroups(request.caller.user_id, groups, error)) {
        return errorResponse(error);
    }
    return "{\"success\":true,\"groups\":" + views::array(groups, views::group) +
           ",\"count\":" + std::to_string(groups.size()) + "}";
}

std::string RequestHandler::handleGetGroup(const ApiRequest& request, const std::string& group_id) {
    GroupView view;
    ServiceError error;
    if (!services_.groups.getGroup(request.caller.user_id, group_id, view, error)) {
        return errorResponse(error);
    }
    return "{\"success\":true,\"group\":" + views::group(view) + "}";
}

std::string RequestHandler::handleUpdateGroup(const ApiRequest& request, const std::string& group_id) {
    boost::property_tree::ptree tree;
    std::string failure;
    if (!parseBody(request, tree, failure)) {
        return failure;
    }
    std::optional<std::string> title;
    std::optional<std::string> about;
    std::string value;
    if (JsonParser::getString(tree, "title", value)) {
        title = value;
    }
    if (JsonParser::getString(tree, "about", value)) {
        about = value;
    }

    GroupView view;
    ServiceError error;
    if (!services_.groups.updateGroup(request.caller.user_id, group_id, title, about, view, error)) {
        return errorResponse(error);
    }
    return "{\"success\":true,\"group\":" + views::group(view) + "}";
}

std::string RequestHandler::handleCloseGroup(const ApiRequest& request, const std::string& group_id) {
    ServiceError error;
    if (!services_.groups.closeGroup(request.caller.user_id, group_id, error)) {
        return errorResponse(error);
    }
    return JsonParser::createSuccessResponse("Group closed", {{"group_id", group_id}});
}

std::string RequestHandler::handleListMembers(const ApiRequest& request, const std::string& group_id) {
    std::vector<GroupParticipant> members;
    ServiceError error;
    if (!services_.groups.listMembers(request.caller.user_id, group_id, members, error)) {
        return errorResponse(error);
    }
    return "{\"success\":true,\"members\":" + views::array(members, views::participant) +
           ",\"count\":" + std::to_string(members.size()) + "}";
}

// POST /groups/{id}/members  { "user_ids": [...] }
std::string RequestHandler::handleAddMembers(const ApiRequest& request, const std::string& group_id) {
    boost::property_tree::ptree tree;
    std::string failure;
    if (!parseBody(request, tree, failure)) {
        return failure;
    }
    std::vector<std::string> user_ids;
    if (!JsonParser::getStringArray(tree, "user_ids", user_ids)) {
        std::string single;
        if (!JsonParser::getString(tree, "user_id", single)) {
            return statusResponse(400, "user_ids must be an array of user ids");
        }
        user_ids.push_back(single);
    }

    MembershipChange change;
    ServiceError error;
    if (!services_.groups.addMembers(request.caller.user_id, group_id, user_ids, change, error)) {
        return errorResponse(error);
    }
    return membershipResult(change);
}

std::string RequestHandler::handleRemoveMember(const ApiRequest& request, const std::string& group_id,
                                               const std::string& user_id) {
    MembershipChange change;
    ServiceError error;
    if (!services_.groups.removeMember(request.caller.user_id, group_id, user_id, change, error)) {
        return errorResponse(error);
    }
    return membershipResult(change);
}

std::string RequestHandler::handleLeave(const ApiRequest& request, const std::string& group_id) {
    MembershipChange change;
    ServiceError error;
    if (!services_.groups.leave(request.caller.user_id, group_id, change, error)) {
        return errorResponse(error);
    }
    return membershipResult(change);
}

std::string RequestHandler::handleRoleChange(const ApiRequest& request, const std::string& group_id, bool promote) {
    boost::property_tree::ptree tree;
    std::string failure;
    if (!parseBody(request, tree, failure)) {
        return failure;
    }
    std::string user_id;
    JsonParser::getString(tree, "user_id", user_id);

    ServiceError error;
    bool ok = promote ? services_.groups.promote(request.caller.user_id, group_id, user_id, error)
                      : services_.groups.demote(request.caller.user_id, group_id, user_id, error);
    if (!ok) {
        return errorResponse(error);
    }
    return JsonParser::createSuccessResponse(promote ? "Member promoted" : "Member demoted",
                                             {{"user_id", user_id}, {"role", promote ? "admin" : "member"}});
}

// POST /groups/{id}/ban  { "user_id", "reason"? }
std::string RequestHandler::handleBan(const ApiRequest& request, const std::string& group_id) {
    boost::property_tree::ptree tree;
    std::string failure;
    if (!parseBody(request, tree, failure)) {
        return failure;
    }
    std::string user_id;
    std::string reason;
    JsonParser::getString(tree, "user_id", user_id);
    JsonParser::getString(tree, "reason", reason);

    MembershipChange change;
    ServiceError error;
    if (!services_.groups.ban(request.caller.user_id, group_id, user_id, reason, change, error)) {
        return errorResponse(error);
    }
    return membershipResult(change);
}

std::string RequestHandler::handleUnban(const ApiRequest& request, const std::string& group_id,
                                        const std::string& user_id) {
    ServiceError error;
    if (!services_.groups.unban(request.caller.user_id, group_id, user_id, error)) {
        return errorResponse(error);
    }
    return JsonParser::createSuccessResponse("User unbanned", {{"user_id", user_id}});
}

// POST /groups/{id}/mute  { "mute_until": "2026-01-01T00:00:00Z" | null }
std::string RequestHandler::handleMute(const ApiRequest& request, const std::string& group_id) {
    boost::property_tree::ptree tree;
    std::string failure;
    if (!parseBody(request, tree, failure)) {
        return failure;
    }
    int64_t mute_until = 0;
    bool present = false;
    if (!readOptionalTimestamp(tree, "mute_until", mute_until, present)) {
        return statusResponse(400, "mute_until must be an ISO-8601 timestamp or null");
    }

    ServiceError error;
    if (!services_.groups.mute(request.caller.user_id, group_id, mute_until, error)) {
        return errorResponse(error);
    }
    return "{\"success\":true,\"mute_until\":" + views::timestamp(mute_until) + "}";
}

// POST /groups/{id}/invites  { "type"?, "target_user_id"?, "expires_at"?, "max_uses"? }
std::string RequestHandler::handleCreateInvite(const ApiRequest& request, const std::string& group_id) {
    boost::property_tree::ptree tree;
    std::string failure;
    if (!parseBody(request, tree, failure)) {
        return failure;
    }
    CreateInviteRequest invite_request;
    JsonParser::getString(tree, "type", invite_request.type);
    JsonParser::getString(tree, "target_user_id", invite_request.target_user_id);
    bool present = false;
    if (!readOptionalTimestamp(tree, "expires_at", invite_request.expires_at, present)) {
        return statusResponse(400, "expires_at must be an ISO-8601 timestamp");
    }
    std::string raw_max_uses;
    if (JsonParser::getString(tree, "max_uses", raw_max_uses)) {
        int64_t max_uses = 0;
        if (!JsonParser::getInt64(tree, "max_uses", max_uses)) {
            return statusResponse(400, "max_uses must be an integer");
        }
        invite_request.max_uses = max_uses;
    }

    GroupInvite invite;
    ServiceError error;
    if (!services_.groups.createInvite(request.caller.user_id, group_id, invite_request, invite, error)) {
        return errorResponse(error);
    }
    return "{\"success\":true,\"invite\":" + views::invite(invite) + "}";
}

std::string RequestHandler::handleListInvites(const ApiRequest& request, const std::string& group_id) {
    std::vector<GroupInvite> invites;
    ServiceError error;
    if (!services_.groups.listInvites(request.caller.user_id, group_id, invites, error)) {
        return errorResponse(error);
    }
    return "{\"success\":true,\"invites\":" + views::array(invites, views::invite) + "}";
}

std::string RequestHandler::handleRevokeInvite(const ApiRequest& request, const std::string& group_id,
                                               const std::string& invite_id) {
    ServiceError error;
    if (!services_.groups.revokeInvite(request.caller.user_id, group_id, invite_id, error)) {
        return errorResponse(error);
    }
    return JsonParser::createSuccessResponse("Invite revoked", {{"invite_id", invite_id}});
}

// POST /groups/join  { "code" }
std::string RequestHandler::handleJoin(const ApiRequest& request) {
    boost::property_tree::ptree tree;
    std::string failure;
    if (!parseBody(request, tree, failure)) {
        return failure;
    }
    std::string code;
    JsonParser::getString(tree, "code", code);

    std::string group_id;
    MembershipChange change;
    ServiceError error;
    if (!services_.groups.joinByCode(request.caller.user_id, code, group_id, change, error)) {
        return errorResponse(error);
    }
    std::ostringstream oss;
    oss << "{\"success\":true,\"group_id\":" << JsonParser::quote(group_id)
        << ",\"group_epoch\":" << change.new_epoch
        << ",\"epoch_changed\":" << (change.epoch_changed ? "true" : "false") << "}";
    return oss.str();
}

/**
 * POST /groups/{id}/messages
 *
 * The client must state the epoch it encrypted for; a stale epoch is rejected
 * with 409 and the current epoch so the client can rekey and retry.
 */
std::string RequestHandler::handleSendGroup(const ApiRequest& request, const std::string& group_id) {
    boost::property_tree::ptree tree;
    std::string failure;
    if (!parseBody(request, tree, failure)) {
        return failure;
    }
    SendMessageRequest send;
    JsonParser::getString(tree, "sender_device_id", send.sender_device_id);
    JsonParser::getString(tree, "ciphertext", send.ciphertext);
    JsonParser::getString(tree, "client_message_id", send.client_message_id);
    JsonParser::getString(tree, "reply_to_message_id", send.reply_to_message_id);
    int64_t proto = 0;
    if (!JsonParser::getInt64(tree, "proto", proto)) {
        return statusResponse(400, "proto must be an integer");
    }
    send.proto = static_cast<int>(proto);
    int64_t epoch = -1;
    if (!JsonParser::getInt64(tree, "group_epoch", epoch)) {
        return statusResponse(400, "group_epoch is required");
    }
    send.group_epoch = epoch;

    SendResult result;
    ServiceError error;
    if (!services_.relay.sendGroup(request.caller.user_id, group_id, send, result, error)) {
        return errorResponse(error);
    }
    std::ostringstream oss;
    oss << "{\"success\":true"
        << ",\"message_id\":" << JsonParser::quote(result.message.id)
        << ",\"created_at\":" << views::timestamp(result.message.created_at)
        << ",\"group_epoch\":" << result.message.group_epoch
        << ",\"duplicate\":" << (result.duplicate ? "true" : "false") << "}";
    return oss.str();
}

} // namespace sealgate
