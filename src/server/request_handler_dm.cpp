#include "../../include/server/request_handler.hpp"
#include "../../include/server/response_writer.hpp"
#include "../../include/utils/json_parser.hpp"
#include <sstream>

namespace sealgate {

namespace {

// Reads the fields shared by 1:1 and group sends.
bool readSendRequest(const boost::property_tree::ptree& tree, SendMessageRequest& send, std::string& problem) {
    JsonParser::getString(tree, "sender_device_id", send.sender_device_id);
    JsonParser::getString(tree, "ciphertext", send.ciphertext);
    JsonParser::getString(tree, "client_message_id", send.client_message_id);
    int64_t proto = 0;
    if (!JsonParser::getInt64(tree, "proto", proto)) {
        problem = "proto must be an integer";
        return false;
    }
    send.proto = static_cast<int>(proto);
    return true;
}

std::string sendResult(const SendResult& result) {
    std::ostringstream oss;
    oss << "{\"success\":true"
        << ",\"message_id\":" << JsonParser::quote(result.message.id)
        << ",\"created_at\":" << views::timestamp(result.message.created_at)
        << ",\"duplicate\":" << (result.duplicate ? "true" : "false") << "}";
    return oss.str();
}

} // namespace

std::string RequestHandler::routeDirect(const ApiRequest& request) {
    const auto& s = request.segments;
    const std::string& m = request.method;

    if (s.size() == 2 && s[1] == "conversations") {
        if (m == "POST") return handleFindOrCreateConversation(request);
        if (m == "GET") return handleListConversations(request);
    } else if (s.size() == 3 && s[1] == "conversations" && m == "GET") {
        return handleGetConversation(request, s[2]);
    } else if (s.size() == 4 && s[1] == "conversations" && s[3] == "messages") {
        if (m == "POST") return handleSendDirect(request, s[2]);
        if (m == "GET") return handleListMessages(request, MessageKind::Direct, s[2]);
    } else if (s.size() == 4 && s[1] == "messages" && m == "POST") {
        if (s[3] == "delivered") return handleReceipt(request, MessageKind::Direct, s[2], false);
        if (s[3] == "read") return handleReceipt(request, MessageKind::Direct, s[2], true);
    } else if (s.size() == 2 && s[1] == "blocks") {
        if (m == "POST") return handleBlock(request);
        if (m == "GET") return handleListBlocks(request);
    } else if (s.size() == 3 && s[1] == "blocks" && m == "DELETE") {
        return handleUnblock(request, s[2]);
    } else if (s.size() == 2 && s[1] == "metrics" && m == "GET") {
        return handleMetrics(request);
    }
    return statusResponse(404, "Not found");
}

// POST /dm/conversations  { "peer_user_id" }
std::string RequestHandler::handleFindOrCreateConversation(const ApiRequest& request) {
    boost::property_tree::ptree tree;
    std::string failure;
    if (!parseBody(request, tree, failure)) {
        return failure;
    }
    std::string peer_user_id;
    if (!JsonParser::getString(tree, "peer_user_id", peer_user_id)) {
        JsonParser::getString(tree, "user_id", peer_user_id);
    }

    ConversationView view;
    bool created = false;
    ServiceError error;
    if (!services_.conversations.findOrCreate(request.caller.user_id, peer_user_id, view, created, error)) {
        return errorResponse(error);
    }
    return "{\"success\":true,\"created\":" + std::string(created ? "true" : "false") +
           ",\"conversation\":" + views::conversation(view) + "}";
}

std::string RequestHandler::handleListConversations(const ApiRequest& request) {
    std::vector<ConversationSummary> conversations;
    ServiceError error;
    if (!services_.conversations.listConversations(request.caller.user_id, queryInt(request, "limit", 0),
                                                   queryInt(request, "offset", 0), conversations, error)) {
        return errorResponse(error);
    }
    return "{\"success\":true,\"conversations\":" + views::array(conversations, views::conversationSummary) +
           ",\"count\":" + std::to_string(conversations.size()) + "}";
}

std::string RequestHandler::handleGetConversation(const ApiRequest& request, const std::string& conversation_id) {
    ConversationView view;
    ServiceError error;
    if (!services_.conversations.getConversation(request.caller.user_id, conversation_id, view, error)) {
        return errorResponse(error);
    }
    return "{\"success\":true,\"conversation\":" + views::conversation(view) + "}";
}

/**
 * POST /dm/conversations/{id}/messages
 *
 * Request: { "ciphertext": "base64", "proto": 1, "client_message_id"?, "sender_device_id"? }
 * Response: { "message_id", "created_at", "duplicate" }
 */
std::string RequestHandler::handleSendDirect(const ApiRequest& request, const std::string& conversation_id) {
    boost::property_tree::ptree tree;
    std::string failure;
    if (!parseBody(request, tree, failure)) {
        return failure;
    }
    SendMessageRequest send;
    std::string problem;
    if (!readSendRequest(tree, send, problem)) {
        return statusResponse(400, problem);
    }

    SendResult result;
    ServiceError error;
    if (!services_.relay.sendDirect(request.caller.user_id, conversation_id, send, result, error)) {
        return errorResponse(error);
    }
    return sendResult(result);
}

// POST /dm/blocks  { "user_id" }
std::string RequestHandler::handleBlock(const ApiRequest& request) {
    boost::property_tree::ptree tree;
    std::string failure;
    if (!parseBody(request, tree, failure)) {
        return failure;
    }
    std::string user_id;
    JsonParser::getString(tree, "user_id", user_id);

    bool already_blocked = false;
    ServiceError error;
    if (!services_.relationships.block(request.caller.user_id, user_id, already_blocked, error)) {
        return errorResponse(error);
    }
    return JsonParser::createSuccessResponse(already_blocked ? "User already blocked" : "User blocked",
                                             {{"user_id", user_id}});
}

std::string RequestHandler::handleUnblock(const ApiRequest& request, const std::string& user_id) {
    ServiceError error;
    if (!services_.relationships.unblock(request.caller.user_id, user_id, error)) {
        return errorResponse(error);
    }
    return JsonParser::createSuccessResponse("User unblocked", {{"user_id", user_id}});
}

std::string RequestHandler::handleListBlocks(const ApiRequest& request) {
    std::vector<BlockEntry> blocks;
    ServiceError error;
    if (!services_.relationships.listBlocks(request.caller.user_id, blocks, error)) {
        return errorResponse(error);
    }
    return "{\"success\":true,\"blocked\":" + views::array(blocks, views::block) + "}";
}

// GET /dm/metrics (operators only)
std::string RequestHandler::handleMetrics(const ApiRequest& request) {
    MetricsSnapshot snapshot;
    ServiceError error;
    if (!services_.metrics.snapshot(request.caller.isOperator(), snapshot, error)) {
        return errorResponse(error);
    }
    return views::metrics(snapshot);
}

} // namespace sealgate
