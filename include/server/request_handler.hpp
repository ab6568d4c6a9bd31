#ifndef REQUEST_HANDLER_HPP
#define REQUEST_HANDLER_HPP

#include <string>
#include <map>
#include <vector>
#include <boost/property_tree/ptree.hpp>
#include "../auth/caller_identity.hpp"
#include "../config/config.hpp"
#include "../groups/group_directory.hpp"
#include "../keys/key_service.hpp"
#include "../messaging/conversation_directory.hpp"
#include "../messaging/message_relay.hpp"
#include "../messaging/relationship_service.hpp"
#include "../metrics/metrics_aggregator.hpp"
#include "../utils/service_error.hpp"

namespace sealgate {

struct Services {
    RelationshipService& relationships;
    KeyService& keys;
    ConversationDirectory& conversations;
    GroupDirectory& groups;
    MessageRelay& relay;
    MetricsAggregator& metrics;
};

// One parsed API call. `segments` is the path without query string, split on '/'.
struct ApiRequest {
    std::string method;
    std::string path;
    std::vector<std::string> segments;
    std::map<std::string, std::string> query;
    std::map<std::string, std::string> headers;
    std::string body;
    Caller caller;
};

/**
 * Maps HTTP calls onto the services.
 *
 * A successful call returns a bare JSON body (sent as 200). Anything else is
 * returned as a complete "HTTP/1.1 <status>" response string carrying the
 * error body and the context headers of the failure.
 */
class RequestHandler {
public:
    RequestHandler(const Config& config, const Services& services, const CallerVerifier& verifier);

    std::string handleRequest(const std::string& method,
                              const std::string& path,
                              const std::map<std::string, std::string>& headers,
                              const std::string& body);

    static std::string errorResponse(const ServiceError& error);
    static std::string statusResponse(int status, const std::string& message);

private:
    Config config_;
    Services services_;
    const CallerVerifier& verifier_;

    bool authenticate(ApiRequest& request, std::string& failure);

    // /e2ee/...
    std::string routeKeys(const ApiRequest& request);
    std::string handleUploadBundle(const ApiRequest& request);
    std::string handleFetchBundle(const ApiRequest& request);
    std::string handleListDevices(const ApiRequest& request);
    std::string handleRevokeDevice(const ApiRequest& request);
    std::string handleClaimPrekey(const ApiRequest& request);

    // /dm/...
    std::string routeDirect(const ApiRequest& request);
    std::string handleFindOrCreateConversation(const ApiRequest& request);
    std::string handleListConversations(const ApiRequest& request);
    std::string handleGetConversation(const ApiRequest& request, const std::string& conversation_id);
    std::string handleSendDirect(const ApiRequest& request, const std::string& conversation_id);
    std::string handleBlock(const ApiRequest& request);
    std::string handleUnblock(const ApiRequest& request, const std::string& user_id);
    std::string handleListBlocks(const ApiRequest& request);
    std::string handleMetrics(const ApiRequest& request);

    // /groups/...
    std::string routeGroups(const ApiRequest& request);
    std::string handleCreateGroup(const ApiRequest& request);
    std::string handleListGroups(const ApiRequest& request);
    std::string handleGetGroup(const ApiRequest& request, const std::string& group_id);
    std::string handleUpdateGroup(const ApiRequest& request, const std::string& group_id);
    std::string handleCloseGroup(const ApiRequest& request, const std::string& group_id);
    std::string handleListMembers(const ApiRequest& request, const std::string& group_id);
    std::string handleAddMembers(const ApiRequest& request, const std::string& group_id);
    std::string handleRemoveMember(const ApiRequest& request, const std::string& group_id,
                                   const std::string& user_id);
    std::string handleLeave(const ApiRequest& request, const std::string& group_id);
    std::string handleRoleChange(const ApiRequest& request, const std::string& group_id, bool promote);
    std::string handleBan(const ApiRequest& request, const std::string& group_id);
    std::string handleUnban(const ApiRequest& request, const std::string& group_id, const std::string& user_id);
    std::string handleMute(const ApiRequest& request, const std::string& group_id);
    std::string handleCreateInvite(const ApiRequest& request, const std::string& group_id);
    std::string handleListInvites(const ApiRequest& request, const std::string& group_id);
    std::string handleRevokeInvite(const ApiRequest& request, const std::string& group_id,
                                   const std::string& invite_id);
    std::string handleJoin(const ApiRequest& request);
    std::string handleSendGroup(const ApiRequest& request, const std::string& group_id);

    // Shared by /dm and /groups.
    std::string handleListMessages(const ApiRequest& request, MessageKind kind, const std::string& target_id);
    std::string handleReceipt(const ApiRequest& request, MessageKind kind, const std::string& message_id,
                              bool read);

    static bool parseBody(const ApiRequest& request, boost::property_tree::ptree& tree, std::string& failure);
    static int queryInt(const ApiRequest& request, const std::string& key, int fallback);
};

} // namespace sealgate

#endif // REQUEST_HANDLER_HPP
