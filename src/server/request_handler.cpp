#include "../../include/server/request_handler.hpp"
#include "../../include/server/response_writer.hpp"
#include "../../include/utils/json_parser.hpp"
#include "../../include/utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace sealgate {

namespace {

std::string toLowerCopy(const std::string& value) {
    std::string out = value;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

std::string urlDecode(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        const char c = value[i];
        if (c == '+') {
            result.push_back(' ');
            continue;
        }
        if (c == '%' && i + 2 < value.size()) {
            int high = hexValue(value[i + 1]);
            int low = hexValue(value[i + 2]);
            if (high >= 0 && low >= 0) {
                result.push_back(static_cast<char>((high << 4) | low));
                i += 2;
                continue;
            }
        }
        result.push_back(c);
    }
    return result;
}

std::map<std::string, std::string> parseQuery(const std::string& query) {
    std::map<std::string, std::string> params;
    std::istringstream stream(query);
    std::string pair;
    while (std::getline(stream, pair, '&')) {
        if (pair.empty()) {
            continue;
        }
        size_t pos = pair.find('=');
        if (pos == std::string::npos) {
            params[urlDecode(pair)] = "";
        } else {
            params[urlDecode(pair.substr(0, pos))] = urlDecode(pair.substr(pos + 1));
        }
    }
    return params;
}

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> segments;
    std::istringstream stream(path);
    std::string segment;
    while (std::getline(stream, segment, '/')) {
        if (!segment.empty()) {
            segments.push_back(urlDecode(segment));
        }
    }
    return segments;
}

std::string headerValue(const std::map<std::string, std::string>& headers, const std::string& name) {
    const std::string wanted = toLowerCopy(name);
    for (const auto& header : headers) {
        if (toLowerCopy(header.first) == wanted) {
            return header.second;
        }
    }
    return "";
}

std::string statusReasonPhrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 410: return "Gone";
        case 413: return "Payload Too Large";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Error";
    }
}

} // namespace

RequestHandler::RequestHandler(const Config& config, const Services& services, const CallerVerifier& verifier)
    : config_(config), services_(services), verifier_(verifier) {}

std::string RequestHandler::errorResponse(const ServiceError& error) {
    std::string body = JsonParser::createErrorResponse(error.code, error.message, error.context);
    std::ostringstream oss;
    oss << "HTTP/1.1 " << error.status << " " << statusReasonPhrase(error.status) << "\r\n";
    oss << "Content-Type: application/json\r\n";
    for (const auto& header : error.headers) {
        oss << header.first << ": " << header.second << "\r\n";
    }
    oss << "Content-Length: " << body.size() << "\r\n";
    oss << "\r\n";
    oss << body;
    return oss.str();
}

std::string RequestHandler::statusResponse(int status, const std::string& message) {
    ServiceError error;
    error.set(status, "", message);
    return errorResponse(error);
}

bool RequestHandler::parseBody(const ApiRequest& request, boost::property_tree::ptree& tree, std::string& failure) {
    if (request.body.empty()) {
        tree.clear();
        return true;
    }
    if (!JsonParser::parseObject(request.body, tree)) {
        failure = statusResponse(400, "Invalid JSON body");
        return false;
    }
    return true;
}

int RequestHandler::queryInt(const ApiRequest& request, const std::string& key, int fallback) {
    auto it = request.query.find(key);
    if (it == request.query.end() || it->second.empty()) {
        return fallback;
    }
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(it->second.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || value < 0 || value > 1000000) {
        return fallback;
    }
    return static_cast<int>(value);
}

bool RequestHandler::authenticate(ApiRequest& request, std::string& failure) {
    const std::string user_id = headerValue(request.headers, "X-Caller-Id");
    const std::string role = headerValue(request.headers, "X-Caller-Role");
    const std::string signature = headerValue(request.headers, "X-Caller-Signature");
    if (user_id.empty() || !verifier_.verify(user_id, role, signature, request.caller)) {
        Logger::getInstance().warning("Rejected caller identity on " + request.method + " " + request.path);
        failure = statusResponse(401, "Missing or invalid caller identity");
        return false;
    }
    ServiceError error;
    if (!services_.relationships.registerUser(request.caller.user_id,
                                              headerValue(request.headers, "X-Caller-Name"), error)) {
        failure = errorResponse(error);
        return false;
    }
    return true;
}

std::string RequestHandler::handleRequest(const std::string& method,
                                          const std::string& path,
                                          const std::map<std::string, std::string>& headers,
                                          const std::string& body) {
    ApiRequest request;
    request.method = method;
    request.headers = headers;
    request.body = body;

    // Strip query string for routing
    size_t qpos = path.find('?');
    request.path = qpos == std::string::npos ? path : path.substr(0, qpos);
    if (qpos != std::string::npos) {
        request.query = parseQuery(path.substr(qpos + 1));
    }
    request.segments = splitPath(request.path);

    try {
        if (request.segments.size() == 1 && request.segments[0] == "health") {
            return "{\"status\":\"ok\"}";
        }
        if (request.segments.empty()) {
            return statusResponse(404, "Not found");
        }

        const std::string& area = request.segments[0];
        if (area != "e2ee" && area != "dm" && area != "groups") {
            return statusResponse(404, "Not found");
        }
        if ((area == "groups" && !config_.groups_enabled) || (area != "groups" && !config_.dm_enabled)) {
            return statusResponse(403, area == "groups" ? "Groups feature is not enabled"
                                                        : "E2EE DM is not enabled");
        }

        std::string failure;
        if (!authenticate(request, failure)) {
            return failure;
        }

        if (area == "e2ee") {
            return routeKeys(request);
        }
        if (area == "dm") {
            return routeDirect(request);
        }
        return routeGroups(request);
    } catch (const std::exception& e) {
        Logger::getInstance().error("Unhandled exception on " + method + " " + request.path + ": " + e.what());
        return statusResponse(500, "Internal server error");
    }
}

std::string RequestHandler::handleListMessages(const ApiRequest& request, MessageKind kind,
                                               const std::string& target_id) {
    MessageQuery query;
    query.limit = queryInt(request, "limit", MessageRelay::kDefaultPageSize);
    auto cursor = request.query.find("cursor");
    if (cursor != request.query.end()) {
        query.cursor = cursor->second;
    }
    auto after = request.query.find("after");
    if (after == request.query.end()) {
        after = request.query.find("since");
    }
    if (after != request.query.end()) {
        query.after = after->second;
    }

    std::vector<Message> messages;
    ServiceError error;
    if (!services_.relay.listMessages(request.caller.user_id, kind, target_id, query, messages, error)) {
        return errorResponse(error);
    }

    std::ostringstream oss;
    oss << "{\"success\":true,\"messages\":" << views::array(messages, views::message)
        << ",\"count\":" << messages.size();
    if (!messages.empty()) {
        oss << ",\"next_cursor\":" << JsonParser::quote(messages.front().id);
    } else {
        oss << ",\"next_cursor\":null";
    }
    oss << "}";
    return oss.str();
}

std::string RequestHandler::handleReceipt(const ApiRequest& request, MessageKind kind,
                                          const std::string& message_id, bool read) {
    DeliveryReceipt receipt;
    ServiceError error;
    bool ok = read ? services_.relay.markRead(request.caller.user_id, kind, message_id, receipt, error)
                   : services_.relay.markDelivered(request.caller.user_id, kind, message_id, receipt, error);
    if (!ok) {
        return errorResponse(error);
    }
    std::ostringstream oss;
    oss << "{\"success\":true,\"message_id\":" << JsonParser::quote(message_id)
        << ",\"delivered_at\":" << views::timestamp(receipt.delivered_at)
        << ",\"read_at\":" << views::timestamp(receipt.read_at) << "}";
    return oss.str();
}

} // namespace sealgate
