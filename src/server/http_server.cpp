#include "../../include/server/http_server.hpp"
#include "../../include/utils/logger.hpp"
#include "../../include/utils/json_parser.hpp"
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/system/system_error.hpp>
#include <deque>
#include <sstream>
#include <algorithm>

namespace {

// Ciphertext is capped well below this; the slack covers JSON framing.
constexpr std::uint64_t kMaxRequestBodySize = 4ULL * 1024 * 1024;

std::string fieldValue(const http::request<http::string_body>& req, const char* name) {
    auto it = req.find(name);
    return it == req.end() ? std::string() : std::string(it->value());
}

void applySecurityHeaders(http::response<http::string_body>& res) {
    res.set(http::field::server, "sealgate");
    res.set(http::field::cache_control, "no-store");
    res.set("X-Content-Type-Options", "nosniff");
    res.set("X-Frame-Options", "DENY");
    res.set("Referrer-Policy", "no-referrer");
}

http::response<http::string_body> jsonResponse(http::status status, const std::string& body) {
    http::response<http::string_body> res;
    res.result(status);
    res.set(http::field::content_type, "application/json");
    applySecurityHeaders(res);
    res.body() = body;
    res.prepare_payload();
    return res;
}

// Turns a handler result into a Beast response. Handlers return either a bare
// JSON body (200) or a full "HTTP/1.1 <status> ..." string with headers.
http::response<http::string_body> toResponse(const std::string& response_str) {
    if (response_str.compare(0, 9, "HTTP/1.1 ") != 0) {
        return jsonResponse(http::status::ok, response_str);
    }

    std::istringstream response_stream(response_str);
    std::string line;

    std::getline(response_stream, line);
    int status_code = 0;
    std::istringstream status_stream(line);
    std::string http_version;
    status_stream >> http_version >> status_code;
    if (!status_stream || status_code < 100 || status_code > 599) {
        sealgate::Logger::getInstance().error("Handler produced a malformed status line: " + line);
        return jsonResponse(http::status::internal_server_error,
                            sealgate::JsonParser::createErrorResponse("Internal server error"));
    }

    http::response<http::string_body> res;
    res.result(static_cast<http::status>(status_code));
    while (std::getline(response_stream, line) && line != "\r" && !line.empty()) {
        size_t colon_pos = line.find(':');
        if (colon_pos == std::string::npos) {
            continue;
        }
        std::string key = line.substr(0, colon_pos);
        std::string value = line.substr(colon_pos + 1);
        value.erase(0, value.find_first_not_of(" \t\r\n"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);
        if (key == "Content-Length") {
            continue; // set by prepare_payload
        }
        res.set(key, value);
    }

    std::ostringstream body_stream;
    body_stream << response_stream.rdbuf();
    applySecurityHeaders(res);
    res.body() = body_stream.str();
    res.prepare_payload();
    return res;
}

/**
 * One authenticated push socket. Writes are serialized through a queue on the
 * stream's executor since Beast allows a single outstanding async_write.
 */
class WebSocketSession : public sealgate::LiveConnection,
                         public std::enable_shared_from_this<WebSocketSession> {
public:
    WebSocketSession(tcp::socket&& socket, std::string user_id, sealgate::ConnectionRegistry& registry)
        : ws_(std::move(socket)), user_id_(std::move(user_id)), registry_(registry) {}

    void run(http::request<http::string_body> req) {
        req_ = std::move(req);
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        auto self = shared_from_this();
        ws_.async_accept(req_, [self](beast::error_code ec) {
            if (ec) {
                sealgate::Logger::getInstance().error("WebSocket accept error: " + ec.message());
                return;
            }
            self->registry_.add(self->user_id_, self);
            self->send("{\"type\":\"connected\",\"user_id\":" + sealgate::JsonParser::quote(self->user_id_) + "}");
            self->doRead();
        });
    }

    void send(const std::string& payload) override {
        auto self = shared_from_this();
        net::post(ws_.get_executor(), [self, payload]() {
            self->outbox_.push_back(payload);
            if (self->outbox_.size() == 1) {
                self->doWrite();
            }
        });
    }

private:
    void doRead() {
        auto self = shared_from_this();
        ws_.async_read(buffer_, [self](beast::error_code ec, std::size_t) {
            if (ec) {
                if (ec != websocket::error::closed) {
                    sealgate::Logger::getInstance().warning("WebSocket read error for user " + self->user_id_ +
                                                            ": " + ec.message());
                }
                self->registry_.remove(self->user_id_, self.get());
                return;
            }
            std::string message = beast::buffers_to_string(self->buffer_.data());
            self->buffer_.consume(self->buffer_.size());
            self->handleMessage(message);
            self->doRead();
        });
    }

    // Clients only talk to keep the socket warm; everything else goes over HTTP.
    void handleMessage(const std::string& message) {
        boost::property_tree::ptree tree;
        std::string type;
        if (sealgate::JsonParser::parseObject(message, tree) && sealgate::JsonParser::getString(tree, "type", type) &&
            type == "ping") {
            send("{\"type\":\"pong\"}");
            return;
        }
        sealgate::Logger::getInstance().debug("Ignoring WebSocket frame from user " + user_id_);
    }

    void doWrite() {
        auto self = shared_from_this();
        ws_.text(true);
        ws_.async_write(net::buffer(outbox_.front()), [self](beast::error_code ec, std::size_t) {
            if (ec) {
                sealgate::Logger::getInstance().warning("WebSocket write error for user " + self->user_id_ +
                                                        ": " + ec.message());
                self->outbox_.clear();
                self->registry_.remove(self->user_id_, self.get());
                return;
            }
            self->outbox_.pop_front();
            if (!self->outbox_.empty()) {
                self->doWrite();
            }
        });
    }

    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    std::deque<std::string> outbox_;
    std::string user_id_;
    sealgate::ConnectionRegistry& registry_;
};

} // namespace

namespace sealgate {

HttpServer::HttpServer(const Config& config, RequestHandler& handler, const CallerVerifier& verifier,
                       ConnectionRegistry& registry)
    : address_(config.server_address),
      port_(config.server_port),
      request_handler_(handler),
      verifier_(verifier),
      registry_(registry),
      running_(false) {
}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start() {
    try {
        tcp::endpoint endpoint(net::ip::make_address(address_), port_);
        acceptor_ = std::make_unique<tcp::acceptor>(ioc_, endpoint);

        running_ = true;
        Logger::getInstance().info("HTTP Server started on " + address_ + ":" + std::to_string(port_));

        acceptConnections();

        ioc_.run();

        return true;
    } catch (const std::exception& e) {
        Logger::getInstance().error("Server error: " + std::string(e.what()));
        return false;
    }
}

void HttpServer::stop() {
    if (running_) {
        running_ = false;
        ioc_.stop();
        Logger::getInstance().info("HTTP Server stopped");
    }
}

void HttpServer::acceptConnections() {
    if (!running_) return;

    auto socket = std::make_shared<tcp::socket>(ioc_);

    acceptor_->async_accept(*socket,
        [this, socket](beast::error_code ec) {
            if (!ec) {
                handleConnection(socket);
            } else {
                Logger::getInstance().error("Accept error: " + ec.message());
            }
            acceptConnections();
        });
}

void HttpServer::handleConnection(std::shared_ptr<tcp::socket> socket) {
    auto buffer = std::make_shared<beast::flat_buffer>();
    auto parser = std::make_shared<http::request_parser<http::string_body>>();
    parser->body_limit(kMaxRequestBodySize);

    http::async_read(*socket, *buffer, *parser,
        [this, socket, buffer, parser](beast::error_code ec, std::size_t) {
            if (!ec) {
                processRequest(socket, parser->release());
                return;
            }
            if (ec == http::error::body_limit) {
                Logger::getInstance().warning("Request body too large");
                sendResponse(socket, jsonResponse(http::status::payload_too_large,
                                                  JsonParser::createErrorResponse("Request body too large")));
                return;
            }
            if (ec != http::error::end_of_stream) {
                Logger::getInstance().error("Read error: " + ec.message());
            }
        });
}

void HttpServer::processRequest(std::shared_ptr<tcp::socket> socket,
                                http::request<http::string_body> req) {
    const std::string path = std::string(req.target());
    if (path == "/ws" && websocket::is_upgrade(req)) {
        handleWebSocketUpgrade(socket, std::move(req));
        return;
    }

    std::map<std::string, std::string> headers;
    for (const auto& header : req) {
        headers[std::string(header.name_string())] = std::string(header.value());
    }

    const std::string method = std::string(http::to_string(req.method()));

    http::response<http::string_body> res;
    try {
        res = toResponse(request_handler_.handleRequest(method, path, headers, req.body()));
    } catch (const std::exception& e) {
        Logger::getInstance().error("Unhandled exception in processRequest: " + std::string(e.what()));
        res = jsonResponse(http::status::internal_server_error,
                           JsonParser::createErrorResponse("Internal server error"));
    }
    res.version(req.version());
    if (res.result_int() >= 500) {
        Logger::getInstance().error(method + " " + path + " -> " + std::to_string(res.result_int()));
    } else {
        Logger::getInstance().debug(method + " " + path + " -> " + std::to_string(res.result_int()));
    }
    sendResponse(socket, std::move(res));
}

void HttpServer::sendResponse(std::shared_ptr<tcp::socket> socket,
                              http::response<http::string_body> res) {
    auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));

    http::async_write(*socket, *sp,
        [socket, sp](beast::error_code ec, std::size_t) {
            if (ec) {
                Logger::getInstance().error("Write error: " + ec.message());
            }
            beast::error_code shutdown_ec;
            socket->shutdown(tcp::socket::shutdown_send, shutdown_ec);
        });
}

void HttpServer::handleWebSocketUpgrade(std::shared_ptr<tcp::socket> socket,
                                        http::request<http::string_body> req) {
    Caller caller;
    const std::string user_id = fieldValue(req, "X-Caller-Id");
    if (user_id.empty() ||
        !verifier_.verify(user_id, fieldValue(req, "X-Caller-Role"), fieldValue(req, "X-Caller-Signature"), caller)) {
        Logger::getInstance().warning("Rejected WebSocket upgrade without a valid caller identity");
        sendResponse(socket, jsonResponse(http::status::unauthorized,
                                          JsonParser::createErrorResponse("Missing or invalid caller identity")));
        return;
    }

    auto session = std::make_shared<WebSocketSession>(std::move(*socket), caller.user_id, registry_);
    session->run(std::move(req));
}

} // namespace sealgate
