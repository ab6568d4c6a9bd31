#ifndef HTTP_SERVER_HPP
#define HTTP_SERVER_HPP

#include <string>
#include <memory>
#include <map>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/beast/websocket.hpp>
#include "../auth/caller_identity.hpp"
#include "../config/config.hpp"
#include "connection_registry.hpp"
#include "request_handler.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace sealgate {

/**
 * HTTP/1.1 front end. Each connection carries one request; the handler's
 * result is turned into a Beast response. GET /ws upgrades to a WebSocket
 * that receives the caller's live events through the ConnectionRegistry.
 */
class HttpServer {
public:
    HttpServer(const Config& config, RequestHandler& handler, const CallerVerifier& verifier,
               ConnectionRegistry& registry);
    ~HttpServer();

    // Binds and runs the io_context on the calling thread until stop().
    bool start();
    void stop();

private:
    std::string address_;
    unsigned short port_;
    net::io_context ioc_;
    std::unique_ptr<tcp::acceptor> acceptor_;
    RequestHandler& request_handler_;
    const CallerVerifier& verifier_;
    ConnectionRegistry& registry_;
    bool running_;

    void acceptConnections();
    void handleConnection(std::shared_ptr<tcp::socket> socket);
    void processRequest(std::shared_ptr<tcp::socket> socket,
                        http::request<http::string_body> req);
    void sendResponse(std::shared_ptr<tcp::socket> socket,
                      http::response<http::string_body> res);
    void handleWebSocketUpgrade(std::shared_ptr<tcp::socket> socket,
                                http::request<http::string_body> req);
};

} // namespace sealgate

#endif // HTTP_SERVER_HPP
