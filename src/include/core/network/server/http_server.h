#pragma once

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without including it
#include <atomic>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <chrono>
#include <core/model/peer_identity.h>
#include <core/security/handshake_policy.h>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace peerpin::core {

class HelloController;

using StringRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

// Handlers only ever see connections whose peer passed the accepting policy.
using RequestHandler
    = std::function<boost::asio::awaitable<HttpResponse>(StringRequest&&, const PeerIdentity&)>;

struct RouteInfo {
    boost::beast::http::verb method;
    RequestHandler handler;
};

// HTTPS server of the accepting role
class HttpServer {
public:
    HttpServer(boost::asio::io_context& io_context, AcceptingPolicy& policy);

    ~HttpServer();

    void AddRoute(const std::string& path,
                  boost::beast::http::verb method,
                  RequestHandler&& handler);

    // Binds and starts accepting; false (already logged) if the endpoint cannot be bound.
    bool Start(const boost::asio::ip::tcp::endpoint& endpoint);

    // Stops accepting new connections; established ones keep running.
    void Stop();

    // Stop(), then wait until in-flight connections finish or the timeout expires.
    boost::asio::awaitable<void> Shutdown(std::chrono::steady_clock::duration timeout);

    std::uint16_t local_port() const;

    static HttpResponse Ok(unsigned int version,
                           bool keep_alive,
                           std::string_view body = {},
                           std::string_view content_type = "text/plain");
    static HttpResponse NotFound(unsigned int version,
                                 bool keep_alive,
                                 std::string_view error_message = "Not Found");
    static HttpResponse InternalServerError(
        unsigned int version,
        bool keep_alive,
        std::string_view error_message = "Internal Server Error");
    static HttpResponse MethodNotAllowed(unsigned int version,
                                         bool keep_alive,
                                         std::string_view error_message = "Method Not Allowed");

    static constexpr std::chrono::seconds kIdleTimeout{30};
    static constexpr std::size_t kBodyLimit = 1024 * 1024;

private:
    // 接受连接
    boost::asio::awaitable<void> acceptConnections();

    // 处理连接
    boost::asio::awaitable<void> handleConnection(
        boost::beast::ssl_stream<boost::beast::tcp_stream> stream);

    // 处理请求
    boost::asio::awaitable<HttpResponse> handleRequest(StringRequest&& request,
                                                       const PeerIdentity& peer);

    boost::asio::io_context& io_context_;
    AcceptingPolicy& policy_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::atomic<bool> running_;
    // Shared with connection coroutines, which may outlive the server on teardown.
    std::shared_ptr<std::atomic<std::size_t>> active_connections_;
    std::map<std::string, RouteInfo> routes_;
    std::unique_ptr<HelloController> hello_controller_;
};

} // namespace peerpin::core
