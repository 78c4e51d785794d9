#pragma once

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <core/security/handshake_policy.h>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace peerpin::core {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = boost::asio::ip::tcp;

// HTTPS client of the connecting role
class HttpsClient {
public:
    HttpsClient(net::io_context& ioc, ConnectingPolicy& policy);
    ~HttpsClient();

    HttpsClient(const HttpsClient&) = delete;
    HttpsClient& operator=(const HttpsClient&) = delete;

    /**
     * Resolve, connect and complete the TLS handshake. A server whose
     * certificate is not the pinned one fails here, before any request is
     * written. Throws boost::system::system_error on failure.
     */
    net::awaitable<void> Connect(std::string_view host, std::uint16_t port);

    net::awaitable<void> Disconnect();

    template<typename RequestBody>
    net::awaitable<http::response<http::string_body>> SendRequest(http::request<RequestBody>& req);

    template<typename Body>
    http::request<Body> CreateRequest(http::verb method,
                                      const std::string& target,
                                      bool keepAlive = true);

private:
    net::io_context& ioc_;
    ConnectingPolicy& policy_;
    std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> connection_;
    std::string current_host_;
    std::uint16_t current_port_ = 0;
};

/**
 * @brief One-shot GET against an https:// URL on a private io_context
 *
 * Throws std::invalid_argument for a malformed URL and
 * boost::system::system_error for connection, handshake or transport errors.
 */
http::response<http::string_body> FetchOnce(ConnectingPolicy& policy, std::string_view url);

template<typename RequestBody>
net::awaitable<http::response<http::string_body>> HttpsClient::SendRequest(
    http::request<RequestBody>& req) {
    if (!connection_) {
        throw std::runtime_error("No active connection");
    }

    beast::get_lowest_layer(*connection_).expires_after(std::chrono::seconds(30));
    co_await http::async_write(*connection_, req, net::use_awaitable);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    co_await http::async_read(*connection_, buffer, res, net::use_awaitable);
    beast::get_lowest_layer(*connection_).expires_never();

    co_return res;
}

template<typename Body>
http::request<Body> HttpsClient::CreateRequest(http::verb method,
                                               const std::string& target,
                                               bool keepAlive) {
    http::request<Body> req{method, target, 11};

    if (!current_host_.empty()) {
        req.set(http::field::host, current_host_ + ":" + std::to_string(current_port_));
    }

    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req.keep_alive(keepAlive);

    return req;
}

} // namespace peerpin::core
