#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <core/network/server/controller/hello_controller.h>
#include <core/network/server/http_server.h>
#include <core/security/certificate.h>
#include <spdlog/spdlog.h>

namespace peerpin::core {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

class ConnectionCounter {
public:
    explicit ConnectionCounter(std::shared_ptr<std::atomic<std::size_t>> counter)
        : counter_(std::move(counter)) {
        ++*counter_;
    }
    ~ConnectionCounter() { --*counter_; }

    ConnectionCounter(const ConnectionCounter&) = delete;
    ConnectionCounter& operator=(const ConnectionCounter&) = delete;

private:
    std::shared_ptr<std::atomic<std::size_t>> counter_;
};

bool isBenignDisconnect(const boost::system::error_code& ec) {
    return ec == beast::error::timeout || ec == net::error::eof
           || ec == net::error::operation_aborted || ec == net::error::connection_reset
           || ec == http::error::end_of_stream || ec == ssl::error::stream_truncated;
}

} // namespace

HttpServer::HttpServer(net::io_context& io_context, AcceptingPolicy& policy)
    : io_context_(io_context)
    , policy_(policy)
    , acceptor_(io_context)
    , running_(false)
    , active_connections_(std::make_shared<std::atomic<std::size_t>>(0)) {
    hello_controller_ = std::make_unique<HelloController>(*this);
    spdlog::debug("HttpServer created.");
}

HttpServer::~HttpServer() {
    if (running_) {
        Stop();
    }
    spdlog::debug("HttpServer destroyed.");
}

void HttpServer::AddRoute(const std::string& path, http::verb method, RequestHandler&& handler) {
    routes_[path] = {method, std::move(handler)};
    spdlog::debug("Added route: {} {}", std::string(http::to_string(method)), path);
}

bool HttpServer::Start(const tcp::endpoint& endpoint) {
    if (running_) {
        spdlog::warn("Server is already running.");
        return true;
    }

    try {
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(net::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(net::socket_base::max_listen_connections);
        running_ = true;
        spdlog::info("HTTPS server listening on {}:{}",
                     endpoint.address().to_string(),
                     local_port());

        net::co_spawn(io_context_, acceptConnections(), net::detached);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to start server on {}:{}: {}",
                      endpoint.address().to_string(),
                      endpoint.port(),
                      e.what());
        running_ = false;
        if (acceptor_.is_open()) {
            boost::system::error_code ec;
            acceptor_.close(ec);
        }
        return false;
    }
}

void HttpServer::Stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    boost::system::error_code ec;
    acceptor_.cancel(ec);
    if (acceptor_.is_open()) {
        acceptor_.close(ec);
    }
    spdlog::info("HTTPS server stopped accepting connections.");
}

net::awaitable<void> HttpServer::Shutdown(std::chrono::steady_clock::duration timeout) {
    Stop();

    auto deadline = std::chrono::steady_clock::now() + timeout;
    net::steady_timer timer(io_context_);
    while (*active_connections_ > 0 && std::chrono::steady_clock::now() < deadline) {
        timer.expires_after(std::chrono::milliseconds(50));
        co_await timer.async_wait(net::use_awaitable);
    }

    if (*active_connections_ > 0) {
        spdlog::warn("Shutdown timeout reached with {} connection(s) still open",
                     active_connections_->load());
    } else {
        spdlog::info("Server stopped gracefully.");
    }
}

std::uint16_t HttpServer::local_port() const {
    boost::system::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

HttpResponse HttpServer::Ok(unsigned int version,
                            bool keep_alive,
                            std::string_view body,
                            std::string_view content_type) {
    HttpResponse res{http::status::ok, version};
    res.keep_alive(keep_alive);
    res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    res.set(http::field::content_type, std::string(content_type));
    res.body() = body;
    res.prepare_payload();
    return res;
}

HttpResponse HttpServer::NotFound(unsigned int version,
                                  bool keep_alive,
                                  std::string_view error_message) {
    HttpResponse res{http::status::not_found, version};
    res.keep_alive(keep_alive);
    res.set(http::field::content_type, "text/plain");
    res.body() = error_message;
    res.prepare_payload();
    return res;
}

HttpResponse HttpServer::InternalServerError(unsigned int version,
                                             bool keep_alive,
                                             std::string_view error_message) {
    HttpResponse res{http::status::internal_server_error, version};
    res.keep_alive(keep_alive);
    res.set(http::field::content_type, "text/plain");
    res.body() = error_message;
    res.prepare_payload();
    return res;
}

HttpResponse HttpServer::MethodNotAllowed(unsigned int version,
                                          bool keep_alive,
                                          std::string_view error_message) {
    HttpResponse res{http::status::method_not_allowed, version};
    res.keep_alive(keep_alive);
    res.set(http::field::content_type, "text/plain");
    res.body() = error_message;
    res.prepare_payload();
    return res;
}

net::awaitable<void> HttpServer::acceptConnections() {
    while (running_) {
        try {
            tcp::socket socket = co_await acceptor_.async_accept(net::use_awaitable);
            spdlog::debug("Accepted connection from: {}",
                          socket.remote_endpoint().address().to_string());

            beast::ssl_stream<beast::tcp_stream> stream(beast::tcp_stream(std::move(socket)),
                                                        policy_.context());

            net::co_spawn(io_context_, handleConnection(std::move(stream)), net::detached);
        } catch (const boost::system::system_error& e) {
            if (e.code() == net::error::operation_aborted) {
                spdlog::debug("Accept operation cancelled.");
                break;
            } else {
                spdlog::error("Error accepting connection: {}", e.what());
            }
        } catch (const std::exception& e) {
            spdlog::error("Unexpected error during accept: {}", e.what());
        }
    }
    spdlog::debug("Stopped accepting connections.");
}

net::awaitable<void> HttpServer::handleConnection(beast::ssl_stream<beast::tcp_stream> stream) {
    ConnectionCounter counter(active_connections_);
    PeerIdentity peer;
    try {
        auto endpoint = beast::get_lowest_layer(stream).socket().remote_endpoint();
        peer.address = endpoint.address().to_string();
        peer.port = endpoint.port();
        spdlog::info("New connection from: {}:{}", peer.address, peer.port);

        // The accepting policy's peer authorizer runs inside this handshake.
        beast::get_lowest_layer(stream).expires_after(kIdleTimeout);
        try {
            co_await stream.async_handshake(ssl::stream_base::server, net::use_awaitable);
        } catch (const boost::system::system_error& e) {
            spdlog::warn("TLS handshake with {}:{} failed: {}",
                         peer.address,
                         peer.port,
                         e.code().message());
            co_return;
        }

        auto certificate = Certificate::FromPeer(stream.native_handle());
        if (!certificate) {
            spdlog::error("No peer certificate after handshake with {}:{}, closing",
                          peer.address,
                          peer.port);
            co_return;
        }
        peer.name = certificate->common_name();
        peer.fingerprint = certificate->fingerprint();
        spdlog::debug("SSL handshake completed, peer '{}'", peer.name);

        beast::flat_buffer buffer;
        bool keep_alive = true;

        while (keep_alive) {
            try {
                beast::get_lowest_layer(stream).expires_after(kIdleTimeout);

                http::request_parser<http::string_body> parser;
                parser.body_limit(kBodyLimit);

                co_await http::async_read(stream, buffer, parser, net::use_awaitable);
                StringRequest req = parser.release();

                spdlog::info("Received request from {} for {} {}",
                             peer.name,
                             std::string(req.method_string()),
                             std::string(req.target()));

                keep_alive = req.keep_alive();

                HttpResponse res = co_await handleRequest(std::move(req), peer);

                co_await http::async_write(stream, res, net::use_awaitable);

                if (!keep_alive || !running_) {
                    break;
                }
            } catch (const boost::system::system_error& e) {
                if (isBenignDisconnect(e.code())) {
                    spdlog::debug("Connection closed by peer: {}", e.code().message());
                    break;
                }
                throw;
            }
        }

        spdlog::debug("Closing connection gracefully");
        beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(5));
        beast::error_code ec;
        co_await stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
        if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
            spdlog::debug("Shutdown notice: {}", ec.message());
        }
    } catch (const std::exception& e) {
        spdlog::error("Session error with {}:{}: {}", peer.address, peer.port, e.what());
    }
    spdlog::debug("Connection handling finished.");
}

net::awaitable<HttpResponse> HttpServer::handleRequest(StringRequest&& req,
                                                       const PeerIdentity& peer) {
    std::string path(req.target());
    auto it = routes_.find(path);

    if (it == routes_.end()) {
        spdlog::warn("Route not found: {}", path);
        co_return NotFound(req.version(), req.keep_alive());
    }

    const auto& route_info = it->second;
    if (route_info.method != req.method()) {
        spdlog::warn("Method not allowed for route {}: requested {}, expected {}",
                     path,
                     std::string(http::to_string(req.method())),
                     std::string(http::to_string(route_info.method)));
        co_return MethodNotAllowed(req.version(), req.keep_alive());
    }

    auto request_version = req.version();
    bool request_keep_alive = req.keep_alive();

    std::string error_message;
    try {
        co_return co_await route_info.handler(std::move(req), peer);
    } catch (const std::exception& e) {
        spdlog::error("Error executing handler for {}: {}", path, e.what());
        error_message = e.what();
    }
    co_return InternalServerError(request_version, request_keep_alive, error_message);
}

} // namespace peerpin::core
