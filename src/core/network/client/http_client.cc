#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/use_future.hpp>
#include <core/network/client/http_client.h>
#include <core/security/open_ssl_provider.h>
#include <core/util/address.h>
#include <spdlog/spdlog.h>

namespace peerpin::core {

HttpsClient::HttpsClient(net::io_context& ioc, ConnectingPolicy& policy)
    : ioc_(ioc)
    , policy_(policy) {}

HttpsClient::~HttpsClient() = default;

net::awaitable<void> HttpsClient::Connect(std::string_view host, std::uint16_t port) {
    if (connection_) {
        co_await Disconnect();
    }

    connection_ = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(beast::tcp_stream(ioc_),
                                                                         policy_.context());
    std::string host_str(host);
    std::exception_ptr failure;
    try {
        if (!OpenSSLProvider::SetHostname(connection_->native_handle(), host_str)) {
            throw std::runtime_error("Failed to set SNI Hostname");
        }
        if (policy_.options().verify_hostname) {
            // Runs after the pinned-anchor check; rejects only if that already
            // passed and the dialed name is not in the pinned certificate.
            connection_->set_verify_callback(ssl::host_name_verification(host_str));
        }

        tcp::resolver resolver(ioc_);
        auto results = co_await resolver.async_resolve(host_str,
                                                       std::to_string(port),
                                                       net::use_awaitable);

        beast::get_lowest_layer(*connection_).expires_after(std::chrono::seconds(30));
        co_await beast::get_lowest_layer(*connection_).async_connect(results, net::use_awaitable);

        co_await connection_->async_handshake(ssl::stream_base::client, net::use_awaitable);
        beast::get_lowest_layer(*connection_).expires_never();

        current_host_ = host_str;
        current_port_ = port;

        spdlog::info("Connected to {}:{}", host_str, port);
    } catch (const std::exception& e) {
        spdlog::error("Connection to {}:{} failed: {}", host_str, port, e.what());
        failure = std::current_exception();
    }

    if (failure) {
        connection_.reset();
        current_host_.clear();
        current_port_ = 0;
        std::rethrow_exception(failure);
    }
}

net::awaitable<void> HttpsClient::Disconnect() {
    if (!connection_) {
        co_return;
    }

    beast::error_code ec;
    beast::get_lowest_layer(*connection_).expires_after(std::chrono::seconds(5));
    co_await connection_->async_shutdown(net::redirect_error(net::use_awaitable, ec));
    if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
        spdlog::debug("SSL shutdown notice: {}", ec.message());
    }

    connection_.reset();
    current_host_.clear();
    current_port_ = 0;

    spdlog::debug("Disconnected");
}

http::response<http::string_body> FetchOnce(ConnectingPolicy& policy, std::string_view url) {
    auto parsed = ParseHttpsUrl(url);
    if (!parsed) {
        throw std::invalid_argument("Invalid https URL: " + std::string(url));
    }

    net::io_context ioc;
    HttpsClient client(ioc, policy);

    auto fetch = [&client, target = *parsed]() -> net::awaitable<http::response<http::string_body>> {
        spdlog::info("Sending request to https://{}:{}{}", target.host, target.port, target.target);
        co_await client.Connect(target.host, target.port);

        auto req = client.CreateRequest<http::empty_body>(http::verb::get, target.target, false);
        auto res = co_await client.SendRequest(req);
        spdlog::info("Received response: Status Code {}", res.result_int());

        co_await client.Disconnect();
        co_return res;
    };

    auto future = net::co_spawn(ioc, fetch, net::use_future);
    ioc.run();
    return future.get();
}

} // namespace peerpin::core
