#include <charconv>
#include <core/util/address.h>

namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace peerpin::core {

namespace {

std::optional<std::uint16_t> parsePort(std::string_view s) {
    unsigned int port = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), port);
    if (ec != std::errc{} || ptr != s.data() + s.size() || port > 65535) {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(port);
}

// Splits "host:port" / "[v6]:port" / "host". port is empty when absent.
bool splitHostPort(std::string_view s, std::string_view& host, std::string_view& port) {
    if (!s.empty() && s.front() == '[') {
        auto close = s.find(']');
        if (close == std::string_view::npos) {
            return false;
        }
        host = s.substr(1, close - 1);
        auto rest = s.substr(close + 1);
        if (rest.empty()) {
            port = {};
            return true;
        }
        if (rest.front() != ':') {
            return false;
        }
        port = rest.substr(1);
        return true;
    }
    auto colon = s.rfind(':');
    if (colon == std::string_view::npos) {
        host = s;
        port = {};
        return true;
    }
    host = s.substr(0, colon);
    port = s.substr(colon + 1);
    return true;
}

} // namespace

std::optional<HttpsUrl> ParseHttpsUrl(std::string_view url) {
    constexpr std::string_view kScheme = "https://";
    if (url.substr(0, kScheme.size()) != kScheme) {
        return std::nullopt;
    }
    url.remove_prefix(kScheme.size());

    HttpsUrl result;
    auto slash = url.find('/');
    std::string_view authority = url.substr(0, slash);
    if (slash != std::string_view::npos) {
        result.target = std::string(url.substr(slash));
    }

    std::string_view host;
    std::string_view port;
    if (!splitHostPort(authority, host, port) || host.empty()) {
        return std::nullopt;
    }
    result.host = std::string(host);
    if (!port.empty()) {
        auto parsed = parsePort(port);
        if (!parsed || *parsed == 0) {
            return std::nullopt;
        }
        result.port = *parsed;
    }
    return result;
}

std::optional<tcp::endpoint> ParseListenAddress(std::string_view address) {
    std::string_view host;
    std::string_view port;
    if (!splitHostPort(address, host, port) || port.empty()) {
        return std::nullopt;
    }
    auto parsed_port = parsePort(port);
    if (!parsed_port) {
        return std::nullopt;
    }
    if (host.empty()) {
        return tcp::endpoint(tcp::v4(), *parsed_port);
    }
    if (host == "localhost") {
        return tcp::endpoint(net::ip::address_v4::loopback(), *parsed_port);
    }
    boost::system::error_code ec;
    auto ip = net::ip::make_address(std::string(host), ec);
    if (ec) {
        return std::nullopt;
    }
    return tcp::endpoint(ip, *parsed_port);
}

} // namespace peerpin::core
