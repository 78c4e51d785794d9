#pragma once

#include <boost/asio/ip/tcp.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace peerpin::core {

struct HttpsUrl {
    std::string host;
    std::uint16_t port = 443;
    std::string target = "/";
};

// "https://host[:port][/path]"; IPv6 hosts in brackets. nullopt if malformed or not https.
std::optional<HttpsUrl> ParseHttpsUrl(std::string_view url);

// "[host]:port" as used by the listener; an empty host means every IPv4 interface.
std::optional<boost::asio::ip::tcp::endpoint> ParseListenAddress(std::string_view address);

} // namespace peerpin::core
