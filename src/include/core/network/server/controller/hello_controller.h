#pragma once

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <core/model/peer_identity.h>
#include <core/network/server/http_server.h>

namespace peerpin::core {

// Application routes; each answers with the identity the handshake verified.
class HelloController {
public:
    explicit HelloController(HttpServer& server);
    ~HelloController() = default;

private:
    boost::asio::awaitable<HttpResponse> onHello(StringRequest&& req, const PeerIdentity& peer);

    boost::asio::awaitable<HttpResponse> onWhoami(StringRequest&& req, const PeerIdentity& peer);

    void InstallRoutes(HttpServer& server);
};

} // namespace peerpin::core
