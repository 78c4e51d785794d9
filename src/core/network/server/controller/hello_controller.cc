#include <core/constant/route.h>
#include <core/network/server/controller/hello_controller.h>
#include <core/network/server/http_server.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace net = boost::asio;
namespace http = boost::beast::http;
using json = nlohmann::json;

namespace peerpin::core {

HelloController::HelloController(HttpServer& server) {
    InstallRoutes(server);
}

net::awaitable<HttpResponse> HelloController::onHello(StringRequest&& req,
                                                      const PeerIdentity& peer) {
    spdlog::debug("HelloController::OnHello");
    co_return HttpServer::Ok(req.version(),
                             req.keep_alive(),
                             "Hello, authenticated client '" + peer.name + "'!\n");
}

net::awaitable<HttpResponse> HelloController::onWhoami(StringRequest&& req,
                                                       const PeerIdentity& peer) {
    spdlog::debug("HelloController::OnWhoami");
    json data;
    data["identity"] = peer.name;
    data["fingerprint"] = peer.fingerprint;
    data["address"] = peer.address;
    data["port"] = peer.port;
    co_return HttpServer::Ok(req.version(), req.keep_alive(), data.dump(), "application/json");
}

void HelloController::InstallRoutes(HttpServer& server) {
    server.AddRoute(std::string(ApiRoute::kHello),
                    http::verb::get,
                    std::bind(&HelloController::onHello,
                              this,
                              std::placeholders::_1,
                              std::placeholders::_2));
    server.AddRoute(std::string(ApiRoute::kWhoami),
                    http::verb::get,
                    std::bind(&HelloController::onWhoami,
                              this,
                              std::placeholders::_1,
                              std::placeholders::_2));
}

} // namespace peerpin::core
