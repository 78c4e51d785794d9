#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <cli/argument_parser.h>
#include <core/constant/path.h>
#include <core/network/client/http_client.h>
#include <core/network/server/http_server.h>
#include <core/security/certificate_manager.h>
#include <core/security/handshake_policy.h>
#include <core/security/open_ssl_provider.h>
#include <core/util/address.h>
#include <core/util/config.h>
#include <core/util/error.h>
#include <core/util/logger.h>
#include <csignal>
#include <iostream>

using namespace peerpin;
using namespace peerpin::core;
namespace net = boost::asio;

namespace {

void applyOverrides(const CliOptions& options) {
    const bool client = options.command == "client";
    if (options.cert) {
        (client ? settings.client.cert_file : settings.server.cert_file) = *options.cert;
    }
    if (options.key) {
        (client ? settings.client.key_file : settings.server.key_file) = *options.key;
    }
    if (options.known_clients) {
        settings.server.known_peers_file = *options.known_clients;
    }
    if (options.addr) {
        settings.server.address = *options.addr;
    }
    if (options.server_cert) {
        settings.client.server_cert_file = *options.server_cert;
    }
    if (options.url) {
        settings.client.url = *options.url;
    }
    if (options.no_verify_hostname) {
        settings.client.verify_hostname = false;
    }
    if (options.dir) {
        settings.provision.dir = *options.dir;
    }
}

int runServer() {
    const auto& cfg = settings.server;
    auto endpoint = ParseListenAddress(cfg.address);
    if (!endpoint) {
        spdlog::error("Invalid listen address '{}', expected [host]:port", cfg.address);
        return 1;
    }

    spdlog::info("Configuring server TLS for self-signed client verification...");
    AcceptingPolicy policy = BuildAcceptingPolicy(cfg.cert_file,
                                                  cfg.key_file,
                                                  cfg.known_peers_file);

    net::io_context ioc;
    HttpServer server(ioc, policy);
    if (!server.Start(*endpoint)) {
        return 1;
    }
    spdlog::info("Server expects client CN and fingerprint to match entries in {}",
                 cfg.known_peers_file.string());

    net::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec) {
            return;
        }
        spdlog::info("Received signal {}, stopping server...", signo);
        net::co_spawn(
            ioc,
            [&]() -> net::awaitable<void> {
                co_await server.Shutdown(std::chrono::seconds(cfg.shutdown_timeout_seconds));
                ioc.stop();
            },
            net::detached);
    });

    ioc.run();
    return 0;
}

int runClient() {
    const auto& cfg = settings.client;
    ConnectingPolicy policy = BuildConnectingPolicy(cfg.cert_file,
                                                    cfg.key_file,
                                                    cfg.server_cert_file,
                                                    {.verify_hostname = cfg.verify_hostname});
    try {
        auto res = FetchOnce(policy, cfg.url);
        std::cout << "Server Response:\n" << res.body();
        return res.result() == boost::beast::http::status::ok ? 0 : 1;
    } catch (const boost::system::system_error& e) {
        spdlog::error("Client request failed: {}", e.code().message());
    } catch (const std::invalid_argument& e) {
        spdlog::error("Client request failed: {}", e.what());
    }
    return 1;
}

int runProvision() {
    const auto& cfg = settings.provision;
    CertificateManager manager(cfg.dir);
    try {
        auto result = manager.Provision(cfg.server_name,
                                        cfg.client_name,
                                        static_cast<int>(cfg.validity_days));
        std::cout << "Setup complete. Self-signed certificates and "
                  << result.known_peers.filename().string() << " are in '" << cfg.dir.string()
                  << "'.\nKnown Client Entry:\n"
                  << cfg.client_name << " " << result.client_fingerprint << "\n";
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Provisioning failed: {}", e.what());
        return 1;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions options;
    try {
        options = ArgumentParser(argc, argv).Parse();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        ArgumentParser::ShowHelp();
        return 2;
    }
    if (options.command == "help") {
        ArgumentParser::ShowHelp();
        return 0;
    }

    Logger logger(
#ifdef PEERPIN_DEBUG
        Logger::Level::debug,
#else
        Logger::Level::info,
#endif
        path::kLogDir);
    if (options.log_level) {
        logger.set_log_level(spdlog::level::from_str(*options.log_level));
    }

    OpenSSLProvider::InitOpenSSL();

    try {
        InitConfig(options.config_path
                       ? std::optional<std::filesystem::path>(*options.config_path)
                       : std::nullopt);
        applyOverrides(options);

        if (options.command == "server") {
            return runServer();
        }
        if (options.command == "client") {
            return runClient();
        }
        return runProvision();
    } catch (const ConfigLoadError& e) {
        spdlog::error("Configuration error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
