/*
    config.h
    This header provides the application configuration, read from an
    optional TOML file. Every key has a built-in default, so running without
    a file is the same as running with an empty one.

    Example file:

        [server]
        address = ":8443"
        cert = "certs/server.crt"
        key = "certs/server.key"
        known-peers = "certs/knownClients.txt"
        shutdown-timeout = 5

        [client]
        cert = "certs/client.crt"
        key = "certs/client.key"
        server-cert = "certs/server.crt"
        url = "https://localhost:8443/hello"
        verify-hostname = true

        [provision]
        dir = "certs"
        server-name = "localhost"
        client-name = "my_secure_client"
        days = 365

    Example usage:
    - Load the file (or keep defaults):
        peerpin::core::InitConfig(path);
    - Read a setting:
        std::string addr = peerpin::core::settings.server.address;
*/

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <toml++/toml.h>

namespace peerpin::core {

inline toml::table config;

struct ServerSettings {
    std::string address = ":8443";
    std::filesystem::path cert_file = "certs/server.crt";
    std::filesystem::path key_file = "certs/server.key";
    std::filesystem::path known_peers_file = "certs/knownClients.txt";
    std::int64_t shutdown_timeout_seconds = 5;
};

struct ClientSettings {
    std::filesystem::path cert_file = "certs/client.crt";
    std::filesystem::path key_file = "certs/client.key";
    std::filesystem::path server_cert_file = "certs/server.crt";
    std::string url = "https://localhost:8443/hello";
    bool verify_hostname = true;
};

struct ProvisionSettings {
    std::filesystem::path dir = "certs";
    std::string server_name = "localhost";
    std::string client_name = "my_secure_client";
    std::int64_t validity_days = 365;
};

struct Settings {
    ServerSettings server;
    ClientSettings client;
    ProvisionSettings provision;
};

inline Settings settings;

/**
 * Reset settings to defaults, then overlay the given TOML file if any.
 * Throws ConfigLoadError if the file cannot be opened or parsed.
 */
void InitConfig(const std::optional<std::filesystem::path>& path = std::nullopt);

// Overlay an already parsed table onto the current settings.
void LoadSettings(const toml::table& table);

} // namespace peerpin::core
