#include <core/util/config.h>
#include <core/util/error.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace peerpin::core {

namespace {

void loadPath(const toml::table& table, std::string_view key, fs::path& target) {
    if (auto value = table[key].value<std::string>()) {
        target = *value;
    }
}

} // namespace

void LoadSettings(const toml::table& table) {
    if (auto server = table["server"].as_table()) {
        settings.server.address = (*server)["address"].value_or(settings.server.address);
        loadPath(*server, "cert", settings.server.cert_file);
        loadPath(*server, "key", settings.server.key_file);
        loadPath(*server, "known-peers", settings.server.known_peers_file);
        settings.server.shutdown_timeout_seconds = (*server)["shutdown-timeout"].value_or(
            settings.server.shutdown_timeout_seconds);
    }
    if (auto client = table["client"].as_table()) {
        loadPath(*client, "cert", settings.client.cert_file);
        loadPath(*client, "key", settings.client.key_file);
        loadPath(*client, "server-cert", settings.client.server_cert_file);
        settings.client.url = (*client)["url"].value_or(settings.client.url);
        settings.client.verify_hostname = (*client)["verify-hostname"].value_or(
            settings.client.verify_hostname);
    }
    if (auto provision = table["provision"].as_table()) {
        loadPath(*provision, "dir", settings.provision.dir);
        settings.provision.server_name = (*provision)["server-name"].value_or(
            settings.provision.server_name);
        settings.provision.client_name = (*provision)["client-name"].value_or(
            settings.provision.client_name);
        settings.provision.validity_days = (*provision)["days"].value_or(
            settings.provision.validity_days);
    }
}

void InitConfig(const std::optional<fs::path>& path) {
    settings = Settings{};
    config = toml::table{};

    if (!path) {
        spdlog::debug("No config file given, using defaults");
        return;
    }
    if (!fs::exists(*path)) {
        throw ConfigLoadError(*path, "config file does not exist");
    }

    try {
        config = toml::parse_file(path->string());
    } catch (const toml::parse_error& err) {
        throw ConfigLoadError(*path, std::string("invalid TOML: ") + std::string(err.description()));
    }

    LoadSettings(config);
    spdlog::info("Loaded config from {}", path->string());
}

} // namespace peerpin::core
