#include "test_support.h"

#include <core/util/config.h>
#include <core/util/error.h>
#include <gtest/gtest.h>

using namespace peerpin::core;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { InitConfig(); }
    void TearDown() override { InitConfig(); }
};

TEST_F(ConfigTest, DefaultsWithoutFile) {
    EXPECT_EQ(settings.server.address, ":8443");
    EXPECT_EQ(settings.server.cert_file.string(), "certs/server.crt");
    EXPECT_EQ(settings.server.known_peers_file.string(), "certs/knownClients.txt");
    EXPECT_EQ(settings.server.shutdown_timeout_seconds, 5);
    EXPECT_EQ(settings.client.server_cert_file.string(), "certs/server.crt");
    EXPECT_EQ(settings.client.url, "https://localhost:8443/hello");
    EXPECT_TRUE(settings.client.verify_hostname);
    EXPECT_EQ(settings.provision.client_name, "my_secure_client");
    EXPECT_EQ(settings.provision.validity_days, 365);
}

TEST_F(ConfigTest, TableOverlaysOnlyGivenKeys) {
    auto table = toml::parse(R"(
        [server]
        address = "127.0.0.1:9443"
        known-peers = "/etc/peerpin/known"

        [client]
        verify-hostname = false

        [provision]
        days = 30
    )");

    LoadSettings(table);

    EXPECT_EQ(settings.server.address, "127.0.0.1:9443");
    EXPECT_EQ(settings.server.known_peers_file.string(), "/etc/peerpin/known");
    EXPECT_EQ(settings.server.cert_file.string(), "certs/server.crt");
    EXPECT_FALSE(settings.client.verify_hostname);
    EXPECT_EQ(settings.client.url, "https://localhost:8443/hello");
    EXPECT_EQ(settings.provision.validity_days, 30);
    EXPECT_EQ(settings.provision.server_name, "localhost");
}

TEST_F(ConfigTest, WrongTypeKeepsDefault) {
    LoadSettings(toml::parse(R"(
        [server]
        shutdown-timeout = "soon"
    )"));

    EXPECT_EQ(settings.server.shutdown_timeout_seconds, 5);
}

TEST_F(ConfigTest, LoadsFile) {
    peerpin::test::TempDir dir;
    auto file = dir.Write("peerpin.toml", R"(
[client]
url = "https://127.0.0.1:9443/whoami"
server-cert = "pinned.crt"
)");

    InitConfig(file);

    EXPECT_EQ(settings.client.url, "https://127.0.0.1:9443/whoami");
    EXPECT_EQ(settings.client.server_cert_file.string(), "pinned.crt");
    EXPECT_EQ(config["client"]["url"].value_or(std::string{}), "https://127.0.0.1:9443/whoami");
}

TEST_F(ConfigTest, ReinitResetsToDefaults) {
    settings.server.address = ":1";
    InitConfig();
    EXPECT_EQ(settings.server.address, ":8443");
}

TEST_F(ConfigTest, MissingFileThrows) {
    peerpin::test::TempDir dir;
    EXPECT_THROW(InitConfig(dir.path() / "absent.toml"), ConfigLoadError);
}

TEST_F(ConfigTest, InvalidTomlThrows) {
    peerpin::test::TempDir dir;
    auto file = dir.Write("broken.toml", "[server\naddress = \n");

    try {
        InitConfig(file);
        FAIL() << "expected ConfigLoadError";
    } catch (const ConfigLoadError& e) {
        EXPECT_EQ(e.path(), file);
    }
}
