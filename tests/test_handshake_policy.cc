#include "test_support.h"

#include <core/security/certificate_manager.h>
#include <core/security/handshake_policy.h>
#include <core/util/error.h>
#include <core/security/open_ssl_provider.h>
#include <gtest/gtest.h>
#include <openssl/ssl.h>
#include <openssl/x509_vfy.h>
#include <thread>
#include <vector>

using namespace peerpin::core;

class HandshakePolicyTest : public ::testing::Test {
protected:
    void SetUp() override {
        manager_ = std::make_unique<CertificateManager>(dir_.path() / "certs");
        provisioned_ = manager_->Provision("localhost", "my_secure_client", 30);
    }

    peerpin::test::TempDir dir_;
    std::unique_ptr<CertificateManager> manager_;
    ProvisionResult provisioned_;
};

TEST_F(HandshakePolicyTest, ProvisionWritesBothIdentitiesAndRegistry) {
    EXPECT_TRUE(std::filesystem::exists(provisioned_.server_certificate));
    EXPECT_TRUE(std::filesystem::exists(provisioned_.server_key));
    EXPECT_TRUE(std::filesystem::exists(provisioned_.client_certificate));
    EXPECT_TRUE(std::filesystem::exists(provisioned_.client_key));

    auto key_perms = std::filesystem::status(provisioned_.client_key).permissions();
    EXPECT_EQ(key_perms, std::filesystem::perms::owner_read);

    auto client = Certificate::FromPemFile(provisioned_.client_certificate);
    EXPECT_EQ(client.common_name(), "my_secure_client");
    EXPECT_EQ(client.fingerprint(), provisioned_.client_fingerprint);

    auto server = Certificate::FromPemFile(provisioned_.server_certificate);
    EXPECT_EQ(server.common_name(), "localhost");

    auto peers = KnownPeers::LoadFromFile(provisioned_.known_peers);
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers.FindFingerprint("my_secure_client"), provisioned_.client_fingerprint);
}

TEST_F(HandshakePolicyTest, ReprovisionReplacesReadOnlyKeys) {
    auto again = manager_->Provision("localhost", "my_secure_client", 30);

    EXPECT_NE(again.client_fingerprint, provisioned_.client_fingerprint);
    EXPECT_EQ(Certificate::FromPemFile(again.client_certificate).fingerprint(),
              again.client_fingerprint);
}

TEST_F(HandshakePolicyTest, LoadedIdentityMatchesFiles) {
    auto own = CertificateManager::LoadSecurityContext(provisioned_.client_certificate,
                                                       provisioned_.client_key);

    EXPECT_EQ(own.common_name, "my_secure_client");
    EXPECT_EQ(own.certificate_hash, provisioned_.client_fingerprint);
    EXPECT_FALSE(own.private_key_pem.empty());
}

TEST_F(HandshakePolicyTest, AcceptingPolicyRequiresClientCertificate) {
    auto policy = BuildAcceptingPolicy(provisioned_.server_certificate,
                                       provisioned_.server_key,
                                       provisioned_.known_peers);
    SSL_CTX* ctx = policy.context().native_handle();

    EXPECT_EQ(SSL_CTX_get_verify_mode(ctx), SSL_VERIFY_PEER | SSL_VERIFY_FAIL_IF_NO_PEER_CERT);
    EXPECT_EQ(SSL_CTX_get_min_proto_version(ctx), TLS1_2_VERSION);
    // No client CA list is advertised.
    auto* ca_list = SSL_CTX_get_client_CA_list(ctx);
    EXPECT_TRUE(ca_list == nullptr || sk_X509_NAME_num(ca_list) == 0);
}

TEST_F(HandshakePolicyTest, AcceptingPolicyNeverResumesSessions) {
    auto policy = BuildAcceptingPolicy(provisioned_.server_certificate,
                                       provisioned_.server_key,
                                       provisioned_.known_peers);
    SSL_CTX* ctx = policy.context().native_handle();

    EXPECT_NE(SSL_CTX_get_options(ctx) & SSL_OP_NO_TICKET, 0u);
    EXPECT_EQ(SSL_CTX_get_session_cache_mode(ctx), SSL_SESS_CACHE_OFF);
}

TEST_F(HandshakePolicyTest, ConnectingPolicyTrustsOnlyThePinnedCertificate) {
    auto policy = BuildConnectingPolicy(provisioned_.client_certificate,
                                        provisioned_.client_key,
                                        provisioned_.server_certificate);
    SSL_CTX* ctx = policy.context().native_handle();

    EXPECT_EQ(SSL_CTX_get_verify_mode(ctx), SSL_VERIFY_PEER);
    EXPECT_EQ(SSL_CTX_get_min_proto_version(ctx), TLS1_2_VERSION);
    EXPECT_EQ(sk_X509_OBJECT_num(X509_STORE_get0_objects(SSL_CTX_get_cert_store(ctx))), 1);
    EXPECT_EQ(policy.pinned_certificate().fingerprint(),
              Certificate::FromPemFile(provisioned_.server_certificate).fingerprint());
    EXPECT_TRUE(policy.options().verify_hostname);
    EXPECT_EQ(SSL_CTX_get_session_cache_mode(ctx) & SSL_SESS_CACHE_CLIENT, 0);
}

TEST_F(HandshakePolicyTest, MissingCertificateFileFailsFast) {
    auto missing = dir_.path() / "nope.crt";
    try {
        BuildAcceptingPolicy(missing, provisioned_.server_key, provisioned_.known_peers);
        FAIL() << "expected ConfigLoadError";
    } catch (const ConfigLoadError& e) {
        EXPECT_EQ(e.path(), missing);
    }
}

TEST_F(HandshakePolicyTest, MissingKnownPeersFileFailsFast) {
    auto missing = dir_.path() / "knownClients.txt";
    try {
        BuildAcceptingPolicy(provisioned_.server_certificate, provisioned_.server_key, missing);
        FAIL() << "expected ConfigLoadError";
    } catch (const ConfigLoadError& e) {
        EXPECT_EQ(e.path(), missing);
    }
}

TEST_F(HandshakePolicyTest, GarbageCertificateFailsFast) {
    auto garbage = dir_.Write("garbage.crt", "this is not a certificate\n");
    EXPECT_THROW(BuildConnectingPolicy(garbage, provisioned_.client_key,
                                       provisioned_.server_certificate),
                 ConfigLoadError);
}

TEST_F(HandshakePolicyTest, KeyOfAnotherCertificateFailsFast) {
    try {
        BuildConnectingPolicy(provisioned_.client_certificate,
                              provisioned_.server_key,
                              provisioned_.server_certificate);
        FAIL() << "expected ConfigLoadError";
    } catch (const ConfigLoadError& e) {
        EXPECT_EQ(e.path(), provisioned_.server_key);
    }
}

TEST_F(HandshakePolicyTest, MismatchedInMemoryCredentialsFailFast) {
    auto a = peerpin::test::MakeIdentity("a");
    auto b = peerpin::test::MakeIdentity("b");
    SecurityContext mixed = a;
    mixed.private_key_pem = b.private_key_pem;

    EXPECT_THROW(BuildConnectingPolicy(mixed, peerpin::test::CertificateOf(b)), ConfigLoadError);
}

TEST_F(HandshakePolicyTest, PinnedFileMustHoldExactlyOneCertificate) {
    auto server_pem = Certificate::FromPemFile(provisioned_.server_certificate).pem();
    auto client_pem = Certificate::FromPemFile(provisioned_.client_certificate).pem();

    auto two = dir_.Write("two.crt", server_pem + client_pem);
    auto none = dir_.Write("none.crt", "");

    EXPECT_THROW(BuildConnectingPolicy(provisioned_.client_certificate,
                                       provisioned_.client_key,
                                       two),
                 ConfigLoadError);
    EXPECT_THROW(BuildConnectingPolicy(provisioned_.client_certificate,
                                       provisioned_.client_key,
                                       none),
                 ConfigLoadError);
    EXPECT_THROW(BuildConnectingPolicy(provisioned_.client_certificate,
                                       provisioned_.client_key,
                                       dir_.path() / "absent.crt"),
                 ConfigLoadError);
}

TEST_F(HandshakePolicyTest, EmptyAuthorizerRejected) {
    auto own = peerpin::test::MakeServerIdentity();
    EXPECT_THROW(BuildAcceptingPolicy(own, PeerAuthorizer{}), std::invalid_argument);
}

TEST(OpenSSLProviderTest, ConcurrentInitialization) {
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([] { OpenSSLProvider::InitOpenSSL(); });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    // The library is usable afterwards from any thread.
    auto identity = peerpin::test::MakeIdentity("after_init");
    EXPECT_EQ(peerpin::test::CertificateOf(identity).common_name(), "after_init");
}

TEST(OpenSSLProviderTest, LastErrorFallsBackWhenQueueIsEmpty) {
    ERR_clear_error();
    EXPECT_EQ(OpenSSLProvider::LastError("nothing queued"), "nothing queued");
}
