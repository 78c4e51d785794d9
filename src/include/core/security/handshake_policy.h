#pragma once

#include <boost/asio/ssl/context.hpp>
#include <core/model/security_context.h>
#include <core/security/certificate.h>
#include <core/security/known_peers.h>
#include <core/security/peer_verifier.h>
#include <filesystem>
#include <memory>
#include <string>

namespace peerpin::core {

/**
 * @brief TLS configuration of the accepting role
 *
 * Requires a client certificate, configures no client CA list and replaces
 * OpenSSL's chain building with the injected PeerAuthorizer. The authorizer
 * sees the raw presented certificates after the peer proved possession of the
 * leaf's private key and before the connection carries any application data.
 */
class AcceptingPolicy {
public:
    AcceptingPolicy(boost::asio::ssl::context context, std::unique_ptr<PeerAuthorizer> authorizer);

    AcceptingPolicy(AcceptingPolicy&&) = default;
    AcceptingPolicy& operator=(AcceptingPolicy&&) = default;

    boost::asio::ssl::context& context() { return context_; }

private:
    boost::asio::ssl::context context_;
    // Heap allocated: OpenSSL holds a raw pointer to it.
    std::unique_ptr<PeerAuthorizer> authorizer_;
};

struct ConnectingOptions {
    // Also require the dialed host name to appear in the pinned certificate.
    bool verify_hostname = true;
};

/**
 * @brief TLS configuration of the connecting role
 *
 * Certificate pinning: the verify store holds exactly one certificate, the
 * server certificate distributed out of band, and no system roots. Standard
 * verification against that single anchor accepts only that certificate.
 */
class ConnectingPolicy {
public:
    ConnectingPolicy(boost::asio::ssl::context context,
                     Certificate pinned,
                     ConnectingOptions options);

    ConnectingPolicy(ConnectingPolicy&&) = default;
    ConnectingPolicy& operator=(ConnectingPolicy&&) = default;

    boost::asio::ssl::context& context() { return context_; }
    const Certificate& pinned_certificate() const { return pinned_; }
    const ConnectingOptions& options() const { return options_; }

private:
    boost::asio::ssl::context context_;
    Certificate pinned_;
    ConnectingOptions options_;
};

/**
 * @brief Build the accepting role's policy around an arbitrary authorizer
 * 
 * @param own Certificate and key presented to connecting peers
 * @param authorizer Sole authorization gate for presented certificates
 * @return AcceptingPolicy Ready for use by a listener
 */
AcceptingPolicy BuildAcceptingPolicy(const SecurityContext& own, PeerAuthorizer authorizer);

/**
 * @brief Build the accepting role's policy gated by a PeerVerifier over the registry
 */
AcceptingPolicy BuildAcceptingPolicy(const SecurityContext& own,
                                     std::shared_ptr<const KnownPeers> known_peers);

/**
 * @brief Load certificate, key and known peers from disk and build the accepting policy
 * 
 * Throws ConfigLoadError before any network activity if a file is unusable.
 */
AcceptingPolicy BuildAcceptingPolicy(const std::filesystem::path& cert_file,
                                     const std::filesystem::path& key_file,
                                     const std::filesystem::path& known_peers_file);

ConnectingPolicy BuildConnectingPolicy(const SecurityContext& own,
                                       const Certificate& pinned,
                                       ConnectingOptions options = {});

/**
 * @brief Load the own identity and the single trusted server certificate from disk
 * 
 * The pinned file must contain exactly one certificate. Throws ConfigLoadError
 * before any network activity if a file is unusable.
 */
ConnectingPolicy BuildConnectingPolicy(const std::filesystem::path& cert_file,
                                       const std::filesystem::path& key_file,
                                       const std::filesystem::path& pinned_cert_file,
                                       ConnectingOptions options = {});

} // namespace peerpin::core
