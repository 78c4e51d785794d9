#include <core/security/certificate_manager.h>
#include <core/security/handshake_policy.h>
#include <core/security/open_ssl_provider.h>
#include <core/util/error.h>
#include <fstream>
#include <spdlog/spdlog.h>
#include <sstream>

namespace fs = std::filesystem;
namespace net = boost::asio;
namespace ssl = net::ssl;

namespace peerpin::core {

namespace {

DerBytes toDer(X509* x509) {
    int length = i2d_X509(x509, nullptr);
    if (length <= 0) {
        return {};
    }
    DerBytes der(static_cast<std::size_t>(length));
    unsigned char* cursor = der.data();
    i2d_X509(x509, &cursor);
    return der;
}

// Installed with SSL_CTX_set_cert_verify_callback: runs instead of
// X509_verify_cert, so no chain is built and no trust anchor is consulted.
int authorizePeer(X509_STORE_CTX* store_ctx, void* arg) {
    auto* authorizer = static_cast<const PeerAuthorizer*>(arg);
    try {
        std::vector<DerBytes> presented;
        X509* leaf = X509_STORE_CTX_get0_cert(store_ctx);
        if (leaf) {
            presented.push_back(toDer(leaf));
        }
        if (STACK_OF(X509)* chain = X509_STORE_CTX_get0_untrusted(store_ctx)) {
            for (int i = 0; i < sk_X509_num(chain); i++) {
                X509* cert = sk_X509_value(chain, i);
                if (cert != leaf) {
                    presented.push_back(toDer(cert));
                }
            }
        }

        VerifyResult result = (*authorizer)(presented);
        if (result.accepted()) {
            X509_STORE_CTX_set_error(store_ctx, X509_V_OK);
            return 1;
        }
        spdlog::debug("Handshake rejected ({}): {}", ToString(result.status), result.detail);
        X509_STORE_CTX_set_error(store_ctx, X509_V_ERR_APPLICATION_VERIFICATION);
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Peer verification aborted: {}", e.what());
        X509_STORE_CTX_set_error(store_ctx, X509_V_ERR_APPLICATION_VERIFICATION);
        return 0;
    }
}

ssl::context::options baseOptions() {
    return ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3
           | ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1;
}

void useOwnCredentials(ssl::context& ctx, const SecurityContext& own, std::string_view role) {
    try {
        ctx.use_certificate(net::buffer(own.certificate_pem), ssl::context::pem);
        ctx.use_private_key(net::buffer(own.private_key_pem), ssl::context::pem);
    } catch (const boost::system::system_error& e) {
        throw ConfigLoadError(std::string(role) + " credentials for '" + own.common_name + "'",
                              e.what());
    }
}

Certificate loadPinnedCertificate(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw ConfigLoadError(path, "cannot open pinned certificate file");
    }
    std::stringstream stream;
    stream << file.rdbuf();
    if (file.bad()) {
        throw ConfigLoadError(path, "failed to read pinned certificate file");
    }
    std::string pem = stream.str();

    std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new_mem_buf(pem.data(),
                                                                  static_cast<int>(pem.size())),
                                                  &BIO_free);
    std::vector<Certificate> found;
    while (X509* x509 = bio ? PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr) : nullptr) {
        found.emplace_back(x509);
    }
    ERR_clear_error(); // end of input shows up as PEM_R_NO_START_LINE

    if (found.empty()) {
        throw ConfigLoadError(path, "no PEM certificate found");
    }
    if (found.size() > 1) {
        throw ConfigLoadError(path,
                              "expected exactly one pinned certificate, found "
                                  + std::to_string(found.size()));
    }
    return std::move(found.front());
}

} // namespace

AcceptingPolicy::AcceptingPolicy(ssl::context context, std::unique_ptr<PeerAuthorizer> authorizer)
    : context_(std::move(context))
    , authorizer_(std::move(authorizer)) {}

ConnectingPolicy::ConnectingPolicy(ssl::context context,
                                   Certificate pinned,
                                   ConnectingOptions options)
    : context_(std::move(context))
    , pinned_(std::move(pinned))
    , options_(options) {}

AcceptingPolicy BuildAcceptingPolicy(const SecurityContext& own, PeerAuthorizer authorizer) {
    OpenSSLProvider::InitOpenSSL();
    if (!authorizer) {
        throw std::invalid_argument("BuildAcceptingPolicy requires a peer authorizer");
    }

    ssl::context ctx(ssl::context::tls_server);
    ctx.set_options(baseOptions() | ssl::context::single_dh_use);
    SSL_CTX_set_min_proto_version(ctx.native_handle(), TLS1_2_VERSION);

    useOwnCredentials(ctx, own, "server");

    // A certificate is mandatory; whether it is acceptable is decided only
    // by the authorizer, never by chain-of-trust validation.
    ctx.set_verify_mode(ssl::verify_peer | ssl::verify_fail_if_no_peer_cert);
    auto owned = std::make_unique<PeerAuthorizer>(std::move(authorizer));
    SSL_CTX_set_cert_verify_callback(ctx.native_handle(), &authorizePeer, owned.get());

    // Every connection runs the full handshake: a resumed session would skip
    // the authorizer and its audit line.
    SSL_CTX_set_options(ctx.native_handle(), SSL_OP_NO_TICKET);
    SSL_CTX_set_session_cache_mode(ctx.native_handle(), SSL_SESS_CACHE_OFF);
    OpenSSLProvider::SetSessionIdContext(ctx, "peerpin_server");

    spdlog::debug("Accepting policy built for '{}' ({})", own.common_name, own.certificate_hash);
    return AcceptingPolicy(std::move(ctx), std::move(owned));
}

AcceptingPolicy BuildAcceptingPolicy(const SecurityContext& own,
                                     std::shared_ptr<const KnownPeers> known_peers) {
    PeerVerifier verifier(std::move(known_peers));
    return BuildAcceptingPolicy(own, verifier.AsAuthorizer());
}

AcceptingPolicy BuildAcceptingPolicy(const fs::path& cert_file,
                                     const fs::path& key_file,
                                     const fs::path& known_peers_file) {
    auto known_peers = std::make_shared<const KnownPeers>(
        KnownPeers::LoadFromFile(known_peers_file));
    SecurityContext own = CertificateManager::LoadSecurityContext(cert_file, key_file);
    return BuildAcceptingPolicy(own, std::move(known_peers));
}

ConnectingPolicy BuildConnectingPolicy(const SecurityContext& own,
                                       const Certificate& pinned,
                                       ConnectingOptions options) {
    OpenSSLProvider::InitOpenSSL();

    ssl::context ctx(ssl::context::tls_client);
    ctx.set_options(baseOptions());
    SSL_CTX_set_min_proto_version(ctx.native_handle(), TLS1_2_VERSION);

    useOwnCredentials(ctx, own, "client");

    // The store starts empty (no default verify paths are loaded); the pinned
    // certificate becomes its only anchor.
    X509_STORE* store = SSL_CTX_get_cert_store(ctx.native_handle());
    if (X509_STORE_add_cert(store, pinned.native_handle()) != 1) {
        throw std::runtime_error("Failed to pin server certificate: "
                                 + OpenSSLProvider::LastError());
    }
    ctx.set_verify_mode(ssl::verify_peer);

    spdlog::debug("Connecting policy built for '{}', pinned server '{}' ({})",
                  own.common_name,
                  pinned.common_name(),
                  pinned.fingerprint());
    return ConnectingPolicy(std::move(ctx), pinned, options);
}

ConnectingPolicy BuildConnectingPolicy(const fs::path& cert_file,
                                       const fs::path& key_file,
                                       const fs::path& pinned_cert_file,
                                       ConnectingOptions options) {
    SecurityContext own = CertificateManager::LoadSecurityContext(cert_file, key_file);
    Certificate pinned = loadPinnedCertificate(pinned_cert_file);
    spdlog::info("Pinned server certificate {} (CN='{}', fingerprint {})",
                 pinned_cert_file.string(),
                 pinned.common_name(),
                 pinned.fingerprint());
    return BuildConnectingPolicy(own, pinned, options);
}

} // namespace peerpin::core
