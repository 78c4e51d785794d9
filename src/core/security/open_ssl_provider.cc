#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <core/security/open_ssl_provider.h>
#include <exception>
#include <mutex>
#include <spdlog/spdlog.h>

namespace ssl = boost::asio::ssl;
namespace uuids = boost::uuids;

namespace peerpin::core {

std::string OpenSSLProvider::createSessionId(std::string_view prefix) {
    uuids::random_generator gen;
    uuids::uuid id = gen();
    std::string uuid_str = uuids::to_string(id);
    return std::string(prefix) + "_" + uuid_str;
}

void OpenSSLProvider::InitOpenSSL() {
    static std::once_flag initialized;
    std::call_once(initialized, [] {
        if (OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS,
                             nullptr)
            != 1) {
            spdlog::error("OPENSSL_init_ssl failed");
            std::terminate();
        }
        spdlog::debug("OpenSSL initialized: {}", OpenSSL_version(OPENSSL_VERSION));
    });
}

std::string OpenSSLProvider::LastError(std::string_view fallback) {
    std::string message;
    char buf[256];
    while (unsigned long code = ERR_get_error()) {
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!message.empty()) {
            message += "; ";
        }
        message += buf;
    }
    return message.empty() ? std::string(fallback) : message;
}

void OpenSSLProvider::SetSessionIdContext(ssl::context& ctx, std::string_view prefix) {
    // SSL_MAX_SID_CTX_LENGTH is 32; the uuid suffix alone is 36 characters
    std::string session_id_context = createSessionId(prefix).substr(0, SSL_MAX_SID_CTX_LENGTH);
    SSL_CTX_set_session_id_context(ctx.native_handle(),
                                   reinterpret_cast<const unsigned char*>(
                                       session_id_context.c_str()),
                                   session_id_context.length());
}

bool OpenSSLProvider::SetHostname(SSL* ssl, std::string_view hostname) {
    std::string name(hostname);
    if (!ssl || !SSL_set_tlsext_host_name(ssl, name.c_str())) {
        return false;
    }
    return true;
}

} // namespace peerpin::core
