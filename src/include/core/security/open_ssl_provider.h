/**
 * @file open_ssl_provider.h
 * @brief OpenSSL headers, one-time library initialization and small helpers
 * shared by the handshake policy builders
 */
#pragma once

#include <boost/asio/ssl/context.hpp>
#include <openssl/bio.h>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/objects.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>
#include <openssl/x509v3.h>
#include <string>
#include <string_view>

namespace peerpin::core {

class OpenSSLProvider {
private:
    OpenSSLProvider() = delete;

    static std::string createSessionId(std::string_view prefix);

public:
    /**
     * @brief Initialize OpenSSL library
     * 
     * This function should be called before using any OpenSSL functions.
     * It will only initialize once, can be called multiple times safely,
     * including concurrently from several threads.
     */
    static void InitOpenSSL();

    /**
     * @brief Drain the calling thread's OpenSSL error queue into one message
     * 
     * @param fallback Returned when the queue is empty
     * @return std::string "; "-joined reason strings
     */
    static std::string LastError(std::string_view fallback = "unknown OpenSSL error");

    /**
     * @brief Give the context a unique session id context so that resumed
     * sessions stay bound to the policy that authorized them
     * 
     * @param ctx SSL context to configure
     * @param prefix Human readable role prefix, e.g. "peerpin_server"
     */
    static void SetSessionIdContext(boost::asio::ssl::context& ctx, std::string_view prefix);

    /**
     * @brief Set the hostname (SNI) for the SSL connection
     * 
     * @param ssl SSL connection object
     * @param hostname Hostname to set
     * @return bool True if hostname was set successfully, false otherwise
     */
    static bool SetHostname(SSL* ssl, std::string_view hostname);
};

} // namespace peerpin::core
