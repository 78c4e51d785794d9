#pragma once

#include <core/security/fingerprint.h>
#include <filesystem>
#include <memory>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <optional>
#include <string>
#include <string_view>

namespace peerpin::core {

// Immutable, owning wrapper around a parsed X.509 certificate.
class Certificate {
public:
    // Takes ownership of x509.
    explicit Certificate(X509* x509);

    Certificate(const Certificate& other);
    Certificate& operator=(const Certificate& other);
    Certificate(Certificate&&) noexcept = default;
    Certificate& operator=(Certificate&&) noexcept = default;
    ~Certificate() = default;

    static std::optional<Certificate> FromDer(const std::uint8_t* data, std::size_t size);
    static std::optional<Certificate> FromDer(const DerBytes& der);
    static std::optional<Certificate> FromPem(std::string_view pem);

    // Certificate the remote side presented on an established connection.
    static std::optional<Certificate> FromPeer(const SSL* ssl);

    // Throws ConfigLoadError if the file cannot be read or holds no certificate.
    static Certificate FromPemFile(const std::filesystem::path& path);

    // Subject CN, empty if the subject carries none.
    std::string common_name() const;

    DerBytes der() const;

    std::string pem() const;

    std::string fingerprint() const;

    X509* native_handle() const { return x509_.get(); }

private:
    struct X509Deleter {
        void operator()(X509* x509) const { X509_free(x509); }
    };

    std::unique_ptr<X509, X509Deleter> x509_;
};

} // namespace peerpin::core
