#include <core/security/certificate.h>
#include <core/security/open_ssl_provider.h>
#include <core/util/error.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace peerpin::core {

namespace {

struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free(bio); }
};

using BioPtr = std::unique_ptr<BIO, BioDeleter>;

} // namespace

Certificate::Certificate(X509* x509)
    : x509_(x509) {
    if (!x509_) {
        throw std::invalid_argument("Certificate requires a non-null X509");
    }
}

Certificate::Certificate(const Certificate& other)
    : x509_(X509_dup(other.x509_.get())) {
    if (!x509_) {
        throw std::runtime_error("X509_dup failed: " + OpenSSLProvider::LastError());
    }
}

Certificate& Certificate::operator=(const Certificate& other) {
    if (this != &other) {
        Certificate copy(other);
        x509_ = std::move(copy.x509_);
    }
    return *this;
}

std::optional<Certificate> Certificate::FromDer(const std::uint8_t* data, std::size_t size) {
    const unsigned char* cursor = data;
    X509* x509 = d2i_X509(nullptr, &cursor, static_cast<long>(size));
    if (!x509) {
        ERR_clear_error();
        return std::nullopt;
    }
    // Trailing garbage after the certificate is not a certificate either.
    if (cursor != data + size) {
        X509_free(x509);
        return std::nullopt;
    }
    return Certificate(x509);
}

std::optional<Certificate> Certificate::FromDer(const DerBytes& der) {
    return FromDer(der.data(), der.size());
}

std::optional<Certificate> Certificate::FromPem(std::string_view pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return std::nullopt;
    }
    X509* x509 = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr);
    if (!x509) {
        ERR_clear_error();
        return std::nullopt;
    }
    return Certificate(x509);
}

std::optional<Certificate> Certificate::FromPeer(const SSL* ssl) {
    if (!ssl) {
        return std::nullopt;
    }
    X509* x509 = SSL_get1_peer_certificate(ssl);
    if (!x509) {
        return std::nullopt;
    }
    return Certificate(x509);
}

Certificate Certificate::FromPemFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw ConfigLoadError(path, "cannot open certificate file");
    }
    std::stringstream stream;
    stream << file.rdbuf();
    if (file.bad()) {
        throw ConfigLoadError(path, "failed to read certificate file");
    }

    std::string pem = stream.str();
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    X509* x509 = bio ? PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr) : nullptr;
    if (!x509) {
        throw ConfigLoadError(path,
                              "no PEM certificate found ("
                                  + OpenSSLProvider::LastError("empty or not PEM") + ")");
    }
    return Certificate(x509);
}

std::string Certificate::common_name() const {
    X509_NAME* subject = X509_get_subject_name(x509_.get());
    if (!subject) {
        return {};
    }
    int index = X509_NAME_get_index_by_NID(subject, NID_commonName, -1);
    if (index < 0) {
        return {};
    }
    ASN1_STRING* data = X509_NAME_ENTRY_get_data(X509_NAME_get_entry(subject, index));
    unsigned char* utf8 = nullptr;
    int length = ASN1_STRING_to_UTF8(&utf8, data);
    if (length < 0) {
        ERR_clear_error();
        return {};
    }
    std::string name(reinterpret_cast<char*>(utf8), static_cast<std::size_t>(length));
    OPENSSL_free(utf8);
    return name;
}

DerBytes Certificate::der() const {
    int length = i2d_X509(x509_.get(), nullptr);
    if (length <= 0) {
        throw std::runtime_error("i2d_X509 failed: " + OpenSSLProvider::LastError());
    }
    DerBytes der(static_cast<std::size_t>(length));
    unsigned char* cursor = der.data();
    i2d_X509(x509_.get(), &cursor);
    return der;
}

std::string Certificate::pem() const {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_X509(bio.get(), x509_.get()) != 1) {
        throw std::runtime_error("PEM_write_bio_X509 failed: " + OpenSSLProvider::LastError());
    }
    char* buf = nullptr;
    long len = BIO_get_mem_data(bio.get(), &buf);
    return std::string(buf, static_cast<std::size_t>(len));
}

std::string Certificate::fingerprint() const {
    return fingerprint::Compute(der());
}

} // namespace peerpin::core
