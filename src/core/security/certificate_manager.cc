#include <core/security/certificate.h>
#include <core/security/certificate_manager.h>
#include <core/security/open_ssl_provider.h>
#include <core/util/error.h>
#include <fstream>
#include <openssl/bn.h>
#include <memory>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace peerpin::core {

namespace {

struct OpenSSLDeleter {
    void operator()(BIO* bio) const { BIO_free(bio); }
    void operator()(EVP_PKEY* pkey) const { EVP_PKEY_free(pkey); }
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
    void operator()(X509* x509) const { X509_free(x509); }
    void operator()(X509_EXTENSION* ext) const { X509_EXTENSION_free(ext); }
};

template<typename T>
using OpenSSLPtr = std::unique_ptr<T, OpenSSLDeleter>;

std::string readFile(const fs::path& path, std::string_view what) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw ConfigLoadError(path, "cannot open " + std::string(what));
    }
    std::stringstream stream;
    stream << file.rdbuf();
    if (file.bad()) {
        throw ConfigLoadError(path, "failed to read " + std::string(what));
    }
    return stream.str();
}

std::string bioToString(BIO* bio) {
    char* buf = nullptr;
    long len = BIO_get_mem_data(bio, &buf);
    return std::string(buf, static_cast<std::size_t>(len));
}

void writeFile(const fs::path& path, const std::string& content, fs::perms perms) {
    std::error_code ec;
    fs::remove(path, ec); // keys are left read-only, so replace rather than truncate
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open " + path.string() + " for writing");
    }
    file << content;
    file.close();
    if (!file) {
        throw std::runtime_error("failed to write " + path.string());
    }
    fs::permissions(path, perms, fs::perm_options::replace);
}

void addNameEntry(X509_NAME* name, const char* field, const std::string& value) {
    if (value.empty()) {
        return;
    }
    if (X509_NAME_add_entry_by_txt(name,
                                   field,
                                   MBSTRING_UTF8,
                                   reinterpret_cast<const unsigned char*>(value.c_str()),
                                   -1,
                                   -1,
                                   0)
        != 1) {
        throw std::runtime_error(std::string("Failed to set subject ") + field);
    }
}

} // namespace

CertificateManager::CertificateManager(const fs::path& certDir)
    : certificate_dir_(certDir) {
    OpenSSLProvider::InitOpenSSL();
}

SecurityContext CertificateManager::LoadSecurityContext(const fs::path& certFile,
                                                        const fs::path& keyFile) {
    Certificate certificate = Certificate::FromPemFile(certFile);

    std::string keyPem = readFile(keyFile, "private key file");
    OpenSSLPtr<BIO> keyBio(BIO_new_mem_buf(keyPem.data(), static_cast<int>(keyPem.size())));
    OpenSSLPtr<EVP_PKEY> pkey(
        keyBio ? PEM_read_bio_PrivateKey(keyBio.get(), nullptr, nullptr, nullptr) : nullptr);
    if (!pkey) {
        throw ConfigLoadError(keyFile,
                              "no PEM private key found (" + OpenSSLProvider::LastError() + ")");
    }

    if (X509_check_private_key(certificate.native_handle(), pkey.get()) != 1) {
        ERR_clear_error();
        throw ConfigLoadError(keyFile,
                              "private key does not match certificate " + certFile.string());
    }

    SecurityContext context;
    context.certificate_pem = certificate.pem();
    context.private_key_pem = std::move(keyPem);
    context.certificate_hash = certificate.fingerprint();
    context.common_name = certificate.common_name();

    spdlog::info("Loaded certificate {} (CN='{}', fingerprint {})",
                 certFile.string(),
                 context.common_name,
                 context.certificate_hash);
    return context;
}

SecurityContext CertificateManager::GenerateSelfSigned(const CertificateSubject& subject,
                                                       int validity_days) {
    OpenSSLProvider::InitOpenSSL();

    // 1. Generate RSA key pair
    spdlog::debug("Generating 2048-bit RSA key pair for '{}'...", subject.common_name);
    OpenSSLPtr<EVP_PKEY_CTX> keyCtx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
    if (!keyCtx || EVP_PKEY_keygen_init(keyCtx.get()) <= 0) {
        throw std::runtime_error("Failed to initialize RSA key generation");
    }
    if (EVP_PKEY_CTX_set_rsa_keygen_bits(keyCtx.get(), 2048) <= 0) {
        throw std::runtime_error("Failed to set RSA key size");
    }
    EVP_PKEY* rawKey = nullptr;
    if (EVP_PKEY_keygen(keyCtx.get(), &rawKey) <= 0) {
        throw std::runtime_error("Failed to generate RSA key pair");
    }
    OpenSSLPtr<EVP_PKEY> pkey(rawKey);

    // 2. Create X509 certificate
    OpenSSLPtr<X509> x509(X509_new());
    if (!x509) {
        throw std::runtime_error("Failed to allocate certificate");
    }

    // Set version (V3)
    X509_set_version(x509.get(), 2);

    // Random positive serial, so re-provisioned certificates never collide
    BIGNUM* serial = BN_new();
    if (!serial || BN_rand(serial, 64, BN_RAND_TOP_ANY, BN_RAND_BOTTOM_ANY) != 1
        || !BN_to_ASN1_INTEGER(serial, X509_get_serialNumber(x509.get()))) {
        BN_free(serial);
        throw std::runtime_error("Failed to set certificate serial number");
    }
    BN_free(serial);

    // Set validity period
    X509_gmtime_adj(X509_getm_notBefore(x509.get()), 0);
    X509_gmtime_adj(X509_getm_notAfter(x509.get()), 60L * 60 * 24 * validity_days);

    X509_set_pubkey(x509.get(), pkey.get());

    // Subject and issuer are the same name (self-signed)
    X509_NAME* name = X509_get_subject_name(x509.get());
    addNameEntry(name, "O", subject.organization);
    addNameEntry(name, "OU", subject.organizational_unit);
    addNameEntry(name, "CN", subject.common_name);
    X509_set_issuer_name(x509.get(), name);

    std::string altNames;
    for (const auto& dns : subject.dns_names) {
        altNames += (altNames.empty() ? "" : ",") + std::string("DNS:") + dns;
    }
    for (const auto& ip : subject.ip_addresses) {
        altNames += (altNames.empty() ? "" : ",") + std::string("IP:") + ip;
    }
    if (!altNames.empty()) {
        X509V3_CTX v3ctx;
        X509V3_set_ctx_nodb(&v3ctx);
        X509V3_set_ctx(&v3ctx, x509.get(), x509.get(), nullptr, nullptr, 0);
        OpenSSLPtr<X509_EXTENSION> ext(
            X509V3_EXT_conf_nid(nullptr, &v3ctx, NID_subject_alt_name, altNames.c_str()));
        if (!ext || X509_add_ext(x509.get(), ext.get(), -1) != 1) {
            throw std::runtime_error("Failed to add subjectAltName '" + altNames
                                     + "': " + OpenSSLProvider::LastError());
        }
    }

    // Sign the certificate
    if (X509_sign(x509.get(), pkey.get(), EVP_sha256()) == 0) {
        throw std::runtime_error("Failed to sign certificate: " + OpenSSLProvider::LastError());
    }

    // 3. Convert to PEM format
    OpenSSLPtr<BIO> privateBio(BIO_new(BIO_s_mem()));
    OpenSSLPtr<BIO> certBio(BIO_new(BIO_s_mem()));
    if (!privateBio || !certBio
        || PEM_write_bio_PrivateKey(privateBio.get(),
                                    pkey.get(),
                                    nullptr,
                                    nullptr,
                                    0,
                                    nullptr,
                                    nullptr)
               != 1
        || PEM_write_bio_X509(certBio.get(), x509.get()) != 1) {
        throw std::runtime_error("Failed to encode key material as PEM");
    }

    Certificate certificate(x509.release());

    SecurityContext context;
    context.private_key_pem = bioToString(privateBio.get());
    context.certificate_pem = bioToString(certBio.get());
    context.certificate_hash = certificate.fingerprint();
    context.common_name = subject.common_name;
    return context;
}

void CertificateManager::SaveSecurityContext(const SecurityContext& context,
                                             const fs::path& certFile,
                                             const fs::path& keyFile) {
    writeFile(certFile,
              context.certificate_pem,
              fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read
                  | fs::perms::others_read);
    writeFile(keyFile, context.private_key_pem, fs::perms::owner_read);
}

ProvisionResult CertificateManager::Provision(const std::string& server_name,
                                              const std::string& client_name,
                                              int validity_days) {
    if (!fs::exists(certificate_dir_)) {
        fs::create_directories(certificate_dir_);
    }

    ProvisionResult result{
        .server_certificate = certificate_dir_ / "server.crt",
        .server_key = certificate_dir_ / "server.key",
        .client_certificate = certificate_dir_ / "client.crt",
        .client_key = certificate_dir_ / "client.key",
        .known_peers = certificate_dir_ / "knownClients.txt",
    };

    spdlog::info("Generating self-signed server certificate for '{}'...", server_name);
    CertificateSubject serverSubject{.common_name = server_name,
                                     .organizational_unit = "Server",
                                     .dns_names = {server_name},
                                     .ip_addresses = {"127.0.0.1"}};
    SecurityContext server = GenerateSelfSigned(serverSubject, validity_days);
    SaveSecurityContext(server, result.server_certificate, result.server_key);

    spdlog::info("Generating self-signed client certificate for '{}'...", client_name);
    CertificateSubject clientSubject{.common_name = client_name, .organizational_unit = "Client"};
    SecurityContext client = GenerateSelfSigned(clientSubject, validity_days);
    SaveSecurityContext(client, result.client_certificate, result.client_key);

    result.client_fingerprint = client.certificate_hash;
    writeFile(result.known_peers,
              client_name + " " + client.certificate_hash + "\n",
              fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read
                  | fs::perms::others_read);

    spdlog::info("Known peer entry: {} {}", client_name, client.certificate_hash);
    return result;
}

} // namespace peerpin::core
