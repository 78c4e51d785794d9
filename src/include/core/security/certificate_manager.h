#pragma once

#include <core/model/security_context.h>
#include <filesystem>
#include <string>
#include <vector>

namespace peerpin::core {

struct CertificateSubject {
    std::string common_name;
    std::string organization = "PeerPin";
    std::string organizational_unit = "Self-Signed";
    std::vector<std::string> dns_names;
    std::vector<std::string> ip_addresses;
};

struct ProvisionResult {
    std::filesystem::path server_certificate;
    std::filesystem::path server_key;
    std::filesystem::path client_certificate;
    std::filesystem::path client_key;
    std::filesystem::path known_peers;
    std::string client_fingerprint;
};

/**
 * @brief Loads and creates the certificate/key material of both roles
 *
 * Loading is what the handshake policy builders consume at startup.
 * Generation backs the `provision` command: it produces the self-signed
 * server and client identities plus the known peers file the server reads.
 */
class CertificateManager {
public:
    explicit CertificateManager(const std::filesystem::path& certDir);

    /**
     * @brief Write server.crt/.key, client.crt/.key and knownClients.txt
     * into the certificate directory, replacing existing files
     *
     * Throws std::runtime_error on generation or I/O failure.
     */
    ProvisionResult Provision(const std::string& server_name,
                              const std::string& client_name,
                              int validity_days);


    /**
     * @brief Read a PEM certificate and its private key, checking they belong together
     *
     * Throws ConfigLoadError naming the offending file.
     */
    static SecurityContext LoadSecurityContext(const std::filesystem::path& certFile,
                                               const std::filesystem::path& keyFile);

    /**
     * @brief Create an RSA-2048 key and a self-signed SHA-256 certificate for it
     *
     * Throws std::runtime_error if OpenSSL fails.
     */
    static SecurityContext GenerateSelfSigned(const CertificateSubject& subject,
                                              int validity_days = kCertValidityDays);

    static void SaveSecurityContext(const SecurityContext& context,
                                    const std::filesystem::path& certFile,
                                    const std::filesystem::path& keyFile);

    static constexpr int kCertValidityDays = 365;

private:
    std::filesystem::path certificate_dir_;
};

} // namespace peerpin::core
