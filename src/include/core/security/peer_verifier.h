#pragma once

#include <core/model/verify_result.h>
#include <core/security/fingerprint.h>
#include <core/security/known_peers.h>
#include <functional>
#include <memory>
#include <vector>

namespace peerpin::core {

/**
 * @brief Authorization gate run by the accepting side in place of chain
 * validation: maps the certificate list a peer presented (leaf first) to an
 * authorized identity or a rejection reason.
 */
using PeerAuthorizer = std::function<VerifyResult(const std::vector<DerBytes>& presented)>;

/**
 * @brief Decides whether a presented leaf certificate is on the allow-list
 *
 * Only the leaf is looked at; any further chain entries are ignored because
 * no issuer is trusted. Lookup is by subject CN, then the SHA-256 fingerprint
 * of the leaf must equal the provisioned one.
 *
 * Verify() does no I/O and only reads the shared registry, so one instance
 * may serve concurrent handshakes. Every decision is logged; the log lines
 * are the audit trail of who was let in and why others were not.
 */
class PeerVerifier {
public:
    explicit PeerVerifier(std::shared_ptr<const KnownPeers> known_peers);

    VerifyResult Verify(const std::vector<DerBytes>& presented) const;

    PeerAuthorizer AsAuthorizer() const;


private:
    std::shared_ptr<const KnownPeers> known_peers_;
};

} // namespace peerpin::core
