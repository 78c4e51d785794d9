#include <core/security/certificate.h>
#include <core/security/peer_verifier.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace peerpin::core {

PeerVerifier::PeerVerifier(std::shared_ptr<const KnownPeers> known_peers)
    : known_peers_(std::move(known_peers)) {
    if (!known_peers_) {
        throw std::invalid_argument("PeerVerifier requires a known peers registry");
    }
}

VerifyResult PeerVerifier::Verify(const std::vector<DerBytes>& presented) const {
    if (presented.empty()) {
        spdlog::warn("Authentication failed: no peer certificate presented");
        return {VerifyStatus::kCredentialAbsent, {}, {}, "no peer certificate presented"};
    }

    auto leaf = Certificate::FromDer(presented.front());
    if (!leaf) {
        spdlog::warn("Authentication failed: peer certificate could not be parsed");
        return {VerifyStatus::kMalformedCredential,
                {},
                {},
                "failed to parse peer certificate"};
    }

    std::string identity = leaf->common_name();
    std::string actual = fingerprint::Compute(presented.front());

    spdlog::info("Verifying peer: CN='{}', Fingerprint='{}'", identity, actual);

    auto expected = known_peers_->FindFingerprint(identity);
    if (!expected) {
        spdlog::warn("Authentication failed: CN '{}' not found in known peers", identity);
        return {VerifyStatus::kPeerNotAuthorized,
                identity,
                actual,
                "peer CN '" + identity + "' not authorized"};
    }

    if (*expected != actual) {
        spdlog::warn("Authentication failed: fingerprint mismatch for CN '{}'. Expected '{}', "
                     "got '{}'",
                     identity,
                     *expected,
                     actual);
        return {VerifyStatus::kPeerCredentialMismatch,
                identity,
                actual,
                "peer fingerprint mismatch for CN '" + identity + "'"};
    }

    spdlog::info("Peer authenticated via fingerprint: CN='{}'", identity);
    return {VerifyStatus::kAccepted, identity, actual, {}};
}

PeerAuthorizer PeerVerifier::AsAuthorizer() const {
    // Copies the registry handle, so the authorizer outlives this verifier.
    return [verifier = *this](const std::vector<DerBytes>& presented) {
        return verifier.Verify(presented);
    };
}

} // namespace peerpin::core
