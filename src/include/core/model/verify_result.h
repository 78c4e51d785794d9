#pragma once

#include <string>
#include <string_view>

namespace peerpin::core {

enum class VerifyStatus {
    kAccepted,
    kCredentialAbsent,       // peer presented no certificate
    kMalformedCredential,    // leaf bytes are not a parseable certificate
    kPeerNotAuthorized,      // identity name unknown to the registry
    kPeerCredentialMismatch, // identity known, fingerprint differs
};

constexpr std::string_view ToString(VerifyStatus status) {
    switch (status) {
    case VerifyStatus::kAccepted:
        return "accepted";
    case VerifyStatus::kCredentialAbsent:
        return "credential absent";
    case VerifyStatus::kMalformedCredential:
        return "malformed credential";
    case VerifyStatus::kPeerNotAuthorized:
        return "peer not authorized";
    case VerifyStatus::kPeerCredentialMismatch:
        return "peer credential mismatch";
    }
    return "unknown";
}

struct VerifyResult {
    VerifyStatus status;
    std::string identity;    // subject CN of the leaf, when one could be read
    std::string fingerprint; // computed fingerprint of the leaf, when parsed
    std::string detail;

    bool accepted() const { return status == VerifyStatus::kAccepted; }
};

} // namespace peerpin::core
