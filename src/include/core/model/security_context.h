#pragma once

#include <string>

namespace peerpin::core {

// Own identity material for one role.
struct SecurityContext {
    std::string private_key_pem;
    std::string certificate_pem;
    std::string certificate_hash; // SHA-256 fingerprint of certificate_pem's DER form
    std::string common_name;
};

} // namespace peerpin::core
