#pragma once

#include <cstdint>
#include <string>

namespace peerpin::core {

// What the accepting role hands to request handlers for an authorized connection.
struct PeerIdentity {
    std::string name;
    std::string fingerprint;
    std::string address;
    std::uint16_t port = 0;
};

} // namespace peerpin::core
