#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace peerpin::core {

using DerBytes = std::vector<std::uint8_t>;

namespace fingerprint {

// SHA-256
inline constexpr std::size_t kDigestSize = 32;

// "AA:BB:...:FF", kDigestSize octets
inline constexpr std::size_t kFormattedSize = kDigestSize * 3 - 1;

/**
 * @brief SHA-256 digest of the raw (DER) certificate bytes, rendered as
 * uppercase hexadecimal octets joined by colons.
 *
 * Must produce exactly what `openssl x509 -noout -fingerprint -sha256`
 * prints after the '=' so that provisioned registry entries compare equal.
 */
std::string Compute(const std::uint8_t* data, std::size_t size);

std::string Compute(const DerBytes& der);

// Uppercases a fingerprint read from an external source.
std::string Normalize(std::string_view fingerprint);

// True if the value has the canonical shape (kDigestSize uppercase hex pairs, ':' separated).
bool IsWellFormed(std::string_view fingerprint);

} // namespace fingerprint

} // namespace peerpin::core
