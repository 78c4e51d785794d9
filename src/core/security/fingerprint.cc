#include <algorithm>
#include <cctype>
#include <core/security/fingerprint.h>
#include <iomanip>
#include <memory>
#include <openssl/evp.h>
#include <sstream>
#include <stdexcept>

namespace peerpin::core::fingerprint {

std::string Compute(const std::uint8_t* data, std::size_t size) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> mdctx(EVP_MD_CTX_new(),
                                                                  &EVP_MD_CTX_free);
    if (!mdctx || EVP_DigestInit_ex(mdctx.get(), EVP_sha256(), nullptr) != 1
        || EVP_DigestUpdate(mdctx.get(), data, size) != 1
        || EVP_DigestFinal_ex(mdctx.get(), hash, &hashLen) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    std::stringstream ss;
    ss << std::hex << std::uppercase << std::setfill('0');
    for (unsigned int i = 0; i < hashLen; i++) {
        if (i > 0) {
            ss << ':';
        }
        ss << std::setw(2) << static_cast<int>(hash[i]);
    }
    return ss.str();
}

std::string Compute(const DerBytes& der) {
    return Compute(der.data(), der.size());
}

std::string Normalize(std::string_view fingerprint) {
    std::string normalized(fingerprint);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return normalized;
}

bool IsWellFormed(std::string_view fingerprint) {
    if (fingerprint.size() != kFormattedSize) {
        return false;
    }
    for (std::size_t i = 0; i < fingerprint.size(); i++) {
        unsigned char c = static_cast<unsigned char>(fingerprint[i]);
        if (i % 3 == 2) {
            if (c != ':') {
                return false;
            }
        } else if (!std::isdigit(c) && (c < 'A' || c > 'F')) {
            return false;
        }
    }
    return true;
}

} // namespace peerpin::core::fingerprint
