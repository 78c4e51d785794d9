#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace peerpin::core {

// Startup-time configuration failure: unreadable or malformed registry,
// certificate, key or config file. Fatal for the role being initialised.
class ConfigLoadError : public std::runtime_error {
public:
    ConfigLoadError(const std::filesystem::path& path, const std::string& cause)
        : std::runtime_error(path.string() + ": " + cause)
        , path_(path)
        , cause_(cause) {}

    const std::filesystem::path& path() const { return path_; }
    const std::string& cause() const { return cause_; }

private:
    std::filesystem::path path_;
    std::string cause_;
};

} // namespace peerpin::core
