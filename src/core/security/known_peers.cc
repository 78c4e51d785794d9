#include <cctype>
#include <core/security/fingerprint.h>
#include <core/security/known_peers.h>
#include <core/util/error.h>
#include <fstream>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace peerpin::core {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

std::vector<std::string_view> splitFields(std::string_view s) {
    std::vector<std::string_view> fields;
    std::size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) {
            i++;
        }
        std::size_t start = i;
        while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i]))) {
            i++;
        }
        if (i > start) {
            fields.push_back(s.substr(start, i - start));
        }
    }
    return fields;
}

} // namespace

KnownPeers KnownPeers::LoadFromFile(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigLoadError(path, "failed to open known peers file");
    }
    KnownPeers peers = Parse(file, path.string());
    spdlog::info("Loaded {} known peers from {}", peers.size(), path.string());
    return peers;
}

KnownPeers KnownPeers::Parse(std::istream& input, std::string_view source_name) {
    KnownPeers peers;
    peers.source_ = source_name;

    std::string line;
    std::size_t line_number = 0;
    while (std::getline(input, line)) {
        peers.parseLine(line, ++line_number);
    }
    if (input.bad()) {
        throw ConfigLoadError(std::string(source_name), "error reading known peers");
    }

    if (peers.entries_.empty()) {
        spdlog::warn("No valid peer entries found in {}; every peer will be rejected",
                     peers.source_);
    }
    return peers;
}

void KnownPeers::parseLine(std::string_view raw, std::size_t line_number) {
    std::string_view line = trim(raw);
    if (line.empty() || line.front() == '#') {
        return;
    }

    auto fields = splitFields(line);
    if (fields.size() != 2) {
        std::string reason = "expected '<identity-name> <fingerprint>', found "
                             + std::to_string(fields.size()) + " field(s)";
        spdlog::warn("Skipping invalid line {} in {}: {}", line_number, source_, reason);
        malformed_lines_.push_back({line_number, std::move(reason)});
        return;
    }

    std::string identity(fields[0]);
    std::string expected = fingerprint::Normalize(fields[1]);
    if (!fingerprint::IsWellFormed(expected)) {
        // Kept as an opaque value; it can never match a computed fingerprint.
        spdlog::warn("Line {} in {}: fingerprint for '{}' is not a SHA-256 fingerprint",
                     line_number,
                     source_,
                     identity);
    }

    auto [it, inserted] = entries_.insert_or_assign(std::move(identity), std::move(expected));
    if (!inserted) {
        spdlog::debug("Line {} in {}: '{}' supersedes an earlier entry",
                      line_number,
                      source_,
                      it->first);
    }
}

std::optional<std::string> KnownPeers::FindFingerprint(const std::string& identity) const {
    auto it = entries_.find(identity);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool KnownPeers::Contains(const std::string& identity) const {
    return entries_.contains(identity);
}

} // namespace peerpin::core
