#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace peerpin::core {

/**
 * @brief Read-only allow-list of peer identity name -> expected fingerprint
 *
 * Source format, one entry per line:
 *
 *     # comment
 *     <identity-name> <fingerprint>
 *
 * Blank and '#' lines are ignored. A line that does not split into exactly
 * two whitespace-separated fields is skipped and recorded in
 * malformed_lines(); it never aborts the load. A repeated identity name
 * replaces the earlier entry. Fingerprints are stored uppercased, so lookups
 * are case-insensitive on the fingerprint side.
 *
 * Built once before any connection is accepted and never mutated afterwards,
 * which is what makes concurrent lookups from several handshakes safe.
 */
class KnownPeers {
public:
    struct MalformedLine {
        std::size_t line_number;
        std::string reason;
    };

    // Throws ConfigLoadError if the file cannot be opened or read.
    static KnownPeers LoadFromFile(const std::filesystem::path& path);

    // source_name only labels diagnostics. Throws ConfigLoadError on a stream read failure.
    static KnownPeers Parse(std::istream& input, std::string_view source_name);

    std::optional<std::string> FindFingerprint(const std::string& identity) const;

    bool Contains(const std::string& identity) const;

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const std::vector<MalformedLine>& malformed_lines() const { return malformed_lines_; }
    const std::string& source() const { return source_; }

private:
    KnownPeers() = default;

    void parseLine(std::string_view line, std::size_t line_number);

    std::map<std::string, std::string> entries_;
    std::vector<MalformedLine> malformed_lines_;
    std::string source_;
};

} // namespace peerpin::core
