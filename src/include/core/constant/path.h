#pragma once

#include <filesystem>

namespace peerpin::core {
namespace path {

inline const std::filesystem::path kLogDir = std::filesystem::temp_directory_path() / "peerpin"
                                             / "logs";

} // namespace path
} // namespace peerpin::core
