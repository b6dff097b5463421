#pragma once

#include <filesystem>
#include <string>

namespace packfetch {

// Lowercase hex SHA-256 of a file's contents. Throws std::runtime_error when the file
// cannot be read or the digest cannot be computed.
[[nodiscard]] std::string sha256File(const std::filesystem::path& path);

} // namespace packfetch
