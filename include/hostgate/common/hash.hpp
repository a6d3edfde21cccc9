#pragma once

#include "hostgate/common/result.hpp"

#include <filesystem>
#include <string>

namespace hostgate::common {

/// Lowercase hex SHA-256 of an in-memory buffer.
[[nodiscard]] std::string sha256_hex(const std::string &data);

/// Lowercase hex SHA-256 of a file's contents, streamed in fixed-size chunks.
[[nodiscard]] Result<std::string> sha256_file_hex(const std::filesystem::path &path);

} // namespace hostgate::common
