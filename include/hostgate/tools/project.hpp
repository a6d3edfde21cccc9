#pragma once

#include "hostgate/common/result.hpp"

#include <filesystem>
#include <string>

namespace hostgate::tools {

inline constexpr const char *kProjectMetaFile = ".project";
inline constexpr const char *kCommonDirName = "_common";

/// `<sanitized basename>-<first 8 hex chars of sha256(absolute path)>`. The
/// basename keeps only [A-Za-z0-9_-] and falls back to "project".
[[nodiscard]] std::string project_id(const std::filesystem::path &workspace);

/// Expands `~` and makes the approved root absolute.
[[nodiscard]] common::Result<std::filesystem::path>
resolve_approved_dir(const std::string &approved_dir);

[[nodiscard]] common::Result<std::filesystem::path>
project_approved_dir(const std::string &approved_dir, const std::filesystem::path &workspace);

[[nodiscard]] common::Result<std::filesystem::path>
common_approved_dir(const std::string &approved_dir);

} // namespace hostgate::tools
