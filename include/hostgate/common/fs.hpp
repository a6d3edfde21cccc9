#pragma once

#include "hostgate/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace hostgate::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool ends_with(const std::string &value, const std::string &suffix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split_whitespace(const std::string &value);
[[nodiscard]] std::string join(const std::vector<std::string> &parts, const std::string &separator);

[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// Absolute, lexically normalized form of `path` with no trailing separator.
[[nodiscard]] std::filesystem::path absolute_clean(const std::filesystem::path &path);

/// Lexical cleanup of a slash-separated path: collapses `//`, resolves `.` and
/// `..` segments, strips trailing separators. Never touches the filesystem.
[[nodiscard]] std::string clean_path(const std::string &path);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);
[[nodiscard]] Status write_file(const std::filesystem::path &path, const std::string &content);

} // namespace hostgate::common
