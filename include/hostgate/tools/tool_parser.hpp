#pragma once

#include "hostgate/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace hostgate::tools {

/// Metadata parsed from a tool script's leading comment block.
struct ToolInfo {
  std::string name;
  std::string description;
  std::string usage;
  std::vector<std::string> examples;
  std::string extension;
};

/// Rejects names that could escape a tool directory: empty, containing `/`
/// or containing `..`. Applied before any path is built from a tool name.
[[nodiscard]] common::Status validate_tool_name(const std::string &name);

/// Extension including the dot (".sh"), or empty when there is none.
[[nodiscard]] std::string tool_extension(const std::string &name);

/// Reads the header of `path` using the comment syntax of its extension
/// (.sh, .py, .go). Fails with ParseError for an unsupported extension.
[[nodiscard]] common::Result<ToolInfo> parse_tool_header(const std::filesystem::path &path);

/// Tools in `dir` with an allowed extension, sorted by name. Subdirectories
/// and files starting with `_` are skipped, as are files whose header cannot
/// be read.
[[nodiscard]] common::Result<std::vector<ToolInfo>>
list_tools_in_dir(const std::filesystem::path &dir,
                  const std::vector<std::string> &allowed_extensions);

[[nodiscard]] common::Result<ToolInfo>
get_tool_info(const std::filesystem::path &dir, const std::string &name,
              const std::vector<std::string> &allowed_extensions);

} // namespace hostgate::tools
