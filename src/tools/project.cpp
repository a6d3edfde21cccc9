#include "hostgate/tools/project.hpp"

#include "hostgate/common/fs.hpp"
#include "hostgate/common/hash.hpp"

#include <cctype>

namespace hostgate::tools {

std::string project_id(const std::filesystem::path &workspace) {
  const std::string absolute = common::absolute_clean(workspace).string();
  const std::string base = std::filesystem::path(absolute).filename().string();

  std::string name;
  for (const char ch : base) {
    const auto uch = static_cast<unsigned char>(ch);
    if (std::isalnum(uch) != 0 || ch == '-' || ch == '_') {
      name.push_back(ch);
    }
  }
  if (name.empty()) {
    name = "project";
  }
  return name + "-" + common::sha256_hex(absolute).substr(0, 8);
}

common::Result<std::filesystem::path> resolve_approved_dir(const std::string &approved_dir) {
  if (common::trim(approved_dir).empty()) {
    return common::Result<std::filesystem::path>::failure("approved_dir is not configured",
                                                          common::ErrorKind::InvalidArgument);
  }
  std::string expanded = approved_dir;
  if (expanded == "~" || common::starts_with(expanded, "~/")) {
    auto home = common::home_dir();
    if (!home.ok()) {
      return common::Result<std::filesystem::path>::failure(
          "cannot resolve home directory: " + home.error(), home.kind());
    }
    expanded = (home.value() / expanded.substr(expanded.size() > 1 ? 2 : 1)).string();
  }
  return common::Result<std::filesystem::path>::success(common::absolute_clean(expanded));
}

common::Result<std::filesystem::path> project_approved_dir(const std::string &approved_dir,
                                                           const std::filesystem::path &workspace) {
  auto resolved = resolve_approved_dir(approved_dir);
  if (!resolved.ok()) {
    return resolved;
  }
  return common::Result<std::filesystem::path>::success(resolved.value() / project_id(workspace));
}

common::Result<std::filesystem::path> common_approved_dir(const std::string &approved_dir) {
  auto resolved = resolve_approved_dir(approved_dir);
  if (!resolved.ok()) {
    return resolved;
  }
  return common::Result<std::filesystem::path>::success(resolved.value() / kCommonDirName);
}

} // namespace hostgate::tools
