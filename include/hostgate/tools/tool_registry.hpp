#pragma once

#include "hostgate/common/process.hpp"
#include "hostgate/common/result.hpp"
#include "hostgate/config/schema.hpp"
#include "hostgate/host/host_command_executor.hpp"
#include "hostgate/security/policy.hpp"
#include "hostgate/tools/tool_parser.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace hostgate::tools {

/// Disabled: every call fails. Legacy: tools are read straight from the
/// configured directories. Secure: only operator-approved copies run.
enum class RegistryMode { Disabled, Legacy, Secure };

[[nodiscard]] const char *registry_mode_name(RegistryMode mode);

/// Interpreter argv for a tool script: bash for .sh, python3 for .py and
/// `go run` for .go.
[[nodiscard]] common::Result<std::vector<std::string>>
tool_command(const std::filesystem::path &script, const std::vector<std::string> &args);

/// Read side of host tools. Directories are searched in priority order
/// (staging when in dev mode, then the project's approved directory, then the
/// shared `_common` directory) and the first directory holding a name wins.
class HostToolRegistry {
public:
  HostToolRegistry(config::HostToolsConfig config, std::filesystem::path workspace_root,
                   const security::SecurityPolicy &policy, common::IProcessRunner &processes);

  [[nodiscard]] RegistryMode mode() const;
  [[nodiscard]] bool enabled() const { return config_.enabled; }

  /// Dev mode also serves unapproved tools from the staging directories.
  void set_dev_mode(bool enabled) { dev_mode_ = enabled; }
  [[nodiscard]] bool dev_mode() const { return dev_mode_; }

  [[nodiscard]] common::Result<std::vector<std::filesystem::path>> tool_dirs() const;

  [[nodiscard]] common::Result<std::vector<ToolInfo>> list_tools() const;
  [[nodiscard]] common::Result<ToolInfo> get_tool_info(const std::string &name) const;
  [[nodiscard]] common::Result<host::HostExecResult>
  run_tool(const std::string &name, const std::vector<std::string> &args) const;

private:
  [[nodiscard]] std::filesystem::path resolve_dir(const std::string &dir) const;
  [[nodiscard]] common::Status check_enabled(const std::string &operation) const;

  config::HostToolsConfig config_;
  std::filesystem::path workspace_root_;
  const security::SecurityPolicy &policy_;
  common::IProcessRunner &processes_;
  bool dev_mode_ = false;
};

} // namespace hostgate::tools
