#include "hostgate/tools/tool_registry.hpp"

#include "hostgate/common/fs.hpp"
#include "hostgate/observability/global.hpp"
#include "hostgate/tools/project.hpp"

#include <set>

namespace hostgate::tools {

namespace {
constexpr const char *kComponent = "host_tools";
} // namespace

const char *registry_mode_name(const RegistryMode mode) {
  switch (mode) {
  case RegistryMode::Disabled:
    return "disabled";
  case RegistryMode::Legacy:
    return "legacy";
  case RegistryMode::Secure:
    return "secure";
  }
  return "disabled";
}

common::Result<std::vector<std::string>> tool_command(const std::filesystem::path &script,
                                                      const std::vector<std::string> &args) {
  const std::string extension = tool_extension(script.filename().string());
  std::vector<std::string> argv;
  if (extension == ".sh") {
    argv = {"bash", script.string()};
  } else if (extension == ".py") {
    argv = {"python3", script.string()};
  } else if (extension == ".go") {
    argv = {"go", "run", script.string()};
  } else {
    return common::Result<std::vector<std::string>>::failure("unsupported extension: " + extension,
                                                             common::ErrorKind::InvalidArgument);
  }
  argv.insert(argv.end(), args.begin(), args.end());
  return common::Result<std::vector<std::string>>::success(std::move(argv));
}

HostToolRegistry::HostToolRegistry(config::HostToolsConfig config,
                                   std::filesystem::path workspace_root,
                                   const security::SecurityPolicy &policy,
                                   common::IProcessRunner &processes)
    : config_(std::move(config)), workspace_root_(common::absolute_clean(workspace_root)),
      policy_(policy), processes_(processes) {}

RegistryMode HostToolRegistry::mode() const {
  if (!config_.enabled) {
    return RegistryMode::Disabled;
  }
  return config_.approved_dir.empty() ? RegistryMode::Legacy : RegistryMode::Secure;
}

std::filesystem::path HostToolRegistry::resolve_dir(const std::string &dir) const {
  const std::filesystem::path path(common::expand_path(dir));
  if (path.is_absolute()) {
    return path;
  }
  return workspace_root_ / path;
}

common::Status HostToolRegistry::check_enabled(const std::string &operation) const {
  if (!config_.enabled) {
    observability::record_access_denied(kComponent, operation, "host tools are disabled");
    return common::Status::error("host tools are disabled", common::ErrorKind::PermissionDenied);
  }
  return common::Status::success();
}

common::Result<std::vector<std::filesystem::path>> HostToolRegistry::tool_dirs() const {
  std::vector<std::filesystem::path> dirs;
  if (mode() == RegistryMode::Legacy) {
    for (const auto &dir : config_.directories) {
      dirs.push_back(resolve_dir(dir));
    }
    return common::Result<std::vector<std::filesystem::path>>::success(std::move(dirs));
  }

  if (dev_mode_) {
    const auto &staging = config_.staging_dirs.empty() ? config_.directories : config_.staging_dirs;
    for (const auto &dir : staging) {
      dirs.push_back(resolve_dir(dir));
    }
  }

  auto project_dir = project_approved_dir(config_.approved_dir, workspace_root_);
  if (!project_dir.ok()) {
    return common::Result<std::vector<std::filesystem::path>>::failure(
        "resolving approved directory: " + project_dir.error(), project_dir.kind());
  }
  dirs.push_back(project_dir.value());

  if (config_.common) {
    if (auto common_dir = common_approved_dir(config_.approved_dir); common_dir.ok()) {
      dirs.push_back(common_dir.value());
    }
  }
  return common::Result<std::vector<std::filesystem::path>>::success(std::move(dirs));
}

common::Result<std::vector<ToolInfo>> HostToolRegistry::list_tools() const {
  if (auto status = check_enabled("list"); !status.ok()) {
    return common::Result<std::vector<ToolInfo>>::failure(status.error(), status.kind());
  }
  auto dirs = tool_dirs();
  if (!dirs.ok()) {
    return common::Result<std::vector<ToolInfo>>::failure(dirs.error(), dirs.kind());
  }

  std::vector<ToolInfo> tools;
  std::set<std::string> seen;
  for (const auto &dir : dirs.value()) {
    auto listed = list_tools_in_dir(dir, config_.allowed_extensions);
    if (!listed.ok()) {
      continue;
    }
    for (auto &tool : listed.value()) {
      if (seen.insert(tool.name).second) {
        tools.push_back(std::move(tool));
      }
    }
  }
  return common::Result<std::vector<ToolInfo>>::success(std::move(tools));
}

common::Result<ToolInfo> HostToolRegistry::get_tool_info(const std::string &name) const {
  if (auto status = check_enabled("info " + name); !status.ok()) {
    return common::Result<ToolInfo>::failure(status.error(), status.kind());
  }
  if (auto status = validate_tool_name(name); !status.ok()) {
    return common::Result<ToolInfo>::failure(status.error(), status.kind());
  }
  auto dirs = tool_dirs();
  if (!dirs.ok()) {
    return common::Result<ToolInfo>::failure(dirs.error(), dirs.kind());
  }
  for (const auto &dir : dirs.value()) {
    auto info = tools::get_tool_info(dir, name, config_.allowed_extensions);
    if (info.ok()) {
      return info;
    }
  }
  return common::Result<ToolInfo>::failure("tool not found: " + name, common::ErrorKind::NotFound);
}

common::Result<host::HostExecResult>
HostToolRegistry::run_tool(const std::string &name, const std::vector<std::string> &args) const {
  if (auto status = check_enabled("run " + name); !status.ok()) {
    return common::Result<host::HostExecResult>::failure(status.error(), status.kind());
  }
  if (auto status = validate_tool_name(name); !status.ok()) {
    return common::Result<host::HostExecResult>::failure(status.error(), status.kind());
  }
  auto dirs = tool_dirs();
  if (!dirs.ok()) {
    return common::Result<host::HostExecResult>::failure(dirs.error(), dirs.kind());
  }

  for (const auto &dir : dirs.value()) {
    if (!tools::get_tool_info(dir, name, config_.allowed_extensions).ok()) {
      continue;
    }
    auto argv = tool_command(dir / name, args);
    if (!argv.ok()) {
      return common::Result<host::HostExecResult>::failure(argv.error(), argv.kind());
    }

    const auto started = std::chrono::steady_clock::now();
    auto run = processes_.run(
        argv.value(),
        common::ProcessOptions{.working_dir = workspace_root_,
                               .timeout = std::chrono::seconds(config_.timeout_seconds)});
    observability::record_operation(
        kComponent, "run", name,
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                              started),
        run.ok());
    if (!run.ok()) {
      return common::Result<host::HostExecResult>::failure(run.error(), run.kind());
    }

    host::HostExecResult result;
    result.exit_code = run.value().exit_code;
    result.truncated = run.value().truncated;
    result.output_limit = run.value().output_limit;
    result.stdout_text = policy_.mask_host_paths(
        policy_.mask_output(run.value().stdout_text, security::MaskTarget::Exec));
    result.stderr_text = policy_.mask_host_paths(
        policy_.mask_output(run.value().stderr_text, security::MaskTarget::Exec));
    return common::Result<host::HostExecResult>::success(std::move(result));
  }
  return common::Result<host::HostExecResult>::failure("tool not found: " + name,
                                                       common::ErrorKind::NotFound);
}

} // namespace hostgate::tools
