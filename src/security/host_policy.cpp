#include "hostgate/security/host_policy.hpp"

#include "hostgate/common/fs.hpp"
#include "hostgate/security/command_syntax.hpp"
#include "hostgate/security/pattern.hpp"
#include "hostgate/security/policy.hpp"

#include <algorithm>

namespace hostgate::security {

namespace {

using common::ErrorKind;
using common::Result;
using common::Status;

Status denied(std::string message) {
  return Status::error(std::move(message), ErrorKind::PermissionDenied);
}

bool is_docker_command(const std::string &base) {
  return base == "docker" || base == "docker-compose";
}

} // namespace

HostCommandPolicy::HostCommandPolicy(config::HostCommandsConfig config,
                                     const SecurityPolicy *security)
    : config_(std::move(config)), security_(security) {}

bool HostCommandPolicy::matches_table(const config::PatternTable &table, const std::string &base,
                                      const std::string &arguments) const {
  const auto it = table.find(base);
  if (it == table.end()) {
    return false;
  }
  return find_command_pattern(it->second, arguments).has_value();
}

bool HostCommandPolicy::matches_dangerous(const HostCommand &command) const {
  const auto &commands = config_.dangerously.commands;
  if (const auto any = commands.find("*"); any != commands.end()) {
    if (std::find(any->second.begin(), any->second.end(), command.base) != any->second.end()) {
      return true;
    }
  }
  const auto it = commands.find(command.base);
  if (it == commands.end()) {
    return false;
  }
  if (std::find(it->second.begin(), it->second.end(), "*") != it->second.end()) {
    return true;
  }
  if (command.argv.size() < 2) {
    return false;
  }
  return std::find(it->second.begin(), it->second.end(), command.argv[1]) != it->second.end();
}

Status HostCommandPolicy::check_containers(const HostCommand &command) const {
  if (!is_docker_command(command.base) || config_.allowed_containers.empty()) {
    return Status::success();
  }
  // argv[1] is the docker subcommand; every non-flag operand after it names a
  // container.
  for (std::size_t i = 2; i < command.argv.size(); ++i) {
    const auto &field = command.argv[i];
    if (common::starts_with(field, "-")) {
      continue;
    }
    if (!matches_any_glob(config_.allowed_containers, field)) {
      return denied("container not in allowed list: " + field + " (allowed: " +
                    common::join(config_.allowed_containers, ", ") + ")");
    }
  }
  return Status::success();
}

Status HostCommandPolicy::check_paths(const HostCommand &command) const {
  if (security_ == nullptr) {
    return Status::success();
  }
  for (const auto &path : extract_path_arguments(command.argv)) {
    if (const auto blocked = security_->is_path_blocked(config_.blocked_path_scope, path);
        blocked.has_value()) {
      return denied("access to " + path + " is blocked: " + blocked->describe());
    }
  }
  return Status::success();
}

Result<HostCommand> HostCommandPolicy::authorize(const std::string &command,
                                                 const bool dangerously) const {
  if (!config_.enabled) {
    return Result<HostCommand>::failure("host commands are disabled", ErrorKind::PermissionDenied);
  }
  if (dangerously && !config_.dangerously.enabled) {
    return Result<HostCommand>::failure("dangerous mode is not enabled for host commands",
                                        ErrorKind::PermissionDenied);
  }
  if (const auto meta = find_shell_metacharacter(command); meta.has_value()) {
    return Result<HostCommand>::failure("shell meta-characters are not allowed: '" + *meta +
                                            "' in " + command,
                                        ErrorKind::PermissionDenied);
  }

  auto tokens = tokenize_command(command);
  if (!tokens.ok()) {
    return Result<HostCommand>::failure("failed to parse command: " + tokens.error(),
                                        ErrorKind::ParseError);
  }
  if (tokens.value().empty()) {
    return Result<HostCommand>::failure("empty command", ErrorKind::InvalidArgument);
  }
  if (has_path_traversal(tokens.value())) {
    return Result<HostCommand>::failure("path traversal detected: " + command,
                                        ErrorKind::PermissionDenied);
  }

  HostCommand parsed;
  parsed.argv = tokens.value();
  parsed.base = parsed.argv.front();
  parsed.arguments = common::join(
      std::vector<std::string>(parsed.argv.begin() + 1, parsed.argv.end()), " ");

  if (matches_table(config_.deny, parsed.base, parsed.arguments)) {
    return Result<HostCommand>::failure("command denied: " + command, ErrorKind::PermissionDenied);
  }

  if (!matches_table(config_.whitelist, parsed.base, parsed.arguments)) {
    const bool dangerous_match = config_.dangerously.enabled && matches_dangerous(parsed);
    if (!dangerously) {
      if (dangerous_match) {
        return Result<HostCommand>::failure(
            "command not whitelisted: " + command +
                " (hint: this command is available with dangerously=true)",
            ErrorKind::PermissionDenied);
      }
      return Result<HostCommand>::failure("command not whitelisted: " + command,
                                          ErrorKind::PermissionDenied);
    }
    if (!dangerous_match) {
      return Result<HostCommand>::failure("command not allowed in dangerous mode: " + command,
                                          ErrorKind::PermissionDenied);
    }
    parsed.dangerous = true;
  }

  if (auto status = check_containers(parsed); !status.ok()) {
    return Result<HostCommand>::failure(status.error(), status.kind());
  }
  if (auto status = check_paths(parsed); !status.ok()) {
    return Result<HostCommand>::failure(status.error(), status.kind());
  }
  return Result<HostCommand>::success(std::move(parsed));
}

Status HostCommandPolicy::can_exec(const std::string &command) const {
  auto result = authorize(command, false);
  return result.ok() ? Status::success() : Status::error(result.error(), result.kind());
}

Status HostCommandPolicy::can_exec_dangerously(const std::string &command) const {
  auto result = authorize(command, true);
  return result.ok() ? Status::success() : Status::error(result.error(), result.kind());
}

} // namespace hostgate::security
