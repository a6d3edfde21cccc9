#include "hostgate/security/policy.hpp"

#include "hostgate/common/fs.hpp"
#include "hostgate/common/json_util.hpp"
#include "hostgate/security/command_syntax.hpp"
#include "hostgate/security/pattern.hpp"

#include <algorithm>
#include <sstream>

namespace hostgate::security {

namespace {

using common::ErrorKind;
using common::Status;

Status denied(std::string message) {
  return Status::error(std::move(message), ErrorKind::PermissionDenied);
}

std::vector<std::string> merged_entries(const config::PatternTable &table,
                                        const std::string &container) {
  std::vector<std::string> out;
  if (const auto it = table.find(container); it != table.end()) {
    out.insert(out.end(), it->second.begin(), it->second.end());
  }
  if (container != kAnyContainer) {
    if (const auto it = table.find(kAnyContainer); it != table.end()) {
      out.insert(out.end(), it->second.begin(), it->second.end());
    }
  }
  return out;
}

std::string json_string_array(const std::vector<std::string> &values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += "\"" + common::json_escape(values[i]) + "\"";
  }
  out += "]";
  return out;
}

std::string json_table(const config::PatternTable &table) {
  std::string out = "{";
  bool first = true;
  for (const auto &[key, values] : table) {
    if (!first) {
      out += ",";
    }
    first = false;
    out += "\"" + common::json_escape(key) + "\":" + json_string_array(values);
  }
  out += "}";
  return out;
}

} // namespace

common::Result<SecurityMode> parse_security_mode(const std::string &value) {
  const std::string lowered = common::to_lower(common::trim(value));
  if (lowered == "strict") {
    return common::Result<SecurityMode>::success(SecurityMode::Strict);
  }
  if (lowered == "moderate" || lowered.empty()) {
    return common::Result<SecurityMode>::success(SecurityMode::Moderate);
  }
  if (lowered == "permissive") {
    return common::Result<SecurityMode>::success(SecurityMode::Permissive);
  }
  return common::Result<SecurityMode>::failure("invalid security mode: " + value,
                                               ErrorKind::InvalidArgument);
}

const char *security_mode_name(const SecurityMode mode) {
  switch (mode) {
  case SecurityMode::Strict:
    return "strict";
  case SecurityMode::Moderate:
    return "moderate";
  case SecurityMode::Permissive:
    return "permissive";
  }
  return "moderate";
}

common::Result<SecurityPolicy>
SecurityPolicy::from_config(const config::SecurityConfig &config,
                            const std::vector<std::string> &known_containers) {
  auto mode = parse_security_mode(config.mode);
  if (!mode.ok()) {
    return common::Result<SecurityPolicy>::failure(mode.error(), mode.kind());
  }

  SecurityPolicy policy;
  policy.mode_ = mode.value();
  policy.allowed_containers_ = config.allowed_containers;
  policy.exec_whitelist_ = config.exec_whitelist;
  policy.dangerously_ = config.exec_dangerously;
  policy.permissions_ = config.permissions;
  policy.blocked_paths_ = build_blocked_path_index(config.blocked_paths, known_containers);
  policy.masker_ = OutputMasker::from_config(config.output_masking, config.host_path_masking);
  return common::Result<SecurityPolicy>::success(std::move(policy));
}

bool SecurityPolicy::can_access_container(const std::string &name) const {
  if (allowed_containers_.empty()) {
    return true;
  }
  return matches_any_glob(allowed_containers_, name);
}

Status SecurityPolicy::check_container(const std::string &container) const {
  if (!can_access_container(container)) {
    return denied("container not in allowed list: " + container);
  }
  return Status::success();
}

Status SecurityPolicy::can_get_logs(const std::string &container) const {
  if (!permissions_.logs) {
    return denied("log access is disabled in security policy");
  }
  return check_container(container);
}

Status SecurityPolicy::can_inspect(const std::string &container) const {
  if (!permissions_.inspect) {
    return denied("inspect is disabled in security policy");
  }
  return check_container(container);
}

Status SecurityPolicy::can_get_stats(const std::string &container) const {
  if (!permissions_.stats) {
    return denied("stats are disabled in security policy");
  }
  return check_container(container);
}

Status SecurityPolicy::can_lifecycle(const std::string &container) const {
  if (!permissions_.lifecycle) {
    return denied("lifecycle operations are disabled in security policy");
  }
  if (auto status = check_container(container); !status.ok()) {
    return status;
  }
  if (mode_ == SecurityMode::Strict) {
    return denied("lifecycle operations are not allowed in strict mode");
  }
  return Status::success();
}

Status SecurityPolicy::can_exec(const std::string &container, const std::string &command) const {
  if (!permissions_.exec) {
    return denied("exec is disabled in security policy");
  }
  if (auto status = check_container(container); !status.ok()) {
    return status;
  }
  if (mode_ == SecurityMode::Strict) {
    return denied("exec is not allowed in strict mode");
  }
  if (mode_ == SecurityMode::Permissive) {
    return Status::success();
  }

  if (find_command_pattern(merged_entries(exec_whitelist_, container), command).has_value()) {
    return Status::success();
  }
  if (is_dangerous_command_available(container, command)) {
    return denied("command not whitelisted: " + command +
                  " (hint: this command is available with dangerously=true)");
  }
  return denied("command not whitelisted: " + command);
}

bool SecurityPolicy::is_dangerous_command_available(const std::string &container,
                                                    const std::string &command) const {
  if (!dangerously_.enabled) {
    return false;
  }
  const auto fields = common::split_whitespace(command);
  if (fields.empty()) {
    return false;
  }
  const auto allowed = merged_entries(dangerously_.commands, container);
  return std::find(allowed.begin(), allowed.end(), fields.front()) != allowed.end();
}

Status SecurityPolicy::can_exec_dangerously(const std::string &container,
                                            const std::string &command) const {
  if (!dangerously_.enabled) {
    return denied("dangerous mode is not enabled in security policy");
  }
  if (!permissions_.exec) {
    return denied("exec is disabled in security policy");
  }
  if (auto status = check_container(container); !status.ok()) {
    return status;
  }
  if (mode_ == SecurityMode::Strict) {
    return denied("exec is not allowed in strict mode");
  }
  if (const auto meta = find_shell_metacharacter(command); meta.has_value()) {
    return denied("shell meta-characters are not allowed in dangerous mode: '" + *meta + "'");
  }

  const auto fields = common::split_whitespace(command);
  if (fields.empty()) {
    return Status::error("empty command", ErrorKind::InvalidArgument);
  }
  if (has_path_traversal(fields)) {
    return denied("path traversal ('..') is not allowed in dangerous mode");
  }

  const auto allowed = merged_entries(dangerously_.commands, container);
  if (std::find(allowed.begin(), allowed.end(), fields.front()) == allowed.end()) {
    return denied("command not allowed in dangerous mode: " + fields.front());
  }

  for (const auto &path : extract_path_arguments(fields)) {
    if (const auto blocked = is_path_blocked(container, path); blocked.has_value()) {
      return denied("access to " + path + " is blocked: " + blocked->describe());
    }
  }
  return Status::success();
}

std::optional<BlockedPath> SecurityPolicy::is_path_blocked(const std::string &container,
                                                           const std::string &path) const {
  return blocked_paths_.find(container, path);
}

std::string SecurityPolicy::mask_output(const std::string &text, const MaskTarget target) const {
  return masker_.mask(text, target);
}

std::string SecurityPolicy::mask_host_paths(const std::string &text) const {
  return masker_.mask_host_paths(text);
}

std::vector<std::string> SecurityPolicy::allowed_commands(const std::string &container) const {
  return merged_entries(exec_whitelist_, container);
}

std::vector<std::string> SecurityPolicy::dangerous_commands(const std::string &container) const {
  if (!dangerously_.enabled) {
    return {};
  }
  return merged_entries(dangerously_.commands, container);
}

std::string SecurityPolicy::describe_json() const {
  std::ostringstream out;
  out << "{\"mode\":\"" << security_mode_name(mode_) << "\"";
  out << ",\"allowed_containers\":" << json_string_array(allowed_containers_);
  out << ",\"permissions\":{\"logs\":" << (permissions_.logs ? "true" : "false")
      << ",\"inspect\":" << (permissions_.inspect ? "true" : "false")
      << ",\"stats\":" << (permissions_.stats ? "true" : "false")
      << ",\"exec\":" << (permissions_.exec ? "true" : "false")
      << ",\"lifecycle\":" << (permissions_.lifecycle ? "true" : "false") << "}";
  out << ",\"exec_whitelist\":" << json_table(exec_whitelist_);
  out << ",\"exec_dangerously\":{\"enabled\":" << (dangerously_.enabled ? "true" : "false")
      << ",\"commands\":" << json_table(dangerously_.commands) << "}";
  out << ",\"blocked_paths\":" << blocked_paths_.size();
  out << ",\"masking_rules\":" << masker_.rules().size();
  out << ",\"host_path_masking\":" << (masker_.host_path_masking_enabled() ? "true" : "false");
  out << "}";
  return out.str();
}

} // namespace hostgate::security
