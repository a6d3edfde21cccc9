#pragma once

#include "hostgate/common/result.hpp"
#include "hostgate/config/schema.hpp"
#include "hostgate/security/blocked_paths.hpp"
#include "hostgate/security/output_masking.hpp"

#include <optional>
#include <string>
#include <vector>

namespace hostgate::security {

enum class SecurityMode { Strict, Moderate, Permissive };

[[nodiscard]] common::Result<SecurityMode> parse_security_mode(const std::string &value);
[[nodiscard]] const char *security_mode_name(SecurityMode mode);

/// Authorization rules for container access. Built once from configuration
/// and never mutated afterwards, so a single instance can be shared across
/// threads without locking. Every refusal is a PermissionDenied status whose
/// message names the rule that refused.
class SecurityPolicy {
public:
  /// Builds the policy, running blocked-path auto-import when enabled.
  /// `known_containers` lets imported mount targets be scoped per container.
  [[nodiscard]] static common::Result<SecurityPolicy>
  from_config(const config::SecurityConfig &config,
              const std::vector<std::string> &known_containers = {});

  /// True when no allow-list is configured or `name` matches one of its globs.
  [[nodiscard]] bool can_access_container(const std::string &name) const;

  [[nodiscard]] common::Status can_get_logs(const std::string &container) const;
  [[nodiscard]] common::Status can_inspect(const std::string &container) const;
  [[nodiscard]] common::Status can_get_stats(const std::string &container) const;
  [[nodiscard]] common::Status can_lifecycle(const std::string &container) const;

  /// Whitelisted exec. In moderate mode the command must equal a whitelist
  /// entry for the container or for "*" (trailing-`*` entries match by prefix).
  [[nodiscard]] common::Status can_exec(const std::string &container,
                                        const std::string &command) const;

  /// Dangerous-mode exec, authorized by base command only. Arguments are
  /// constrained by the metacharacter, traversal and blocked-path checks.
  [[nodiscard]] common::Status can_exec_dangerously(const std::string &container,
                                                    const std::string &command) const;

  [[nodiscard]] std::optional<BlockedPath> is_path_blocked(const std::string &container,
                                                           const std::string &path) const;

  [[nodiscard]] std::string mask_output(const std::string &text, MaskTarget target) const;
  [[nodiscard]] std::string mask_host_paths(const std::string &text) const;

  [[nodiscard]] std::vector<std::string> allowed_commands(const std::string &container) const;
  [[nodiscard]] std::vector<std::string> dangerous_commands(const std::string &container) const;

  [[nodiscard]] SecurityMode mode() const { return mode_; }
  [[nodiscard]] bool dangerous_mode_enabled() const { return dangerously_.enabled; }
  [[nodiscard]] const std::vector<std::string> &allowed_containers() const {
    return allowed_containers_;
  }
  [[nodiscard]] const BlockedPathIndex &blocked_paths() const { return blocked_paths_; }
  [[nodiscard]] const OutputMasker &masker() const { return masker_; }

  /// Machine-readable summary of the effective policy.
  [[nodiscard]] std::string describe_json() const;

private:
  SecurityPolicy() = default;

  [[nodiscard]] common::Status check_container(const std::string &container) const;
  [[nodiscard]] bool is_dangerous_command_available(const std::string &container,
                                                    const std::string &command) const;

  SecurityMode mode_ = SecurityMode::Moderate;
  std::vector<std::string> allowed_containers_;
  config::PatternTable exec_whitelist_;
  config::ExecDangerouslyConfig dangerously_;
  config::PermissionsConfig permissions_;
  BlockedPathIndex blocked_paths_;
  OutputMasker masker_;
};

} // namespace hostgate::security
