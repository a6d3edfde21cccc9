#pragma once

#include "hostgate/common/result.hpp"
#include "hostgate/config/schema.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace hostgate::security {

class SecurityPolicy;

/// Authorized host command: the tokenized argv plus the pieces the rules were
/// matched against.
struct HostCommand {
  std::vector<std::string> argv;
  std::string base;
  std::string arguments;
  bool dangerous = false;
};

/// Whitelist/deny rules for commands run directly on the host.
///
/// Rules are keyed by base command; each entry is an argument pattern (exact,
/// or a literal prefix followed by `*`). Deny entries always win. In dangerous
/// mode, `dangerously.commands[base]` lists the permitted first arguments
/// ("*" permits any) and `dangerously.commands["*"]` lists base commands
/// allowed with any arguments.
class HostCommandPolicy {
public:
  explicit HostCommandPolicy(config::HostCommandsConfig config,
                             const SecurityPolicy *security = nullptr);

  [[nodiscard]] common::Result<HostCommand> authorize(const std::string &command,
                                                      bool dangerously) const;

  [[nodiscard]] common::Status can_exec(const std::string &command) const;
  [[nodiscard]] common::Status can_exec_dangerously(const std::string &command) const;

  [[nodiscard]] bool enabled() const { return config_.enabled; }
  [[nodiscard]] const config::PatternTable &whitelist() const { return config_.whitelist; }
  [[nodiscard]] const config::PatternTable &dangerous_commands() const {
    return config_.dangerously.commands;
  }
  [[nodiscard]] std::chrono::seconds timeout() const {
    return std::chrono::seconds(config_.timeout_seconds);
  }

private:
  [[nodiscard]] bool matches_table(const config::PatternTable &table, const std::string &base,
                                   const std::string &arguments) const;
  [[nodiscard]] bool matches_dangerous(const HostCommand &command) const;
  [[nodiscard]] common::Status check_containers(const HostCommand &command) const;
  [[nodiscard]] common::Status check_paths(const HostCommand &command) const;

  config::HostCommandsConfig config_;
  const SecurityPolicy *security_ = nullptr;
};

} // namespace hostgate::security
