#pragma once

#include "hostgate/common/process.hpp"
#include "hostgate/common/result.hpp"
#include "hostgate/security/host_policy.hpp"
#include "hostgate/security/policy.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace hostgate::host {

/// Output of a host process. A non-zero exit code is a normal outcome.
struct HostExecResult {
  std::string stdout_text;
  std::string stderr_text;
  int exit_code = 0;
  bool truncated = false;
  std::size_t output_limit = 0;

  /// stdout, then stderr under a `[stderr]` marker, then the truncation
  /// marker when output was cut, then `[exit code: N]` when the process failed.
  [[nodiscard]] std::string to_string() const;
};

/// Runs authorized commands on the host from the workspace root. The argv is
/// executed directly, never through a shell.
class HostCommandExecutor {
public:
  HostCommandExecutor(const security::HostCommandPolicy &rules,
                      const security::SecurityPolicy &policy, common::IProcessRunner &processes,
                      std::filesystem::path workspace_root);

  [[nodiscard]] common::Result<HostExecResult> execute(const std::string &command,
                                                       bool dangerously = false) const;

private:
  const security::HostCommandPolicy &rules_;
  const security::SecurityPolicy &policy_;
  common::IProcessRunner &processes_;
  std::filesystem::path workspace_root_;
};

} // namespace hostgate::host
