#pragma once

#include "hostgate/common/result.hpp"
#include "hostgate/container/docker.hpp"
#include "hostgate/security/blocked_paths.hpp"
#include "hostgate/security/policy.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace hostgate::container {

struct ContainerInfo {
  std::string id;
  std::string name;
  std::string image;
  std::string state;
  std::string status;
  std::string ports;
};

struct LogOptions {
  int tail = 100;
  std::string since;
};

struct ExecResult {
  int exit_code = 0;
  std::string output;
  bool dangerous = false;
  bool truncated = false;
};

/// Outcome of an internal file read or listing. A blocked path is a normal
/// result carrying the matching rule, not an error.
struct FileAccessResult {
  bool success = false;
  std::string data;
  bool blocked = false;
  std::optional<security::BlockedPath> block;
  std::string error;
  bool truncated = false;
};

struct GatewayOptions {
  std::chrono::milliseconds timeout{30'000};
  int default_log_tail = 100;
};

enum class LifecycleAction { Start, Stop, Restart };

[[nodiscard]] const char *lifecycle_action_name(LifecycleAction action);

/// Policy-checked access to containers. Each operation consults the policy
/// before talking to docker and masks every textual result before returning.
class ContainerGateway {
public:
  ContainerGateway(const security::SecurityPolicy &policy, IDockerRunner &docker,
                   GatewayOptions options = {});

  /// Containers visible under the allow-list; others are filtered out.
  [[nodiscard]] common::Result<std::vector<ContainerInfo>> list_containers() const;
  /// Names of every container docker reports, unfiltered. Used to scope
  /// auto-imported blocked paths.
  [[nodiscard]] common::Result<std::vector<std::string>> container_names() const;

  [[nodiscard]] common::Result<std::string> get_logs(const std::string &container,
                                                     const LogOptions &options) const;
  [[nodiscard]] common::Result<std::string> get_logs(const std::string &container) const;
  [[nodiscard]] common::Result<std::string> get_stats(const std::string &container) const;
  [[nodiscard]] common::Result<std::string> inspect(const std::string &container) const;

  [[nodiscard]] common::Result<ExecResult> exec(const std::string &container,
                                                const std::string &command,
                                                bool dangerously = false) const;

  [[nodiscard]] common::Result<FileAccessResult> list_files(const std::string &container,
                                                            const std::string &path) const;
  [[nodiscard]] common::Result<FileAccessResult> read_file(const std::string &container,
                                                           const std::string &path,
                                                           int max_lines = 0) const;

  [[nodiscard]] common::Status lifecycle(const std::string &container,
                                         LifecycleAction action) const;

  [[nodiscard]] const security::SecurityPolicy &policy() const { return policy_; }

private:
  [[nodiscard]] common::Result<DockerProcessResult>
  run_docker(const std::vector<std::string> &args, bool allow_failure) const;
  [[nodiscard]] common::Result<FileAccessResult>
  internal_read(const std::string &operation, const std::string &container,
                const std::string &path, std::vector<std::string> command) const;
  [[nodiscard]] std::string mask(const std::string &text, security::MaskTarget target) const;
  /// Masks, then flags output the capture limit cut short.
  [[nodiscard]] std::string mask(const std::string &text, security::MaskTarget target,
                                 const DockerProcessResult &source) const;

  const security::SecurityPolicy &policy_;
  IDockerRunner &docker_;
  GatewayOptions options_;
};

} // namespace hostgate::container
