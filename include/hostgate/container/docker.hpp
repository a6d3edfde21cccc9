#pragma once

#include "hostgate/common/process.hpp"
#include "hostgate/common/result.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace hostgate::container {

struct DockerCommandOptions {
  bool allow_failure = false;
  std::chrono::milliseconds timeout{30'000};
};

struct DockerProcessResult {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
  bool truncated = false;
  std::size_t output_limit = 0;
};

class IDockerRunner {
public:
  virtual ~IDockerRunner() = default;

  [[nodiscard]] virtual common::Result<DockerProcessResult>
  run(const std::vector<std::string> &args, const DockerCommandOptions &options = {}) = 0;
};

/// Drives the docker CLI. Failures are classified from stderr: a missing
/// container is NotFound, an unreachable daemon or any other non-zero exit is
/// ExecutionFailure, and an expired deadline is Timeout.
class DockerCliRunner final : public IDockerRunner {
public:
  explicit DockerCliRunner(std::string binary = "docker",
                           std::shared_ptr<common::IProcessRunner> processes = nullptr);

  [[nodiscard]] common::Result<DockerProcessResult>
  run(const std::vector<std::string> &args, const DockerCommandOptions &options = {}) override;

private:
  std::string binary_;
  std::shared_ptr<common::IProcessRunner> processes_;
};

/// Maps docker CLI stderr onto the error taxonomy.
[[nodiscard]] common::ErrorKind classify_docker_error(const std::string &stderr_text);

} // namespace hostgate::container
