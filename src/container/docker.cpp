#include "hostgate/container/docker.hpp"

#include "hostgate/common/fs.hpp"

namespace hostgate::container {

common::ErrorKind classify_docker_error(const std::string &stderr_text) {
  if (stderr_text.find("No such container") != std::string::npos ||
      stderr_text.find("No such object") != std::string::npos) {
    return common::ErrorKind::NotFound;
  }
  return common::ErrorKind::ExecutionFailure;
}

DockerCliRunner::DockerCliRunner(std::string binary,
                                 std::shared_ptr<common::IProcessRunner> processes)
    : binary_(std::move(binary)), processes_(std::move(processes)) {
  if (binary_.empty()) {
    binary_ = "docker";
  }
  if (processes_ == nullptr) {
    processes_ = std::make_shared<common::PosixProcessRunner>();
  }
}

common::Result<DockerProcessResult> DockerCliRunner::run(const std::vector<std::string> &args,
                                                         const DockerCommandOptions &options) {
  if (args.empty()) {
    return common::Result<DockerProcessResult>::failure("docker command is empty",
                                                        common::ErrorKind::InvalidArgument);
  }

  std::vector<std::string> argv;
  argv.reserve(args.size() + 1);
  argv.push_back(binary_);
  argv.insert(argv.end(), args.begin(), args.end());

  auto process = processes_->run(argv, common::ProcessOptions{.timeout = options.timeout});
  if (!process.ok()) {
    if (process.kind() == common::ErrorKind::Timeout) {
      return common::Result<DockerProcessResult>::failure(
          "docker command timed out: " + common::join(args, " "), common::ErrorKind::Timeout);
    }
    return common::Result<DockerProcessResult>::failure(process.error(), process.kind());
  }

  DockerProcessResult result;
  result.exit_code = process.value().exit_code;
  result.stdout_text = std::move(process.value().stdout_text);
  result.stderr_text = std::move(process.value().stderr_text);
  result.truncated = process.value().truncated;
  result.output_limit = process.value().output_limit;

  if (result.exit_code != 0 && !options.allow_failure) {
    const std::string message = result.stderr_text.empty()
                                    ? "docker command failed: " + common::join(args, " ")
                                    : common::trim(result.stderr_text);
    return common::Result<DockerProcessResult>::failure(message,
                                                        classify_docker_error(result.stderr_text));
  }
  return common::Result<DockerProcessResult>::success(std::move(result));
}

} // namespace hostgate::container
