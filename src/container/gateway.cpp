#include "hostgate/container/gateway.hpp"

#include "hostgate/common/fs.hpp"
#include "hostgate/common/json_util.hpp"
#include "hostgate/observability/global.hpp"

#include <sstream>

namespace hostgate::container {

namespace {

constexpr const char *kComponent = "container";

using common::ErrorKind;
using common::Result;
using common::Status;
using Clock = std::chrono::steady_clock;

std::chrono::milliseconds elapsed_since(const Clock::time_point started) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
}

// With allow_failure the runner hands back docker's own failures as exit codes;
// these two mean the command never reached the container.
std::optional<Status> docker_level_failure(const DockerProcessResult &result) {
  if (result.exit_code == 0) {
    return std::nullopt;
  }
  if (classify_docker_error(result.stderr_text) == ErrorKind::NotFound) {
    return Status::error(common::trim(result.stderr_text), ErrorKind::NotFound);
  }
  if (result.stderr_text.find("Cannot connect to the Docker daemon") != std::string::npos) {
    return Status::error(common::trim(result.stderr_text), ErrorKind::ExecutionFailure);
  }
  return std::nullopt;
}

std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> lines;
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    line = common::trim(line);
    if (!line.empty()) {
      lines.push_back(line);
    }
  }
  return lines;
}

std::string combined_output(const DockerProcessResult &result) {
  if (result.stderr_text.empty()) {
    return result.stdout_text;
  }
  if (result.stdout_text.empty()) {
    return result.stderr_text;
  }
  std::string out = result.stdout_text;
  if (out.back() != '\n') {
    out.push_back('\n');
  }
  return out + result.stderr_text;
}

template <typename T>
Result<T> denied(const std::string &operation, const std::string &container, const Status &status) {
  observability::record_access_denied(kComponent, operation + " " + container, status.error());
  return Result<T>::failure(status.error(), status.kind());
}

// Names reach docker as a positional argument; a leading dash would be
// parsed as an option instead.
Status check_container_operand(const std::string &container) {
  if (container.empty() || container.front() == '-') {
    return Status::error("invalid container name: " + container, ErrorKind::InvalidArgument);
  }
  return Status::success();
}

} // namespace

const char *lifecycle_action_name(const LifecycleAction action) {
  switch (action) {
  case LifecycleAction::Start:
    return "start";
  case LifecycleAction::Stop:
    return "stop";
  case LifecycleAction::Restart:
    return "restart";
  }
  return "start";
}

ContainerGateway::ContainerGateway(const security::SecurityPolicy &policy, IDockerRunner &docker,
                                   GatewayOptions options)
    : policy_(policy), docker_(docker), options_(options) {}

Result<DockerProcessResult> ContainerGateway::run_docker(const std::vector<std::string> &args,
                                                         const bool allow_failure) const {
  return docker_.run(args, DockerCommandOptions{.allow_failure = allow_failure,
                                                .timeout = options_.timeout});
}

std::string ContainerGateway::mask(const std::string &text,
                                   const security::MaskTarget target) const {
  return policy_.mask_host_paths(policy_.mask_output(text, target));
}

std::string ContainerGateway::mask(const std::string &text, const security::MaskTarget target,
                                   const DockerProcessResult &source) const {
  std::string out = mask(text, target);
  if (source.truncated) {
    if (!out.empty() && out.back() != '\n') {
      out.push_back('\n');
    }
    out += common::truncation_marker(source.output_limit);
  }
  return out;
}

Result<std::vector<std::string>> ContainerGateway::container_names() const {
  auto ps = run_docker({"ps", "-a", "--format", "{{.Names}}"}, false);
  if (!ps.ok()) {
    return Result<std::vector<std::string>>::failure(ps.error(), ps.kind());
  }
  return Result<std::vector<std::string>>::success(split_lines(ps.value().stdout_text));
}

Result<std::vector<ContainerInfo>> ContainerGateway::list_containers() const {
  const auto started = Clock::now();
  auto ps = run_docker({"ps", "-a", "--format", "{{json .}}"}, false);
  if (!ps.ok()) {
    observability::record_operation(kComponent, "list", "", elapsed_since(started), false);
    return Result<std::vector<ContainerInfo>>::failure(ps.error(), ps.kind());
  }

  std::vector<ContainerInfo> containers;
  for (const auto &line : split_lines(ps.value().stdout_text)) {
    const auto fields = common::json_parse_flat(line);
    const auto field = [&fields](const char *key) {
      const auto it = fields.find(key);
      return it == fields.end() ? std::string() : it->second;
    };
    ContainerInfo info{.id = field("ID"),
                       .name = field("Names"),
                       .image = field("Image"),
                       .state = field("State"),
                       .status = field("Status"),
                       .ports = field("Ports")};
    // Compose containers can carry several comma-separated names.
    if (const auto comma = info.name.find(','); comma != std::string::npos) {
      info.name = info.name.substr(0, comma);
    }
    if (info.name.empty() || !policy_.can_access_container(info.name)) {
      continue;
    }
    containers.push_back(std::move(info));
  }
  observability::record_operation(kComponent, "list", "", elapsed_since(started), true);
  return Result<std::vector<ContainerInfo>>::success(std::move(containers));
}

Result<std::string> ContainerGateway::get_logs(const std::string &container) const {
  return get_logs(container, LogOptions{.tail = options_.default_log_tail});
}

Result<std::string> ContainerGateway::get_logs(const std::string &container,
                                               const LogOptions &options) const {
  if (auto status = check_container_operand(container); !status.ok()) {
    return denied<std::string>("logs", container, status);
  }
  if (auto status = policy_.can_get_logs(container); !status.ok()) {
    return denied<std::string>("logs", container, status);
  }

  std::vector<std::string> args = {"logs"};
  if (options.tail > 0) {
    args.push_back("--tail");
    args.push_back(std::to_string(options.tail));
  }
  if (!options.since.empty()) {
    args.push_back("--since");
    args.push_back(options.since);
  }
  args.push_back(container);

  const auto started = Clock::now();
  auto logs = run_docker(args, false);
  observability::record_operation(kComponent, "logs", container, elapsed_since(started),
                                  logs.ok());
  if (!logs.ok()) {
    return Result<std::string>::failure(logs.error(), logs.kind());
  }
  // Containers write to both streams; docker replays them separately.
  return Result<std::string>::success(
      mask(combined_output(logs.value()), security::MaskTarget::Logs, logs.value()));
}

Result<std::string> ContainerGateway::get_stats(const std::string &container) const {
  if (auto status = check_container_operand(container); !status.ok()) {
    return denied<std::string>("stats", container, status);
  }
  if (auto status = policy_.can_get_stats(container); !status.ok()) {
    return denied<std::string>("stats", container, status);
  }
  const auto started = Clock::now();
  auto stats = run_docker({"stats", "--no-stream", "--format", "{{json .}}", container}, false);
  observability::record_operation(kComponent, "stats", container, elapsed_since(started),
                                  stats.ok());
  if (!stats.ok()) {
    return Result<std::string>::failure(stats.error(), stats.kind());
  }
  return Result<std::string>::success(
      mask(common::trim(stats.value().stdout_text), security::MaskTarget::Inspect,
           stats.value()));
}

Result<std::string> ContainerGateway::inspect(const std::string &container) const {
  if (auto status = check_container_operand(container); !status.ok()) {
    return denied<std::string>("inspect", container, status);
  }
  if (auto status = policy_.can_inspect(container); !status.ok()) {
    return denied<std::string>("inspect", container, status);
  }
  const auto started = Clock::now();
  auto inspected = run_docker({"inspect", "--type", "container", container}, false);
  observability::record_operation(kComponent, "inspect", container, elapsed_since(started),
                                  inspected.ok());
  if (!inspected.ok()) {
    return Result<std::string>::failure(inspected.error(), inspected.kind());
  }
  return Result<std::string>::success(
      mask(inspected.value().stdout_text, security::MaskTarget::Inspect, inspected.value()));
}

Result<ExecResult> ContainerGateway::exec(const std::string &container, const std::string &command,
                                          const bool dangerously) const {
  if (auto operand = check_container_operand(container); !operand.ok()) {
    return denied<ExecResult>(dangerously ? "exec (dangerous)" : "exec", container, operand);
  }
  const auto status = dangerously ? policy_.can_exec_dangerously(container, command)
                                  : policy_.can_exec(container, command);
  if (!status.ok()) {
    return denied<ExecResult>(dangerously ? "exec (dangerous)" : "exec", container, status);
  }

  // Whitelisted commands are plain token sequences; quoting is not interpreted.
  const auto tokens = common::split_whitespace(command);
  if (tokens.empty()) {
    return Result<ExecResult>::failure("empty command", ErrorKind::InvalidArgument);
  }
  std::vector<std::string> args = {"exec", container};
  args.insert(args.end(), tokens.begin(), tokens.end());

  const auto started = Clock::now();
  auto run = run_docker(args, true);
  if (run.ok()) {
    if (const auto failure = docker_level_failure(run.value()); failure.has_value()) {
      observability::record_operation(kComponent, "exec", container, elapsed_since(started), false);
      return Result<ExecResult>::failure(failure->error(), failure->kind());
    }
  }
  observability::record_operation(kComponent, "exec", container, elapsed_since(started), run.ok());
  if (!run.ok()) {
    return Result<ExecResult>::failure(run.error(), run.kind());
  }

  ExecResult result;
  result.exit_code = run.value().exit_code;
  result.output = mask(combined_output(run.value()), security::MaskTarget::Exec, run.value());
  result.dangerous = dangerously;
  result.truncated = run.value().truncated;
  return Result<ExecResult>::success(std::move(result));
}

Result<FileAccessResult> ContainerGateway::internal_read(const std::string &operation,
                                                         const std::string &container,
                                                         const std::string &path,
                                                         std::vector<std::string> command) const {
  if (auto operand = check_container_operand(container); !operand.ok()) {
    return denied<FileAccessResult>(operation, container, operand);
  }
  if (!policy_.can_access_container(container)) {
    return denied<FileAccessResult>(
        operation, container,
        Status::error("container not in allowed list: " + container, ErrorKind::PermissionDenied));
  }
  if (path.empty()) {
    return Result<FileAccessResult>::failure("path is required", ErrorKind::InvalidArgument);
  }

  if (auto block = policy_.is_path_blocked(container, path); block.has_value()) {
    observability::record_access_denied(kComponent, operation + " " + container + ":" + path,
                                        block->describe());
    FileAccessResult result;
    result.blocked = true;
    result.error = "access to " + path + " is blocked: " + block->describe();
    result.block = std::move(block);
    return Result<FileAccessResult>::success(std::move(result));
  }

  std::vector<std::string> args = {"exec", container};
  args.insert(args.end(), std::make_move_iterator(command.begin()),
              std::make_move_iterator(command.end()));

  const auto started = Clock::now();
  auto run = run_docker(args, true);
  if (run.ok()) {
    if (const auto failure = docker_level_failure(run.value()); failure.has_value()) {
      observability::record_operation(kComponent, operation, container, elapsed_since(started),
                                      false);
      return Result<FileAccessResult>::failure(failure->error(), failure->kind());
    }
  }
  observability::record_operation(kComponent, operation, container, elapsed_since(started),
                                  run.ok() && run.value().exit_code == 0);
  if (!run.ok()) {
    return Result<FileAccessResult>::failure(run.error(), run.kind());
  }

  FileAccessResult result;
  result.truncated = run.value().truncated;
  if (run.value().exit_code == 0) {
    result.success = true;
    result.data = mask(run.value().stdout_text, security::MaskTarget::Exec, run.value());
  } else {
    result.error = mask(common::trim(combined_output(run.value())), security::MaskTarget::Exec);
    if (result.error.empty()) {
      result.error = "exit code " + std::to_string(run.value().exit_code);
    }
  }
  return Result<FileAccessResult>::success(std::move(result));
}

Result<FileAccessResult> ContainerGateway::list_files(const std::string &container,
                                                      const std::string &path) const {
  return internal_read("list_files", container, path, {"ls", "-la", "--", path});
}

Result<FileAccessResult> ContainerGateway::read_file(const std::string &container,
                                                     const std::string &path,
                                                     const int max_lines) const {
  if (max_lines > 0) {
    return internal_read("read_file", container, path,
                         {"head", "-n", std::to_string(max_lines), "--", path});
  }
  return internal_read("read_file", container, path, {"cat", "--", path});
}

Status ContainerGateway::lifecycle(const std::string &container,
                                   const LifecycleAction action) const {
  const std::string operation = lifecycle_action_name(action);
  if (auto status = check_container_operand(container); !status.ok()) {
    observability::record_access_denied(kComponent, operation + " " + container, status.error());
    return status;
  }
  if (auto status = policy_.can_lifecycle(container); !status.ok()) {
    observability::record_access_denied(kComponent, operation + " " + container, status.error());
    return status;
  }
  const auto started = Clock::now();
  auto run = run_docker({operation, container}, false);
  observability::record_operation(kComponent, operation, container, elapsed_since(started),
                                  run.ok());
  if (!run.ok()) {
    return Status::error(run.error(), run.kind());
  }
  return Status::success();
}

} // namespace hostgate::container
