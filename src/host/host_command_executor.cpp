#include "hostgate/host/host_command_executor.hpp"

#include "hostgate/observability/global.hpp"

namespace hostgate::host {

namespace {
constexpr const char *kComponent = "host_command";
} // namespace

std::string HostExecResult::to_string() const {
  std::string out = stdout_text;
  if (!stderr_text.empty()) {
    if (!out.empty()) {
      out += "\n";
    }
    out += "[stderr]\n" + stderr_text;
  }
  if (truncated) {
    if (!out.empty() && out.back() != '\n') {
      out += "\n";
    }
    out += common::truncation_marker(output_limit);
  }
  if (exit_code != 0) {
    out += "\n[exit code: " + std::to_string(exit_code) + "]";
  }
  return out;
}

HostCommandExecutor::HostCommandExecutor(const security::HostCommandPolicy &rules,
                                         const security::SecurityPolicy &policy,
                                         common::IProcessRunner &processes,
                                         std::filesystem::path workspace_root)
    : rules_(rules), policy_(policy), processes_(processes),
      workspace_root_(std::move(workspace_root)) {}

common::Result<HostExecResult> HostCommandExecutor::execute(const std::string &command,
                                                            const bool dangerously) const {
  auto authorized = rules_.authorize(command, dangerously);
  if (!authorized.ok()) {
    observability::record_access_denied(kComponent, command, authorized.error());
    return common::Result<HostExecResult>::failure(authorized.error(), authorized.kind());
  }

  const auto started = std::chrono::steady_clock::now();
  auto run = processes_.run(
      authorized.value().argv,
      common::ProcessOptions{
          .working_dir = workspace_root_,
          .timeout = std::chrono::duration_cast<std::chrono::milliseconds>(rules_.timeout())});
  observability::record_operation(
      kComponent, dangerously ? "exec (dangerous)" : "exec", authorized.value().base,
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                            started),
      run.ok());
  if (!run.ok()) {
    return common::Result<HostExecResult>::failure(run.error(), run.kind());
  }

  HostExecResult result;
  result.exit_code = run.value().exit_code;
  result.truncated = run.value().truncated;
  result.output_limit = run.value().output_limit;
  result.stdout_text =
      policy_.mask_host_paths(policy_.mask_output(run.value().stdout_text, security::MaskTarget::Exec));
  result.stderr_text =
      policy_.mask_host_paths(policy_.mask_output(run.value().stderr_text, security::MaskTarget::Exec));
  return common::Result<HostExecResult>::success(std::move(result));
}

} // namespace hostgate::host
