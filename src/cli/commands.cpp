#include "hostgate/cli/commands.hpp"

#include "hostgate/common/fs.hpp"
#include "hostgate/common/process.hpp"
#include "hostgate/config/config.hpp"
#include "hostgate/container/docker.hpp"
#include "hostgate/container/gateway.hpp"
#include "hostgate/host/host_command_executor.hpp"
#include "hostgate/observability/factory.hpp"
#include "hostgate/observability/global.hpp"
#include "hostgate/security/host_policy.hpp"
#include "hostgate/security/policy.hpp"
#include "hostgate/tools/approval_pipeline.hpp"
#include "hostgate/tools/project.hpp"
#include "hostgate/tools/tool_registry.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace hostgate::cli {

namespace {

std::string version_string() {
#ifdef HOSTGATE_VERSION
  std::string version = HOSTGATE_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "hostgate " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

bool parse_int(const std::string &text, int &out) {
  try {
    std::size_t consumed = 0;
    out = std::stoi(text, &consumed);
    return consumed == text.size();
  } catch (const std::exception &) {
    return false;
  }
}

int report_error(const std::string &message, const common::ErrorKind kind) {
  std::cerr << "error (" << common::error_kind_name(kind) << "): " << message << "\n";
  return 1;
}

/// Everything a command needs, assembled from the loaded configuration.
struct Runtime {
  config::Config config;
  std::filesystem::path workspace_root;
  std::shared_ptr<common::IProcessRunner> processes;
  std::unique_ptr<container::DockerCliRunner> docker;
  std::optional<security::SecurityPolicy> policy;
};

common::Result<config::Config> load_checked_config() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return cfg;
  }
  observability::set_global_observer(observability::create_observer(cfg.value()));
  auto validated = config::validate_config(cfg.value());
  if (!validated.ok()) {
    return common::Result<config::Config>::failure(validated.error(), validated.kind());
  }
  for (const auto &warning : validated.value()) {
    observability::record_warning("config", warning);
  }
  return cfg;
}

common::Result<std::unique_ptr<Runtime>> build_runtime() {
  auto cfg = load_checked_config();
  if (!cfg.ok()) {
    return common::Result<std::unique_ptr<Runtime>>::failure(cfg.error(), cfg.kind());
  }

  auto runtime = std::make_unique<Runtime>();
  runtime->config = std::move(cfg.value());
  const std::string &root = runtime->config.host_access.workspace_root;
  runtime->workspace_root = common::absolute_clean(
      root.empty() ? std::filesystem::current_path() : std::filesystem::path(root));
  runtime->processes = std::make_shared<common::PosixProcessRunner>();
  runtime->docker = std::make_unique<container::DockerCliRunner>(runtime->config.docker.binary,
                                                                 runtime->processes);

  // Imported mount targets are scoped by container name, so ask docker which
  // containers exist. An unreachable daemon only costs the scoping.
  std::vector<std::string> known_containers;
  if (runtime->config.security.blocked_paths.auto_import.enabled) {
    auto names = runtime->docker->run({"ps", "-a", "--format", "{{.Names}}"},
                                      container::DockerCommandOptions{});
    if (names.ok()) {
      std::istringstream lines(names.value().stdout_text);
      std::string line;
      while (std::getline(lines, line)) {
        if (!common::trim(line).empty()) {
          known_containers.push_back(common::trim(line));
        }
      }
    } else {
      observability::record_warning("blocked_paths",
                                    "cannot list containers for import: " + names.error());
    }
  }

  auto policy = security::SecurityPolicy::from_config(runtime->config.security, known_containers);
  if (!policy.ok()) {
    return common::Result<std::unique_ptr<Runtime>>::failure(policy.error(), policy.kind());
  }
  runtime->policy.emplace(std::move(policy.value()));
  return common::Result<std::unique_ptr<Runtime>>::success(std::move(runtime));
}

container::ContainerGateway make_gateway(Runtime &runtime) {
  return container::ContainerGateway(
      *runtime.policy, *runtime.docker,
      container::GatewayOptions{
          .timeout = std::chrono::seconds(runtime.config.docker.timeout_seconds),
          .default_log_tail = runtime.config.docker.default_log_tail});
}

int run_config(std::vector<std::string> args) {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return report_error(cfg.error(), cfg.kind());
  }

  if (args.empty() || args[0] == "show") {
    std::cout << config::render_config(cfg.value());
    return 0;
  }
  if (args[0] == "validate") {
    auto validated = config::validate_config(cfg.value());
    if (!validated.ok()) {
      return report_error(validated.error(), validated.kind());
    }
    for (const auto &warning : validated.value()) {
      std::cout << "warning: " << warning << "\n";
    }
    std::cout << "configuration is valid\n";
    return 0;
  }

  std::cerr << "Unknown config subcommand: " << args[0] << "\n";
  return 1;
}

int run_policy(std::vector<std::string> args) {
  auto runtime = build_runtime();
  if (!runtime.ok()) {
    return report_error(runtime.error(), runtime.kind());
  }
  const auto &policy = *runtime.value()->policy;

  std::string container;
  if (take_option(args, "--container", "-c", container)) {
    std::cout << "access: " << (policy.can_access_container(container) ? "allowed" : "denied")
              << "\n";
    std::cout << "whitelisted commands:\n";
    for (const auto &command : policy.allowed_commands(container)) {
      std::cout << "  " << command << "\n";
    }
    if (policy.dangerous_mode_enabled()) {
      std::cout << "dangerous commands:\n";
      for (const auto &command : policy.dangerous_commands(container)) {
        std::cout << "  " << command << "\n";
      }
    }
    return 0;
  }
  std::cout << policy.describe_json() << "\n";
  return 0;
}

int run_blocked(std::vector<std::string> args) {
  auto runtime = build_runtime();
  if (!runtime.ok()) {
    return report_error(runtime.error(), runtime.kind());
  }
  const auto &index = runtime.value()->policy->blocked_paths();

  std::string container;
  std::string path;
  const bool scoped = take_option(args, "--container", "-c", container);
  if (take_option(args, "--check", "", path)) {
    const auto blocked = runtime.value()->policy->is_path_blocked(
        scoped ? container : security::kAnyContainer, path);
    if (blocked.has_value()) {
      std::cout << "blocked: " << blocked->describe() << "\n";
      return 1;
    }
    std::cout << "allowed\n";
    return 0;
  }

  const auto entries = scoped ? index.entries_for(container) : index.entries();
  if (entries.empty()) {
    std::cout << "no blocked paths\n";
    return 0;
  }
  for (const auto &entry : entries) {
    std::cout << entry.scope << "\t" << entry.pattern << "\t" << entry.reason << "\t"
              << security::block_source_name(entry.origin);
    if (!entry.source.empty()) {
      std::cout << "\t" << entry.source;
    }
    std::cout << "\n";
  }
  return 0;
}

int run_ps() {
  auto runtime = build_runtime();
  if (!runtime.ok()) {
    return report_error(runtime.error(), runtime.kind());
  }
  auto gateway = make_gateway(*runtime.value());
  auto containers = gateway.list_containers();
  if (!containers.ok()) {
    return report_error(containers.error(), containers.kind());
  }
  for (const auto &info : containers.value()) {
    std::cout << info.name << "\t" << info.state << "\t" << info.image << "\t" << info.status
              << "\n";
  }
  return 0;
}

int run_logs(std::vector<std::string> args) {
  std::string tail_text;
  std::string since;
  const bool has_tail = take_option(args, "--tail", "-n", tail_text);
  (void)take_option(args, "--since", "", since);
  if (args.empty()) {
    std::cerr << "usage: hostgate logs <container> [--tail N] [--since DURATION]\n";
    return 1;
  }

  auto runtime = build_runtime();
  if (!runtime.ok()) {
    return report_error(runtime.error(), runtime.kind());
  }
  container::LogOptions options{.tail = runtime.value()->config.docker.default_log_tail,
                                .since = since};
  if (has_tail && !parse_int(tail_text, options.tail)) {
    std::cerr << "invalid --tail value: " << tail_text << "\n";
    return 1;
  }

  auto gateway = make_gateway(*runtime.value());
  auto logs = gateway.get_logs(args[0], options);
  if (!logs.ok()) {
    return report_error(logs.error(), logs.kind());
  }
  std::cout << logs.value();
  return 0;
}

int run_inspect_or_stats(const std::string &subcommand, std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "usage: hostgate " << subcommand << " <container>\n";
    return 1;
  }
  auto runtime = build_runtime();
  if (!runtime.ok()) {
    return report_error(runtime.error(), runtime.kind());
  }
  auto gateway = make_gateway(*runtime.value());
  auto result = subcommand == "stats" ? gateway.get_stats(args[0]) : gateway.inspect(args[0]);
  if (!result.ok()) {
    return report_error(result.error(), result.kind());
  }
  std::cout << result.value() << "\n";
  return 0;
}

int run_exec(std::vector<std::string> args) {
  const bool dangerously = take_flag(args, "--dangerously");
  if (args.size() < 2) {
    std::cerr << "usage: hostgate exec [--dangerously] <container> <command...>\n";
    return 1;
  }
  auto runtime = build_runtime();
  if (!runtime.ok()) {
    return report_error(runtime.error(), runtime.kind());
  }
  auto gateway = make_gateway(*runtime.value());
  auto result = gateway.exec(args[0], join_tokens(args, 1), dangerously);
  if (!result.ok()) {
    return report_error(result.error(), result.kind());
  }
  std::cout << result.value().output;
  if (result.value().exit_code != 0) {
    std::cout << "\n[exit code: " << result.value().exit_code << "]\n";
  }
  return result.value().exit_code == 0 ? 0 : 1;
}

int run_file_access(const std::string &subcommand, std::vector<std::string> args) {
  std::string lines_text;
  int max_lines = 0;
  if (take_option(args, "--lines", "-n", lines_text) && !parse_int(lines_text, max_lines)) {
    std::cerr << "invalid --lines value: " << lines_text << "\n";
    return 1;
  }
  if (args.size() < 2) {
    std::cerr << "usage: hostgate " << subcommand << " <container> <path>"
              << (subcommand == "cat" ? " [--lines N]" : "") << "\n";
    return 1;
  }
  auto runtime = build_runtime();
  if (!runtime.ok()) {
    return report_error(runtime.error(), runtime.kind());
  }
  auto gateway = make_gateway(*runtime.value());
  auto result = subcommand == "ls" ? gateway.list_files(args[0], args[1])
                                   : gateway.read_file(args[0], args[1], max_lines);
  if (!result.ok()) {
    return report_error(result.error(), result.kind());
  }
  if (result.value().blocked) {
    std::cerr << result.value().error << "\n";
    return 1;
  }
  if (!result.value().success) {
    std::cerr << result.value().error << "\n";
    return 1;
  }
  std::cout << result.value().data;
  return 0;
}

int run_lifecycle(const container::LifecycleAction action, std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "usage: hostgate " << container::lifecycle_action_name(action)
              << " <container>\n";
    return 1;
  }
  auto runtime = build_runtime();
  if (!runtime.ok()) {
    return report_error(runtime.error(), runtime.kind());
  }
  auto gateway = make_gateway(*runtime.value());
  auto status = gateway.lifecycle(args[0], action);
  if (!status.ok()) {
    return report_error(status.error(), status.kind());
  }
  std::cout << container::lifecycle_action_name(action) << " " << args[0] << ": ok\n";
  return 0;
}

int run_host(std::vector<std::string> args) {
  if (args.empty() || args[0] != "exec") {
    std::cerr << "usage: hostgate host exec [--dangerously] <command...>\n";
    return 1;
  }
  args.erase(args.begin());
  const bool dangerously = take_flag(args, "--dangerously");
  if (args.empty()) {
    std::cerr << "usage: hostgate host exec [--dangerously] <command...>\n";
    return 1;
  }

  auto runtime = build_runtime();
  if (!runtime.ok()) {
    return report_error(runtime.error(), runtime.kind());
  }
  auto &rt = *runtime.value();
  const security::HostCommandPolicy rules(rt.config.host_access.host_commands, &*rt.policy);
  const host::HostCommandExecutor executor(rules, *rt.policy, *rt.processes, rt.workspace_root);
  auto result = executor.execute(join_tokens(args), dangerously);
  if (!result.ok()) {
    return report_error(result.error(), result.kind());
  }
  std::cout << result.value().to_string() << "\n";
  return result.value().exit_code == 0 ? 0 : 1;
}

void print_tool(const tools::ToolInfo &tool, const bool detailed) {
  std::cout << tool.name;
  if (!tool.description.empty()) {
    std::cout << " - " << tool.description;
  }
  std::cout << "\n";
  if (!detailed) {
    return;
  }
  if (!tool.usage.empty()) {
    std::cout << "Usage:\n";
    std::istringstream lines(tool.usage);
    std::string line;
    while (std::getline(lines, line)) {
      std::cout << "  " << line << "\n";
    }
  }
  if (!tool.examples.empty()) {
    std::cout << "Examples:\n";
    for (const auto &example : tool.examples) {
      std::cout << "  " << example << "\n";
    }
  }
}

int run_tools(std::vector<std::string> args) {
  const bool dev = take_flag(args, "--dev");
  if (args.empty()) {
    std::cerr << "usage: hostgate tools <list|info|run|sync|status> [--dev]\n";
    return 1;
  }
  const std::string action = args[0];
  args.erase(args.begin());

  auto runtime = build_runtime();
  if (!runtime.ok()) {
    return report_error(runtime.error(), runtime.kind());
  }
  auto &rt = *runtime.value();
  const auto &tools_config = rt.config.host_access.host_tools;

  if (action == "sync" || action == "status") {
    if (tools_config.approved_dir.empty()) {
      std::cerr << "host_access.host_tools.approved_dir is not configured\n";
      return 1;
    }
    const tools::ApprovalPipeline pipeline(tools_config, rt.workspace_root);
    if (action == "status") {
      auto approved = pipeline.approved_dir();
      if (approved.ok()) {
        std::cout << "project: " << tools::project_id(rt.workspace_root) << "\n";
        std::cout << "approved: " << approved.value().string() << "\n";
      }
      auto items = pipeline.detect_changes();
      if (!items.ok()) {
        return report_error(items.error(), items.kind());
      }
      for (const auto &item : items.value()) {
        std::cout << "  " << tools::sync_status_name(item.status) << "\t" << item.name << "\n";
      }
      return 0;
    }

    tools::StreamSyncPrompt prompt(std::cin, std::cout);
    auto report = pipeline.run_interactive_sync(prompt);
    if (!report.ok()) {
      return report_error(report.error(), report.kind());
    }
    if (report.value().up_to_date()) {
      std::cout << "All tools are up to date. No sync needed.\n";
      return 0;
    }
    std::cout << "synced " << report.value().copied << ", skipped " << report.value().skipped
              << ", failed " << report.value().failures.size() << "\n";
    return report.value().failures.empty() ? 0 : 1;
  }

  tools::HostToolRegistry registry(tools_config, rt.workspace_root, *rt.policy, *rt.processes);
  registry.set_dev_mode(dev);

  if (action == "list") {
    auto listed = registry.list_tools();
    if (!listed.ok()) {
      return report_error(listed.error(), listed.kind());
    }
    std::cout << "mode: " << tools::registry_mode_name(registry.mode())
              << (registry.dev_mode() ? " (dev)" : "") << "\n";
    for (const auto &tool : listed.value()) {
      print_tool(tool, false);
    }
    return 0;
  }
  if (action == "info") {
    if (args.empty()) {
      std::cerr << "usage: hostgate tools info <name>\n";
      return 1;
    }
    auto info = registry.get_tool_info(args[0]);
    if (!info.ok()) {
      return report_error(info.error(), info.kind());
    }
    print_tool(info.value(), true);
    return 0;
  }
  if (action == "run") {
    if (args.empty()) {
      std::cerr << "usage: hostgate tools run <name> [args...]\n";
      return 1;
    }
    const std::string name = args[0];
    args.erase(args.begin());
    auto result = registry.run_tool(name, args);
    if (!result.ok()) {
      return report_error(result.error(), result.kind());
    }
    std::cout << result.value().to_string() << "\n";
    return result.value().exit_code == 0 ? 0 : 1;
  }

  std::cerr << "Unknown tools subcommand: " << action << "\n";
  return 1;
}

} // namespace

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "Usage: hostgate [--config PATH] <command> [options]\n\n";
  std::cout << "Containers:\n";
  std::cout << "  ps                                  List accessible containers\n";
  std::cout << "  logs <container> [--tail N]         Show container logs\n";
  std::cout << "  inspect <container>                 Show container details\n";
  std::cout << "  stats <container>                   Show resource usage\n";
  std::cout << "  exec [--dangerously] <c> <cmd...>   Run a whitelisted command\n";
  std::cout << "  ls <container> <path>               List files (blocked paths refused)\n";
  std::cout << "  cat <container> <path> [--lines N]  Read a file (blocked paths refused)\n";
  std::cout << "  start|stop|restart <container>      Lifecycle operations\n\n";
  std::cout << "Host:\n";
  std::cout << "  host exec [--dangerously] <cmd...>  Run a whitelisted host command\n";
  std::cout << "  tools list|info|run [--dev]         Host tools\n";
  std::cout << "  tools status|sync                   Review and approve staged tools\n\n";
  std::cout << "Policy:\n";
  std::cout << "  policy show [--container NAME]      Effective security policy\n";
  std::cout << "  blocked list [--container NAME]     Blocked path entries\n";
  std::cout << "  blocked list --check PATH           Test a path against the index\n";
  std::cout << "  config show|validate                Configuration\n";
  std::cout << "  config-path                         Print the config file location\n";
  std::cout << "  version                             Show version\n";
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }
  if (subcommand == "policy") {
    if (!args.empty() && args[0] == "show") {
      args.erase(args.begin());
    }
    return run_policy(std::move(args));
  }
  if (subcommand == "blocked") {
    if (!args.empty() && args[0] == "list") {
      args.erase(args.begin());
    }
    return run_blocked(std::move(args));
  }
  if (subcommand == "ps") {
    return run_ps();
  }
  if (subcommand == "logs") {
    return run_logs(std::move(args));
  }
  if (subcommand == "inspect" || subcommand == "stats") {
    return run_inspect_or_stats(subcommand, std::move(args));
  }
  if (subcommand == "exec") {
    return run_exec(std::move(args));
  }
  if (subcommand == "ls" || subcommand == "cat") {
    return run_file_access(subcommand, std::move(args));
  }
  if (subcommand == "start") {
    return run_lifecycle(container::LifecycleAction::Start, std::move(args));
  }
  if (subcommand == "stop") {
    return run_lifecycle(container::LifecycleAction::Stop, std::move(args));
  }
  if (subcommand == "restart") {
    return run_lifecycle(container::LifecycleAction::Restart, std::move(args));
  }
  if (subcommand == "host") {
    return run_host(std::move(args));
  }
  if (subcommand == "tools") {
    return run_tools(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace hostgate::cli
