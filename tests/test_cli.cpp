#include "test_framework.hpp"

#include "hostgate/cli/commands.hpp"
#include "hostgate/common/fs.hpp"
#include "hostgate/config/config.hpp"
#include "hostgate/observability/composite.hpp"
#include "hostgate/observability/global.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <iostream>
#include <sstream>

namespace {

struct CliResult {
  int code = 0;
  std::string out;
  std::string err;
};

// Runs the CLI with stdout and stderr captured. The config override and the
// global observer are reset afterwards so later tests start clean.
CliResult run_cli(const std::vector<std::string> &args) {
  std::vector<std::string> owned = {"hostgate"};
  owned.insert(owned.end(), args.begin(), args.end());
  std::vector<char *> argv;
  argv.reserve(owned.size());
  for (auto &arg : owned) {
    argv.push_back(arg.data());
  }

  std::ostringstream out;
  std::ostringstream err;
  auto *old_out = std::cout.rdbuf(out.rdbuf());
  auto *old_err = std::cerr.rdbuf(err.rdbuf());
  CliResult result;
  try {
    result.code = hostgate::cli::run_cli(static_cast<int>(argv.size()), argv.data());
  } catch (const std::exception &) {
    std::cout.rdbuf(old_out);
    std::cerr.rdbuf(old_err);
    hostgate::config::clear_config_path_override();
    throw;
  }
  std::cout.rdbuf(old_out);
  std::cerr.rdbuf(old_err);
  hostgate::config::clear_config_path_override();
  hostgate::observability::set_global_observer(
      std::make_unique<hostgate::observability::NoopObserver>());
  result.out = out.str();
  result.err = err.str();
  return result;
}

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

std::string write_config(const hostgate::testing::TempWorkspace &workspace,
                         const std::string &body) {
  workspace.create_file("config.toml", "[observability]\nbackend = \"none\"\n\n" + body);
  return (workspace.path() / "config.toml").string();
}

} // namespace

void register_cli_tests(std::vector<hostgate::tests::TestCase> &tests) {
  using hostgate::tests::require;

  tests.push_back({"cli_version_and_help", [] {
                     const auto version = run_cli({"version"});
                     require(version.code == 0, "version succeeds");
                     require(hostgate::common::starts_with(version.out, "hostgate "), version.out);

                     const auto help = run_cli({"--help"});
                     require(help.code == 0, "help succeeds");
                     require(contains(help.out, "Usage: hostgate"), help.out);
                     require(run_cli({}).code == 0, "no command prints help");
                   }});

  tests.push_back({"cli_unknown_command_fails", [] {
                     const auto result = run_cli({"frobnicate"});
                     require(result.code == 1, "exit code");
                     require(contains(result.err, "Unknown command: frobnicate"), result.err);
                   }});

  tests.push_back({"cli_config_flag_sets_path", [] {
                     hostgate::testing::TempWorkspace workspace;
                     const auto path = (workspace.path() / "custom.toml").string();
                     const auto result = run_cli({"--config", path, "config-path"});
                     require(result.code == 0, result.err);
                     require(result.out == path + "\n", result.out);

                     const auto inline_form = run_cli({"--config=" + path, "config-path"});
                     require(inline_form.out == path + "\n", inline_form.out);

                     const auto missing = run_cli({"config-path", "--config"});
                     require(missing.code == 1, "missing value");
                     require(contains(missing.err, "missing value for --config"), missing.err);
                   }});

  tests.push_back({"cli_config_validate_reports_warnings", [] {
                     hostgate::testing::TempWorkspace workspace;
                     const auto path = write_config(workspace, "[security]\nmode = \"permissive\"\n");
                     const auto result = run_cli({"--config", path, "config", "validate"});
                     require(result.code == 0, result.err);
                     require(contains(result.out, "warning: security.mode is permissive"),
                             result.out);
                     require(contains(result.out, "configuration is valid"), result.out);

                     const auto bad = write_config(workspace, "[security]\nmode = \"lenient\"\n");
                     const auto invalid = run_cli({"--config", bad, "config", "validate"});
                     require(invalid.code == 1, "invalid mode");
                     require(contains(invalid.err, "error (invalid_argument)"), invalid.err);
                   }});

  tests.push_back({"cli_policy_show_prints_summary", [] {
                     hostgate::testing::TempWorkspace workspace;
                     const auto path = write_config(workspace,
                                                    "[security]\nmode = \"strict\"\n"
                                                    "allowed_containers = [\"web-*\"]\n\n"
                                                    "[security.exec_whitelist]\n"
                                                    "\"*\" = [\"ls\"]\n");
                     const auto shown = run_cli({"--config", path, "policy", "show"});
                     require(shown.code == 0, shown.err);
                     require(contains(shown.out, "\"mode\":\"strict\""), shown.out);

                     const auto scoped =
                         run_cli({"--config", path, "policy", "--container", "db"});
                     require(scoped.code == 0, scoped.err);
                     require(contains(scoped.out, "access: denied"), scoped.out);
                     require(contains(scoped.out, "  ls\n"), scoped.out);
                   }});

  tests.push_back({"cli_blocked_check_uses_index", [] {
                     hostgate::testing::TempWorkspace workspace;
                     const auto path = write_config(workspace,
                                                    "[security.blocked_paths.manual]\n"
                                                    "\"web\" = [\"/srv/private/*\"]\n");
                     const auto env = run_cli({"--config", path, "blocked", "--check", "/app/.env"});
                     require(env.code == 1, "blocked exit code");
                     require(contains(env.out, "blocked: path matches blocked pattern '.env'"),
                             env.out);

                     const auto open = run_cli({"--config", path, "blocked", "--check", "/app/main.c"});
                     require(open.code == 0 && open.out == "allowed\n", open.out);

                     const auto scoped = run_cli({"--config", path, "blocked", "list", "--container",
                                                  "web", "--check", "/srv/private/key.txt"});
                     require(scoped.code == 1, "scoped entry applies");

                     const auto listed = run_cli({"--config", path, "blocked", "list"});
                     require(listed.code == 0, listed.err);
                     require(contains(listed.out, "web\t/srv/private/*\tmanual_block\tmanual"),
                             listed.out);
                   }});

  tests.push_back({"cli_host_exec_runs_whitelisted_command", [] {
                     hostgate::testing::TempWorkspace workspace;
                     const auto path = write_config(
                         workspace, "[host_access]\nworkspace_root = \"" +
                                        workspace.path().string() +
                                        "\"\n\n[host_access.host_commands]\nenabled = true\n\n"
                                        "[host_access.host_commands.whitelist]\n"
                                        "echo = [\"hello *\"]\n");
                     const auto ran = run_cli({"--config", path, "host", "exec", "echo", "hello",
                                               "world"});
                     require(ran.code == 0, ran.err);
                     require(ran.out == "hello world\n\n", ran.out);

                     const auto denied =
                         run_cli({"--config", path, "host", "exec", "rm", "-rf", "build"});
                     require(denied.code == 1, "denied exit code");
                     require(contains(denied.err, "error (permission_denied): command not "
                                                  "whitelisted: rm -rf build"),
                             denied.err);
                   }});

  tests.push_back({"cli_tools_status_lists_pending_tools", [] {
                     hostgate::testing::TempWorkspace workspace;
                     workspace.create_file(".sandbox/host-tools/foo.sh", "#!/bin/bash\n# Foo\n");
                     const auto path = write_config(
                         workspace, "[host_access]\nworkspace_root = \"" +
                                        workspace.path().string() +
                                        "\"\n\n[host_access.host_tools]\nenabled = true\n"
                                        "approved_dir = \"" +
                                        (workspace.path() / "approved").string() + "\"\n");
                     const auto status = run_cli({"--config", path, "tools", "status"});
                     require(status.code == 0, status.err);
                     require(contains(status.out, "project: "), status.out);
                     require(contains(status.out, "  new\tfoo.sh"), status.out);
                   }});

  tests.push_back({"cli_usage_errors", [] {
                     require(run_cli({"logs"}).code == 1, "logs needs container");
                     require(run_cli({"exec", "web"}).code == 1, "exec needs command");
                     require(run_cli({"cat", "web"}).code == 1, "cat needs path");
                     require(run_cli({"host", "run"}).code == 1, "host needs exec");
                     require(run_cli({"tools"}).code == 1, "tools needs action");
                   }});
}
