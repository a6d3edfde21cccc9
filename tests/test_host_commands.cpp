#include "test_framework.hpp"

#include "hostgate/host/host_command_executor.hpp"
#include "hostgate/security/host_policy.hpp"
#include "tests/helpers/test_helpers.hpp"

namespace {

using hostgate::common::ErrorKind;
using hostgate::security::HostCommandPolicy;

hostgate::config::HostCommandsConfig enabled_commands() {
  hostgate::config::HostCommandsConfig config;
  config.enabled = true;
  config.whitelist["git"] = {"status", "diff *"};
  config.whitelist["echo"] = {"*"};
  config.whitelist["cat"] = {"*"};
  config.whitelist["docker"] = {"logs *", "ps"};
  return config;
}

hostgate::security::SecurityPolicy make_security() {
  auto config = hostgate::testing::mock_config().security;
  config.blocked_paths.manual["host"] = {"/etc/shadow", "private/*"};
  auto policy = hostgate::security::SecurityPolicy::from_config(config);
  if (!policy.ok()) {
    throw std::runtime_error("policy build failed: " + policy.error());
  }
  return policy.value();
}

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

void register_host_commands_tests(std::vector<hostgate::tests::TestCase> &tests) {
  using hostgate::tests::require;

  tests.push_back({"host_commands_disabled_by_default", [] {
                     const HostCommandPolicy policy(hostgate::config::HostCommandsConfig{});
                     const auto status = policy.can_exec("git status");
                     require(!status.ok(), "disabled");
                     require(status.error() == "host commands are disabled", status.error());
                     require(status.kind() == ErrorKind::PermissionDenied, "kind");
                   }});

  tests.push_back({"host_commands_reject_shell_metacharacters", [] {
                     const HostCommandPolicy policy(enabled_commands());
                     for (const std::string command :
                          {"echo hi | cat", "echo hi; rm -rf /", "echo `whoami`", "echo $(id)",
                           "echo a && b", "echo a || b", "echo hi > /tmp/x", "cat < /etc/hosts"}) {
                       const auto status = policy.can_exec(command);
                       require(!status.ok(), "rejected: " + command);
                       require(contains(status.error(), "shell meta-characters"), status.error());
                     }
                   }});

  tests.push_back({"host_whitelist_exact_and_prefix", [] {
                     const HostCommandPolicy policy(enabled_commands());
                     require(policy.can_exec("git status").ok(), "exact");
                     const auto extra = policy.can_exec("git status --short");
                     require(!extra.ok(), "extra argument");
                     require(contains(extra.error(), "not whitelisted"), extra.error());
                     require(policy.can_exec("git diff HEAD~1").ok(), "prefix");
                     require(!policy.can_exec("git push").ok(), "unlisted subcommand");
                     require(!policy.can_exec("rm -rf build").ok(), "unlisted base");
                   }});

  tests.push_back({"host_deny_wins_over_whitelist", [] {
                     auto config = enabled_commands();
                     config.whitelist["echo"] = {"dangerous test"};
                     config.deny["echo"] = {"dangerous *"};
                     const HostCommandPolicy policy(config);
                     const auto status = policy.can_exec("echo dangerous test");
                     require(!status.ok(), "denied");
                     require(status.error() == "command denied: echo dangerous test",
                             status.error());
                   }});

  tests.push_back({"host_authorize_tokenizes_quoted_arguments", [] {
                     auto config = enabled_commands();
                     config.whitelist["git"] = {"commit -m *"};
                     const HostCommandPolicy policy(config);
                     const auto command = policy.authorize(R"(git commit -m "two words")", false);
                     require(command.ok(), command.error());
                     require(command.value().argv.size() == 4, "quoted argument kept whole");
                     require(command.value().base == "git", "base");
                     require(command.value().arguments == "commit -m two words", "arguments");
                     require(!command.value().dangerous, "not dangerous");

                     const auto broken = policy.authorize("git commit -m \"open", false);
                     require(!broken.ok() && broken.kind() == ErrorKind::ParseError, "parse error");
                     require(contains(broken.error(), "failed to parse command"), broken.error());
                     const auto empty = policy.authorize("   ", false);
                     require(!empty.ok() && empty.kind() == ErrorKind::InvalidArgument, "empty");
                   }});

  tests.push_back({"host_rejects_path_traversal", [] {
                     const HostCommandPolicy policy(enabled_commands());
                     const auto status = policy.can_exec("cat ../../etc/passwd");
                     require(!status.ok(), "traversal");
                     require(status.error() == "path traversal detected: cat ../../etc/passwd",
                             status.error());
                   }});

  tests.push_back({"host_dangerous_mode_rules", [] {
                     auto config = enabled_commands();
                     config.dangerously.enabled = true;
                     config.dangerously.commands["*"] = {"ls"};
                     config.dangerously.commands["git"] = {"push", "fetch"};
                     config.dangerously.commands["make"] = {"*"};
                     const HostCommandPolicy policy(config);

                     const auto hinted = policy.can_exec("git push origin main");
                     require(!hinted.ok(), "not whitelisted");
                     require(contains(hinted.error(), "hint: this command is available with "
                                                      "dangerously=true"),
                             hinted.error());

                     const auto push = policy.authorize("git push origin main", true);
                     require(push.ok(), push.error());
                     require(push.value().dangerous, "marked dangerous");
                     require(policy.can_exec_dangerously("ls -la /tmp").ok(), "any-args base");
                     require(policy.can_exec_dangerously("make clean all").ok(), "wildcard");

                     const auto reset = policy.can_exec_dangerously("git reset --hard");
                     require(!reset.ok(), "subcommand not listed");
                     require(contains(reset.error(), "command not allowed in dangerous mode"),
                             reset.error());

                     const auto whitelisted = policy.authorize("git status", true);
                     require(whitelisted.ok() && !whitelisted.value().dangerous,
                             "whitelisted stays normal");
                     require(!policy.can_exec_dangerously("ls | sh").ok(), "meta still rejected");
                     require(!policy.can_exec_dangerously("ls ../x").ok(),
                             "traversal still rejected");
                   }});

  tests.push_back({"host_dangerous_mode_requires_enablement", [] {
                     auto config = enabled_commands();
                     config.dangerously.commands["*"] = {"ls"};
                     const HostCommandPolicy policy(config);
                     const auto status = policy.can_exec_dangerously("ls");
                     require(status.error() == "dangerous mode is not enabled for host commands",
                             status.error());
                     require(!contains(policy.can_exec("ls").error(), "hint"), "no hint");
                   }});

  tests.push_back({"host_docker_commands_respect_container_list", [] {
                     auto config = enabled_commands();
                     config.allowed_containers = {"web-*"};
                     const HostCommandPolicy policy(config);
                     require(policy.can_exec("docker logs -f web-1").ok(), "allowed");
                     require(policy.can_exec("docker ps").ok(), "no operand");
                     const auto status = policy.can_exec("docker logs db");
                     require(!status.ok(), "db not allowed");
                     require(contains(status.error(), "container not in allowed list: db"),
                             status.error());
                   }});

  tests.push_back({"host_commands_check_blocked_paths", [] {
                     const auto security = make_security();
                     const HostCommandPolicy policy(enabled_commands(), &security);
                     const auto shadow = policy.can_exec("cat /etc/shadow");
                     require(!shadow.ok(), "manual host block");
                     require(contains(shadow.error(), "access to /etc/shadow is blocked"),
                             shadow.error());
                     require(!policy.can_exec("cat ./private/notes.txt").ok(), "directory block");
                     require(!policy.can_exec("cat config/.env").ok(), "global pattern");
                     require(policy.can_exec("cat README.md").ok(), "plain file");

                     const HostCommandPolicy unchecked(enabled_commands());
                     require(unchecked.can_exec("cat /etc/shadow").ok(), "no index attached");
                   }});

  tests.push_back({"host_executor_runs_in_workspace_with_timeout", [] {
                     auto config = enabled_commands();
                     config.timeout_seconds = 12;
                     const auto security = make_security();
                     const HostCommandPolicy rules(config, &security);
                     hostgate::testing::FakeProcessRunner processes;
                     processes.push_output("on branch main in /home/alice/repo\n", 0,
                                           "token=abcdef\n");
                     const hostgate::host::HostCommandExecutor executor(rules, security, processes,
                                                                        "/work/space");

                     const auto result = executor.execute("git status");
                     require(result.ok(), result.error());
                     require(processes.calls().front() ==
                                 std::vector<std::string>({"git", "status"}),
                             "argv passed directly");
                     require(processes.options().front().working_dir == "/work/space",
                             "workspace root");
                     require(processes.options().front().timeout == std::chrono::seconds(12),
                             "timeout");
                     require(!contains(result.value().stdout_text, "alice"), "host path masked");
                     require(!contains(result.value().stderr_text, "abcdef"), "secret masked");
                   }});

  tests.push_back({"host_executor_refuses_before_spawning", [] {
                     const auto security = make_security();
                     const HostCommandPolicy rules(enabled_commands(), &security);
                     hostgate::testing::FakeProcessRunner processes;
                     hostgate::testing::ObserverCapture capture;
                     const hostgate::host::HostCommandExecutor executor(rules, security, processes,
                                                                        "/work");
                     const auto result = executor.execute("git push");
                     require(!result.ok() && result.kind() == ErrorKind::PermissionDenied,
                             "denied");
                     require(processes.calls().empty(), "nothing spawned");
                     require(capture.events_of<hostgate::observability::AccessDeniedEvent>().size() ==
                                 1,
                             "denial recorded");

                     processes.push_result(
                         hostgate::common::Result<hostgate::common::ProcessResult>::failure(
                             "process timed out", ErrorKind::Timeout));
                     const auto timeout = executor.execute("git status");
                     require(!timeout.ok() && timeout.kind() == ErrorKind::Timeout, "timeout");
                   }});

  tests.push_back({"host_executor_carries_truncation", [] {
                     const auto security = make_security();
                     const HostCommandPolicy rules(enabled_commands(), &security);
                     hostgate::testing::FakeProcessRunner processes;
                     processes.push_result(
                         hostgate::common::Result<hostgate::common::ProcessResult>::success(
                             hostgate::common::ProcessResult{.exit_code = 0,
                                                             .stdout_text = "api_key: abc",
                                                             .stderr_text = "",
                                                             .truncated = true,
                                                             .output_limit = 12}));
                     const hostgate::host::HostCommandExecutor executor(rules, security, processes,
                                                                        "/work");
                     const auto result = executor.execute("git status");
                     require(result.ok(), result.error());
                     require(result.value().truncated, "flag carried");
                     require(result.value().output_limit == 12, "limit carried");
                     require(result.value().to_string() ==
                                 "[MASKED]\n[output truncated at 12 bytes]",
                             result.value().to_string());
                   }});

  tests.push_back({"host_exec_result_formatting", [] {
                     const hostgate::host::HostExecResult ok{.stdout_text = "out"};
                     require(ok.to_string() == "out", "stdout only");
                     const hostgate::host::HostExecResult failed{
                         .stdout_text = "out", .stderr_text = "err", .exit_code = 2};
                     require(failed.to_string() == "out\n[stderr]\nerr\n[exit code: 2]",
                             failed.to_string());
                     const hostgate::host::HostExecResult quiet{.stderr_text = "err"};
                     require(quiet.to_string() == "[stderr]\nerr", quiet.to_string());
                     const hostgate::host::HostExecResult cut{.stdout_text = "partial",
                                                              .exit_code = 1,
                                                              .truncated = true,
                                                              .output_limit = 7};
                     require(cut.to_string() ==
                                 "partial\n[output truncated at 7 bytes]\n[exit code: 1]",
                             cut.to_string());
                   }});
}
