#include "test_framework.hpp"

#include "hostgate/container/docker.hpp"
#include "hostgate/container/gateway.hpp"
#include "tests/helpers/test_helpers.hpp"

namespace {

using hostgate::common::ErrorKind;
using hostgate::container::ContainerGateway;
using hostgate::security::SecurityPolicy;

hostgate::config::SecurityConfig gateway_security() {
  auto config = hostgate::testing::mock_config().security;
  config.allowed_containers = {"web-*", "db"};
  config.exec_whitelist["*"] = {"ls", "cat /etc/hostname"};
  config.exec_dangerously.enabled = true;
  config.exec_dangerously.commands["web-1"] = {"cat", "grep"};
  config.blocked_paths.manual["web-1"] = {"/app/config/secrets.yml"};
  return config;
}

SecurityPolicy make_policy(const hostgate::config::SecurityConfig &config) {
  auto policy = SecurityPolicy::from_config(config);
  if (!policy.ok()) {
    throw std::runtime_error("policy build failed: " + policy.error());
  }
  return policy.value();
}

using Args = std::vector<std::string>;

} // namespace

void register_container_tests(std::vector<hostgate::tests::TestCase> &tests) {
  using hostgate::tests::require;
  namespace ctr = hostgate::container;
  namespace obs = hostgate::observability;

  tests.push_back({"list_containers_filters_by_allow_list", [] {
                     const auto policy = make_policy(gateway_security());
                     hostgate::testing::FakeDockerRunner docker;
                     docker.push_output(
                         R"({"ID":"a1","Names":"web-1","Image":"nginx","State":"running","Status":"Up 2 hours","Ports":"80/tcp"})"
                         "\n"
                         R"({"ID":"b2","Names":"cache","Image":"redis","State":"running","Status":"Up","Ports":""})"
                         "\n"
                         R"json({"ID":"c3","Names":"db,db-alias","Image":"postgres","State":"exited","Status":"Exited (0)","Ports":""})json"
                         "\n");
                     const ContainerGateway gateway(policy, docker);
                     const auto listed = gateway.list_containers();
                     require(listed.ok(), listed.error());
                     require(docker.calls().front() == Args({"ps", "-a", "--format", "{{json .}}"}),
                             "ps argv");
                     require(listed.value().size() == 2, "cache filtered out");
                     require(listed.value()[0].name == "web-1", "first container");
                     require(listed.value()[0].image == "nginx", "image parsed");
                     require(listed.value()[1].name == "db", "first alias kept");
                     require(listed.value()[1].state == "exited", "state parsed");
                   }});

  tests.push_back({"container_names_are_unfiltered", [] {
                     const auto policy = make_policy(gateway_security());
                     hostgate::testing::FakeDockerRunner docker;
                     docker.push_output("web-1\ncache\n\n");
                     const ContainerGateway gateway(policy, docker);
                     const auto names = gateway.container_names();
                     require(names.ok() && names.value().size() == 2, "two names");
                     require(names.value()[1] == "cache", "not filtered");
                   }});

  tests.push_back({"get_logs_builds_arguments_and_masks", [] {
                     const auto policy = make_policy(gateway_security());
                     hostgate::testing::FakeDockerRunner docker;
                     docker.push_output("started as /home/alice/app\n", 0, "password=hunter2\n");
                     const ContainerGateway gateway(policy, docker);
                     const auto logs =
                         gateway.get_logs("web-1", ctr::LogOptions{.tail = 20, .since = "10m"});
                     require(logs.ok(), logs.error());
                     require(docker.calls().front() ==
                                 Args({"logs", "--tail", "20", "--since", "10m", "web-1"}),
                             "logs argv");
                     require(logs.value().find("hunter2") == std::string::npos, "secret masked");
                     require(logs.value().find("alice") == std::string::npos, "host path masked");
                     require(logs.value().find("[HOST_PATH]/app") != std::string::npos,
                             "host path replacement");
                   }});

  tests.push_back({"default_log_tail_comes_from_options", [] {
                     const auto policy = make_policy(gateway_security());
                     hostgate::testing::FakeDockerRunner docker;
                     const ContainerGateway gateway(policy, docker,
                                                    ctr::GatewayOptions{.default_log_tail = 7});
                     require(gateway.get_logs("db").ok(), "logs ok");
                     require(docker.calls().front() == Args({"logs", "--tail", "7", "db"}),
                             "default tail");
                   }});

  tests.push_back({"denied_operations_never_reach_docker", [] {
                     const auto policy = make_policy(gateway_security());
                     hostgate::testing::FakeDockerRunner docker;
                     hostgate::testing::ObserverCapture capture;
                     const ContainerGateway gateway(policy, docker);

                     const auto logs = gateway.get_logs("cache");
                     require(!logs.ok() && logs.kind() == ErrorKind::PermissionDenied, "logs");
                     const auto exec = gateway.exec("web-1", "rm -rf /");
                     require(!exec.ok() && exec.kind() == ErrorKind::PermissionDenied, "exec");
                     require(!gateway.inspect("cache").ok(), "inspect");
                     require(!gateway.read_file("cache", "/etc/hosts").ok(), "read");
                     require(!docker.called(), "docker untouched");
                     require(capture.events_of<obs::AccessDeniedEvent>().size() == 4,
                             "each denial recorded");
                   }});

  tests.push_back({"exec_runs_whitelisted_command", [] {
                     const auto policy = make_policy(gateway_security());
                     hostgate::testing::FakeDockerRunner docker;
                     docker.push_output("web-1\n");
                     const ContainerGateway gateway(policy, docker);
                     const auto exec = gateway.exec("web-1", "cat /etc/hostname");
                     require(exec.ok(), exec.error());
                     require(docker.calls().front() ==
                                 Args({"exec", "web-1", "cat", "/etc/hostname"}),
                             "exec argv");
                     require(exec.value().output == "web-1\n", "output");
                     require(exec.value().exit_code == 0 && !exec.value().dangerous, "flags");
                   }});

  tests.push_back({"exec_reports_command_exit_code", [] {
                     const auto policy = make_policy(gateway_security());
                     hostgate::testing::FakeDockerRunner docker;
                     docker.push_output("", 2, "ls: cannot access 'x'\n");
                     const ContainerGateway gateway(policy, docker);
                     const auto exec = gateway.exec("web-1", "ls");
                     require(exec.ok(), "command failure is a result");
                     require(exec.value().exit_code == 2, "exit code");
                     require(exec.value().output.find("cannot access") != std::string::npos,
                             "stderr included");
                   }});

  tests.push_back({"exec_maps_docker_failures", [] {
                     const auto policy = make_policy(gateway_security());
                     hostgate::testing::FakeDockerRunner docker;
                     docker.push_output("", 1, "Error: No such container: web-9\n");
                     docker.push_output("", 1,
                                        "Cannot connect to the Docker daemon at unix:///var/run/"
                                        "docker.sock\n");
                     docker.push_result(
                         hostgate::common::Result<ctr::DockerProcessResult>::failure(
                             "docker command timed out: exec web-1 ls", ErrorKind::Timeout));
                     const ContainerGateway gateway(policy, docker);

                     const auto missing = gateway.exec("web-9", "ls");
                     require(!missing.ok() && missing.kind() == ErrorKind::NotFound, "not found");
                     const auto daemon = gateway.exec("web-1", "ls");
                     require(!daemon.ok() && daemon.kind() == ErrorKind::ExecutionFailure,
                             "daemon down");
                     const auto timeout = gateway.exec("web-1", "ls");
                     require(!timeout.ok() && timeout.kind() == ErrorKind::Timeout, "timeout");
                   }});

  tests.push_back({"dangerous_exec_marks_result", [] {
                     const auto policy = make_policy(gateway_security());
                     hostgate::testing::FakeDockerRunner docker;
                     docker.push_output("line\n");
                     const ContainerGateway gateway(policy, docker);
                     const auto plain = gateway.exec("web-1", "grep -r TODO /app/src");
                     require(!plain.ok(), "not whitelisted");
                     require(plain.error().find("dangerously=true") != std::string::npos, "hint");
                     const auto exec = gateway.exec("web-1", "grep -r TODO /app/src", true);
                     require(exec.ok(), exec.error());
                     require(exec.value().dangerous, "flag carried");
                     require(docker.calls().size() == 1, "one docker call");

                     const auto blocked =
                         gateway.exec("web-1", "cat /app/config/secrets.yml", true);
                     require(!blocked.ok() && blocked.kind() == ErrorKind::PermissionDenied,
                             "blocked path");
                   }});

  tests.push_back({"read_file_returns_blocked_result", [] {
                     const auto policy = make_policy(gateway_security());
                     hostgate::testing::FakeDockerRunner docker;
                     const ContainerGateway gateway(policy, docker);
                     const auto read = gateway.read_file("web-1", "/app/config/secrets.yml");
                     require(read.ok(), read.error());
                     require(read.value().blocked && !read.value().success, "blocked");
                     require(read.value().block.has_value() &&
                                 read.value().block->reason == "manual_block",
                             "rule attached");
                     require(read.value().error.find("access to /app/config/secrets.yml is blocked") ==
                                 0,
                             read.value().error);
                     require(!docker.called(), "docker untouched");

                     const auto env = gateway.list_files("db", "/srv/.env");
                     require(env.ok() && env.value().blocked, "global pattern");
                   }});

  tests.push_back({"read_file_uses_cat_or_head", [] {
                     const auto policy = make_policy(gateway_security());
                     hostgate::testing::FakeDockerRunner docker;
                     docker.push_output("127.0.0.1 localhost\n");
                     docker.push_output("a\nb\n");
                     docker.push_output("", 1, "cat: /nope: No such file or directory\n");
                     const ContainerGateway gateway(policy, docker);

                     const auto full = gateway.read_file("web-1", "/etc/hosts");
                     require(full.ok() && full.value().success, "read ok");
                     require(full.value().data == "127.0.0.1 localhost\n", "data");
                     require(docker.calls()[0] == Args({"exec", "web-1", "cat", "--", "/etc/hosts"}),
                             "cat argv");

                     const auto head = gateway.read_file("web-1", "/var/log/app.log", 2);
                     require(head.ok() && head.value().success, "head ok");
                     require(docker.calls()[1] ==
                                 Args({"exec", "web-1", "head", "-n", "2", "--", "/var/log/app.log"}),
                             "head argv");

                     const auto missing = gateway.read_file("web-1", "/nope");
                     require(missing.ok(), "command failure is a result");
                     require(!missing.value().success && !missing.value().blocked, "failed read");
                     require(missing.value().error.find("No such file") != std::string::npos,
                             "error text");
                   }});

  tests.push_back({"list_files_requires_path", [] {
                     const auto policy = make_policy(gateway_security());
                     hostgate::testing::FakeDockerRunner docker;
                     docker.push_output("total 0\n");
                     const ContainerGateway gateway(policy, docker);
                     const auto empty = gateway.list_files("web-1", "");
                     require(!empty.ok() && empty.kind() == ErrorKind::InvalidArgument, "empty");
                     const auto listed = gateway.list_files("web-1", "/app");
                     require(listed.ok() && listed.value().success, "listed");
                     require(docker.calls().front() == Args({"exec", "web-1", "ls", "-la", "--", "/app"}),
                             "ls argv");
                   }});

  tests.push_back({"dash_prefixed_operands_never_become_options", [] {
                     auto config = gateway_security();
                     config.allowed_containers = {"*"};
                     const auto policy = make_policy(config);
                     hostgate::testing::FakeDockerRunner docker;
                     docker.push_output("total 0\n");
                     const ContainerGateway gateway(policy, docker);

                     const auto exec = gateway.exec("--user=root", "ls");
                     require(!exec.ok() && exec.kind() == ErrorKind::InvalidArgument,
                             "option-like container refused");
                     const auto read = gateway.read_file("-it", "/etc/hosts");
                     require(!read.ok() && read.kind() == ErrorKind::InvalidArgument,
                             "read refused");
                     const auto logs = gateway.get_logs("--details");
                     require(!logs.ok() && logs.kind() == ErrorKind::InvalidArgument,
                             "logs refused");
                     const auto started = gateway.lifecycle("-a", ctr::LifecycleAction::Start);
                     require(!started.ok() && started.kind() == ErrorKind::InvalidArgument,
                             "lifecycle refused");
                     require(docker.calls().empty(), "docker never invoked");

                     const auto listed = gateway.list_files("web-1", "-R");
                     require(listed.ok() && listed.value().success, listed.ok() ? "" : listed.error());
                     require(docker.calls().front() == Args({"exec", "web-1", "ls", "-la", "--", "-R"}),
                             "path stays an operand");
                   }});

  tests.push_back({"inspect_and_stats_mask_output", [] {
                     const auto policy = make_policy(gateway_security());
                     hostgate::testing::FakeDockerRunner docker;
                     docker.push_output(R"([{"Env":["API_KEY=abc123"],"Source":"/home/bob/x"}])");
                     docker.push_output("  {\"Name\":\"web-1\",\"CPUPerc\":\"0.5%\"}\n");
                     const ContainerGateway gateway(policy, docker);

                     const auto inspected = gateway.inspect("web-1");
                     require(inspected.ok(), inspected.error());
                     require(docker.calls()[0] == Args({"inspect", "--type", "container", "web-1"}),
                             "inspect argv");
                     require(inspected.value().find("abc123") == std::string::npos, "env masked");
                     require(inspected.value().find("/home/bob") == std::string::npos,
                             "host path masked");

                     const auto stats = gateway.get_stats("web-1");
                     require(stats.ok(), stats.error());
                     require(docker.calls()[1] == Args({"stats", "--no-stream", "--format",
                                                        "{{json .}}", "web-1"}),
                             "stats argv");
                     require(stats.value().front() == '{', "trimmed");
                   }});

  tests.push_back({"lifecycle_requires_permission", [] {
                     hostgate::testing::FakeDockerRunner docker;
                     const auto locked = make_policy(gateway_security());
                     const ContainerGateway denied(locked, docker);
                     const auto refused = denied.lifecycle("web-1", ctr::LifecycleAction::Restart);
                     require(!refused.ok() && refused.kind() == ErrorKind::PermissionDenied,
                             "disabled by default");
                     require(!docker.called(), "docker untouched");

                     auto config = gateway_security();
                     config.permissions.lifecycle = true;
                     const auto open = make_policy(config);
                     const ContainerGateway gateway(open, docker);
                     require(gateway.lifecycle("web-1", ctr::LifecycleAction::Restart).ok(),
                             "restart ok");
                     require(docker.calls().front() == Args({"restart", "web-1"}), "restart argv");
                   }});

  tests.push_back({"truncated_output_is_flagged_after_masking", [] {
                     const auto policy = make_policy(gateway_security());
                     hostgate::testing::FakeDockerRunner docker;
                     const auto cut = [](std::string text) {
                       return hostgate::common::Result<ctr::DockerProcessResult>::success(
                           ctr::DockerProcessResult{.exit_code = 0,
                                                    .stdout_text = std::move(text),
                                                    .stderr_text = "",
                                                    .truncated = true,
                                                    .output_limit = 64});
                     };
                     docker.push_result(cut("token=abc123\nline two"));
                     docker.push_result(cut("HOSTNAME=web-1\n"));
                     docker.push_result(cut("root:x:0:0"));
                     docker.push_output("complete\n");
                     const ContainerGateway gateway(policy, docker);

                     const auto logs = gateway.get_logs("web-1");
                     require(logs.ok(), logs.error());
                     require(logs.value() == "[MASKED]\nline two\n[output truncated at 64 bytes]",
                             logs.value());

                     const auto exec = gateway.exec("web-1", "ls");
                     require(exec.ok() && exec.value().truncated, "exec flagged");
                     require(exec.value().output ==
                                 "HOSTNAME=web-1\n[output truncated at 64 bytes]",
                             exec.value().output);

                     const auto file = gateway.read_file("web-1", "/etc/passwd");
                     require(file.ok() && file.value().success, "read ok");
                     require(file.value().truncated, "read flagged");
                     require(file.value().data == "root:x:0:0\n[output truncated at 64 bytes]",
                             file.value().data);

                     const auto whole = gateway.read_file("web-1", "/etc/hostname");
                     require(whole.ok() && !whole.value().truncated, "complete read");
                     require(whole.value().data == "complete\n", "no marker");
                   }});

  tests.push_back({"docker_cli_runner_classifies_failures", [] {
                     auto processes = std::make_shared<hostgate::testing::FakeProcessRunner>();
                     processes->push_output("", 1, "Error: No such container: ghost\n");
                     processes->push_output("", 1, "");
                     processes->push_output("", 3, "boom");
                     processes->push_result(hostgate::common::Result<hostgate::common::ProcessResult>::failure(
                         "process timed out", ErrorKind::Timeout));
                     ctr::DockerCliRunner runner("/usr/bin/docker", processes);

                     const auto missing = runner.run({"inspect", "ghost"});
                     require(!missing.ok() && missing.kind() == ErrorKind::NotFound, "not found");
                     require(missing.error() == "Error: No such container: ghost", "trimmed");
                     require(processes->calls()[0] ==
                                 Args({"/usr/bin/docker", "inspect", "ghost"}),
                             "binary prefixed");

                     const auto silent = runner.run({"stop", "x"});
                     require(silent.error() == "docker command failed: stop x", silent.error());

                     const auto tolerated = runner.run({"exec", "x", "false"},
                                                       ctr::DockerCommandOptions{.allow_failure = true});
                     require(tolerated.ok() && tolerated.value().exit_code == 3, "allowed");

                     const auto timeout = runner.run({"logs", "x"});
                     require(!timeout.ok() && timeout.kind() == ErrorKind::Timeout, "timeout");
                     require(timeout.error() == "docker command timed out: logs x", "message");
                     require(!runner.run({}).ok(), "empty args");
                   }});
}
