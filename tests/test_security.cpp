#include "test_framework.hpp"

#include "hostgate/security/command_syntax.hpp"
#include "hostgate/security/output_masking.hpp"
#include "hostgate/security/pattern.hpp"
#include "hostgate/security/policy.hpp"
#include "tests/helpers/test_helpers.hpp"

namespace {

using hostgate::security::SecurityPolicy;

hostgate::config::SecurityConfig base_security() {
  auto config = hostgate::testing::mock_config().security;
  config.exec_whitelist["*"] = {"ls", "whoami"};
  config.exec_whitelist["web-1"] = {"cat /etc/hostname", "git log*"};
  return config;
}

SecurityPolicy make_policy(const hostgate::config::SecurityConfig &config) {
  auto policy = SecurityPolicy::from_config(config);
  if (!policy.ok()) {
    throw std::runtime_error("policy build failed: " + policy.error());
  }
  return policy.value();
}

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

void register_security_tests(std::vector<hostgate::tests::TestCase> &tests) {
  using hostgate::tests::require;
  namespace sec = hostgate::security;

  tests.push_back({"glob_match_stays_within_one_path_element", [] {
                     require(sec::glob_match("web-*", "web-1"), "star suffix");
                     require(sec::glob_match("db-?", "db-a"), "question mark");
                     require(!sec::glob_match("*.key", "certs/server.key"), "star crosses slash");
                     require(sec::glob_match("app-[0-9]", "app-3"), "class");
                     require(!sec::glob_match("app-[!0-9]", "app-3"), "negated class");
                     require(!sec::glob_match("app-[0-9", "app-3"), "malformed class");
                     require(sec::glob_match("exact", "exact") && !sec::glob_match("exact", "exac"),
                             "literal");
                   }});

  tests.push_back({"command_patterns_are_exact_or_prefix", [] {
                     require(sec::matches_command_pattern("diff *", "diff HEAD~1"), "prefix");
                     require(!sec::matches_command_pattern("ls", "ls -la"), "exact only");
                     require(!sec::matches_command_pattern("ls *", "ls"), "prefix keeps space");
                     const auto found =
                         sec::find_command_pattern({"status", "log*"}, "log --oneline");
                     require(found.has_value() && *found == "log*", "first match returned");
                   }});

  tests.push_back({"security_mode_parsing", [] {
                     require(sec::parse_security_mode("").value() == sec::SecurityMode::Moderate,
                             "empty means moderate");
                     require(sec::parse_security_mode(" STRICT ").value() ==
                                 sec::SecurityMode::Strict,
                             "case insensitive");
                     const auto bad = sec::parse_security_mode("lenient");
                     require(!bad.ok(), "unknown mode rejected");
                     require(bad.kind() == hostgate::common::ErrorKind::InvalidArgument, "kind");

                     auto config = base_security();
                     config.mode = "lenient";
                     require(!SecurityPolicy::from_config(config).ok(), "policy rejects mode");
                   }});

  tests.push_back({"container_allow_list_uses_globs", [] {
                     auto config = base_security();
                     const auto open = make_policy(config);
                     require(open.can_access_container("anything"), "empty list allows all");

                     config.allowed_containers = {"web-*", "db"};
                     const auto policy = make_policy(config);
                     require(policy.can_access_container("web-2"), "glob allowed");
                     require(policy.can_access_container("db"), "exact allowed");
                     require(!policy.can_access_container("db-replica"), "not listed");
                     const auto status = policy.can_get_logs("cache");
                     require(!status.ok(), "logs denied");
                     require(status.kind() == hostgate::common::ErrorKind::PermissionDenied,
                             "permission denied");
                     require(contains(status.error(), "cache"), "names container");
                   }});

  tests.push_back({"permission_flags_gate_read_operations", [] {
                     auto config = base_security();
                     config.permissions.logs = false;
                     config.permissions.stats = false;
                     const auto policy = make_policy(config);
                     require(!policy.can_get_logs("web-1").ok(), "logs off");
                     require(!policy.can_get_stats("web-1").ok(), "stats off");
                     require(policy.can_inspect("web-1").ok(), "inspect on");
                     require(!policy.can_lifecycle("web-1").ok(), "lifecycle off by default");
                   }});

  tests.push_back({"exec_whitelist_requires_exact_or_prefix_match", [] {
                     const auto policy = make_policy(base_security());
                     require(policy.can_exec("web-1", "ls").ok(), "global entry");
                     require(!policy.can_exec("web-1", "ls ").ok(), "trailing space differs");
                     require(!policy.can_exec("web-1", "ls -la").ok(), "extra argument");
                     require(policy.can_exec("web-1", "git log --oneline").ok(), "prefix entry");
                     require(policy.can_exec("web-1", "cat /etc/hostname").ok(), "scoped entry");
                     require(!policy.can_exec("db", "cat /etc/hostname").ok(),
                             "scoped entry does not leak");
                     const auto denied = policy.can_exec("web-1", "rm -rf /");
                     require(denied.error() == "command not whitelisted: rm -rf /", denied.error());

                     const auto merged = policy.allowed_commands("web-1");
                     require(merged.size() == 4 && merged.front() == "cat /etc/hostname",
                             "scoped entries first");
                   }});

  tests.push_back({"exec_denial_hints_at_dangerous_mode", [] {
                     auto config = base_security();
                     config.exec_dangerously.enabled = true;
                     config.exec_dangerously.commands["*"] = {"cat", "grep"};
                     const auto policy = make_policy(config);

                     const auto denied = policy.can_exec("web-1", "cat /etc/passwd");
                     require(!denied.ok(), "not whitelisted");
                     require(contains(denied.error(), "hint: this command is available with "
                                                      "dangerously=true"),
                             denied.error());
                     require(!contains(policy.can_exec("web-1", "rm x").error(), "hint"),
                             "no hint for unknown base");
                     require(policy.can_exec_dangerously("web-1", "cat /etc/passwd").ok(),
                             "dangerous allows base command");
                   }});

  tests.push_back({"dangerous_exec_rejects_unsafe_arguments", [] {
                     auto config = base_security();
                     config.exec_dangerously.enabled = true;
                     config.exec_dangerously.commands["*"] = {"cat"};
                     config.blocked_paths.manual["web-1"] = {"/app/config/*"};
                     const auto policy = make_policy(config);

                     require(contains(policy.can_exec_dangerously("web-1", "cat a | sh").error(),
                                      "meta-characters"),
                             "pipe rejected");
                     require(contains(policy.can_exec_dangerously("web-1", "cat $(id)").error(),
                                      "'$('"),
                             "substitution rejected");
                     require(contains(policy.can_exec_dangerously("web-1", "cat ../etc/x").error(),
                                      "traversal"),
                             "traversal rejected");
                     require(contains(policy.can_exec_dangerously("web-1", "rm /tmp/x").error(),
                                      "command not allowed in dangerous mode: rm"),
                             "base not listed");

                     const auto env = policy.can_exec_dangerously("web-1", "cat /app/.env");
                     require(!env.ok(), "global pattern blocks .env");
                     require(contains(env.error(), "access to /app/.env is blocked"), env.error());
                     require(!policy.can_exec_dangerously("web-1", "cat /app/config/db.yml").ok(),
                             "scoped block");
                     require(policy.can_exec_dangerously("web-2", "cat /app/config/db.yml").ok(),
                             "scoped block only for its container");
                   }});

  tests.push_back({"dangerous_exec_requires_enablement", [] {
                     auto config = base_security();
                     config.exec_dangerously.commands["*"] = {"cat"};
                     const auto policy = make_policy(config);
                     require(!policy.can_exec_dangerously("web-1", "cat /etc/hosts").ok(),
                             "disabled");
                     require(policy.dangerous_commands("web-1").empty(), "nothing advertised");
                     require(!contains(policy.can_exec("web-1", "cat /etc/hosts").error(), "hint"),
                             "no hint when disabled");
                   }});

  tests.push_back({"strict_and_permissive_modes", [] {
                     auto config = base_security();
                     config.permissions.lifecycle = true;
                     config.mode = "strict";
                     const auto strict = make_policy(config);
                     require(!strict.can_exec("web-1", "ls").ok(), "strict denies exec");
                     require(!strict.can_lifecycle("web-1").ok(), "strict denies lifecycle");
                     require(strict.can_get_logs("web-1").ok(), "strict allows reads");

                     config.mode = "permissive";
                     const auto permissive = make_policy(config);
                     require(permissive.can_exec("web-1", "rm -rf /tmp/cache").ok(),
                             "permissive allows any command");
                     require(permissive.can_lifecycle("web-1").ok(), "lifecycle enabled");

                     config.allowed_containers = {"web-*"};
                     require(!make_policy(config).can_exec("db", "ls").ok(),
                             "container list still applies");
                   }});

  tests.push_back({"default_masking_redacts_credentials_idempotently", [] {
                     const auto policy = make_policy(base_security());
                     const std::string raw =
                         "DB_PASSWORD=hunter2\nAuthorization: Bearer abc.def\nkey sk-"
                         "abcdefghijklmnopqrstuvwxyz\nurl postgres://app:pw@db/app";
                     const auto once = policy.mask_output(raw, sec::MaskTarget::Logs);
                     require(!contains(once, "hunter2"), "password masked");
                     require(!contains(once, "abc.def"), "bearer masked");
                     require(!contains(once, "sk-abcdefghij"), "api key masked");
                     require(!contains(once, "app:pw@"), "dsn credentials masked");
                     require(contains(once, "[MASKED]"), "replacement used");
                     require(policy.mask_output(once, sec::MaskTarget::Logs) == once,
                             "second pass is a no-op");
                   }});

  tests.push_back({"masking_handles_megabyte_lines", [] {
                     const auto masker = sec::OutputMasker::from_config(
                         hostgate::config::OutputMaskingConfig{},
                         hostgate::config::HostPathMaskingConfig{});
                     const std::string huge = "password=" + std::string(1024 * 1024, 'A');
                     const auto masked = masker.mask(huge, sec::MaskTarget::Logs);
                     require(masked.rfind("[MASKED]", 0) == 0, "secret prefix masked");
                     require(!contains(masked, "password="), "key consumed");
                     require(masked.size() < huge.size(), "value run replaced");

                     std::string words;
                     while (words.size() < 20000) {
                       words += "lorem ipsum ";
                     }
                     const std::string line = words + "token=s3cr3tvalue " + words + "\nnext line";
                     const auto cleaned = masker.mask(line, sec::MaskTarget::Exec);
                     require(!contains(cleaned, "s3cr3tvalue"), "secret past 8 KiB masked");
                     require(contains(cleaned, "[MASKED] lorem"), "surrounding text kept");
                     require(cleaned.size() == line.size() - std::string("token=s3cr3tvalue").size() +
                                                   std::string("[MASKED]").size(),
                             "only the secret changed");
                   }});

  tests.push_back({"masking_rules_apply_per_target", [] {
                     const sec::OutputMasker masker({sec::MaskingRuleSpec{.pattern = "hunter2",
                                                                          .replacement = "***",
                                                                          .logs = true,
                                                                          .exec = false,
                                                                          .inspect = false}});
                     require(masker.mask("pw hunter2", sec::MaskTarget::Logs) == "pw ***", "logs");
                     require(masker.mask("pw hunter2", sec::MaskTarget::Inspect) == "pw hunter2",
                             "inspect untouched");
                     require(masker.mask("pw hunter2", sec::MaskTarget::Exec) == "pw hunter2",
                             "exec untouched");
                   }});

  tests.push_back({"masking_drops_invalid_and_unstable_rules", [] {
                     hostgate::testing::ObserverCapture capture;
                     const sec::OutputMasker masker(
                         {sec::MaskingRuleSpec{.pattern = "([unclosed"},
                          sec::MaskingRuleSpec{.pattern = "MASK", .replacement = "[MASK]"},
                          sec::MaskingRuleSpec{.pattern = "(?i)token=\\S+"}});
                     require(masker.rules().size() == 1, "only the valid stable rule survives");
                     require(masker.rejected_patterns().size() == 2, "two rejected");
                     require(capture.events_of<hostgate::observability::WarningEvent>().size() == 2,
                             "rejections logged");
                     require(masker.mask("TOKEN=abc", sec::MaskTarget::Exec) == "[MASKED]",
                             "case-insensitive prefix honoured");
                   }});

  tests.push_back({"host_paths_hide_account_names", [] {
                     const sec::OutputMasker masker({}, "[HOST_PATH]");
                     require(masker.mask_host_paths("/home/alice/project/a.txt") ==
                                 "[HOST_PATH]/project/a.txt",
                             "linux home");
                     require(masker.mask_host_paths("/Users/bob") == "[HOST_PATH]", "mac home");
                     require(masker.mask_host_paths(R"(C:\Users\carol\repo)") ==
                                 R"([HOST_PATH]\repo)",
                             "windows home");
                     require(masker.mask_host_paths("/c/Users/dave/x") == "[HOST_PATH]/x",
                             "msys home");
                     require(masker.mask_host_paths(R"({"dir":"/home/erin"})") ==
                                 R"({"dir":"[HOST_PATH]"})",
                             "quote terminates name");
                     require(masker.mask_host_paths("/home/") == "/home/", "no account name");

                     const sec::OutputMasker disabled;
                     require(disabled.mask_host_paths("/home/alice") == "/home/alice", "disabled");
                   }});

  tests.push_back({"command_tokenizer_honours_quotes", [] {
                     const auto tokens = sec::tokenize_command(R"(git commit -m "fix \"bug\"")");
                     require(tokens.ok(), tokens.error());
                     require(tokens.value().size() == 4, "four tokens");
                     require(tokens.value()[3] == R"(fix "bug")", "escaped quotes kept");

                     const auto single = sec::tokenize_command(R"(echo 'a \ b'  c\ d)");
                     require(single.ok() && single.value().size() == 3, "three tokens");
                     require(single.value()[1] == R"(a \ b)", "single quotes literal");
                     require(single.value()[2] == "c d", "escaped space");

                     const auto unclosed = sec::tokenize_command("echo \"open");
                     require(!unclosed.ok(), "unclosed quote");
                     require(unclosed.kind() == hostgate::common::ErrorKind::ParseError, "kind");
                     require(!sec::tokenize_command("echo \\").ok(), "dangling escape");
                   }});

  tests.push_back({"command_syntax_helpers", [] {
                     require(!sec::find_shell_metacharacter("git status").has_value(), "clean");
                     require(sec::find_shell_metacharacter("a && b").value() == "&", "and");
                     require(sec::find_shell_metacharacter("echo `id`").value() == "`", "backtick");
                     require(sec::find_shell_metacharacter("a\nb").value() == "newline", "newline");
                     require(!sec::find_shell_metacharacter("echo $HOME").has_value(),
                             "plain variable");
                     require(sec::has_path_traversal({"cat", "a/../b"}), "traversal");
                     const auto paths =
                         sec::extract_path_arguments({"cat", "-n", "/etc/hosts", "src/a.c", "x"});
                     require(paths.size() == 2 && paths[0] == "/etc/hosts", "paths extracted");
                   }});

  tests.push_back({"describe_json_summarises_policy", [] {
                     auto config = base_security();
                     config.allowed_containers = {"web-*"};
                     const auto json = make_policy(config).describe_json();
                     require(contains(json, "\"mode\":\"moderate\""), json);
                     require(contains(json, "\"allowed_containers\":[\"web-*\"]"), json);
                     require(contains(json, "\"lifecycle\":false"), json);
                     require(contains(json, "\"host_path_masking\":true"), json);
                   }});
}
