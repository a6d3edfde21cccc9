#pragma once

#include <map>
#include <string>
#include <vector>

namespace hostgate::config {

/// name -> list, used for every "key -> [patterns]" table (whitelists, deny
/// lists, manual blocked paths). The key "*" applies to every name.
using PatternTable = std::map<std::string, std::vector<std::string>>;

struct PermissionsConfig {
  bool logs = true;
  bool inspect = true;
  bool stats = true;
  bool exec = true;
  bool lifecycle = false;
};

struct ExecDangerouslyConfig {
  bool enabled = false;
  PatternTable commands;
};

struct SettingsScanConfig {
  bool enabled = true;
  int max_depth = 1;
  std::vector<std::string> settings_files;
};

struct AutoImportConfig {
  bool enabled = false;
  std::string workspace_root = ".";
  std::vector<std::string> scan_files = {
      ".devcontainer/docker-compose.yml",
      ".devcontainer/devcontainer.json",
      "cli_sandbox/docker-compose.yml",
  };
  std::vector<std::string> global_patterns = {".env", "*.key", "*.pem", "secrets/*"};
  SettingsScanConfig claude_code_settings{
      .enabled = true,
      .max_depth = 1,
      .settings_files = {".claude/settings.json", ".claude/settings.local.json"}};
  SettingsScanConfig gemini_settings{.enabled = true,
                                     .max_depth = 1,
                                     .settings_files = {".aiexclude", ".geminiignore"}};
};

struct BlockedPathsConfig {
  PatternTable manual;
  AutoImportConfig auto_import;
};

struct OutputMaskingConfig {
  bool enabled = true;
  std::string replacement = "[MASKED]";
  // Value runs are bounded: std::regex matches repetitions recursively.
  std::vector<std::string> patterns = {
      R"re((?i)(password|passwd|pwd)\s*[=:]\s*["']?[^\s"'\n]{1,4096}["']?)re",
      R"re((?i)(api[_-]?key|apikey|secret[_-]?key)\s*[=:]\s*["']?[^\s"'\n]{1,4096}["']?)re",
      R"re((?i)(secret|token|credential)\s*[=:]\s*["']?[^\s"'\n]{1,4096}["']?)re",
      R"re((?i)bearer\s+[a-zA-Z0-9._-]{1,4096})re",
      R"re(sk-[a-zA-Z0-9]{20,4096})re",
      R"re((?i)(aws[_-]?access[_-]?key[_-]?id|aws[_-]?secret[_-]?access[_-]?key)\s*[=:]\s*["']?[A-Z0-9/+=]{1,4096}["']?)re",
      R"re((?i)(postgres|mysql|mongodb|redis)://[^:\s]{1,256}:[^@\s]{1,256}@)re",
  };
  bool apply_to_logs = true;
  bool apply_to_exec = true;
  bool apply_to_inspect = true;
};

struct HostPathMaskingConfig {
  bool enabled = true;
  std::string replacement = "[HOST_PATH]";
};

struct SecurityConfig {
  std::string mode = "moderate";
  std::vector<std::string> allowed_containers;
  PatternTable exec_whitelist;
  ExecDangerouslyConfig exec_dangerously;
  PermissionsConfig permissions;
  BlockedPathsConfig blocked_paths;
  OutputMaskingConfig output_masking;
  HostPathMaskingConfig host_path_masking;
};

struct HostToolsConfig {
  bool enabled = false;
  std::vector<std::string> directories = {".sandbox/host-tools"};
  std::string approved_dir;
  std::vector<std::string> staging_dirs = {".sandbox/host-tools"};
  bool common = true;
  std::vector<std::string> allowed_extensions = {".sh", ".go", ".py"};
  int timeout_seconds = 60;
};

struct HostCommandsDangerouslyConfig {
  bool enabled = false;
  PatternTable commands;
};

struct HostCommandsConfig {
  bool enabled = false;
  std::vector<std::string> allowed_containers;
  PatternTable whitelist;
  PatternTable deny;
  HostCommandsDangerouslyConfig dangerously;
  int timeout_seconds = 60;
  std::string blocked_path_scope = "host";
};

struct HostAccessConfig {
  std::string workspace_root;
  HostToolsConfig host_tools;
  HostCommandsConfig host_commands;
};

struct DockerConfig {
  std::string binary = "docker";
  int timeout_seconds = 30;
  int default_log_tail = 100;
};

struct ObservabilityConfig {
  std::string backend = "log";
  std::string log_level = "info";
  std::string audit_file;
};

struct Config {
  SecurityConfig security;
  HostAccessConfig host_access;
  DockerConfig docker;
  ObservabilityConfig observability;
};

} // namespace hostgate::config
