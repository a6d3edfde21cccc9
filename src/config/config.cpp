#include "hostgate/config/config.hpp"

#include "hostgate/common/fs.hpp"
#include "hostgate/common/toml.hpp"

#include <cstdlib>
#include <regex>
#include <sstream>

namespace hostgate::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".hostgate";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("HOSTGATE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::vector<std::string> expand_all(std::vector<std::string> values) {
  for (auto &value : values) {
    value = expand_config_value(value);
  }
  return values;
}

PatternTable get_table(const common::TomlDocument &doc, const std::string &table,
                       const PatternTable &fallback) {
  auto parsed = doc.get_string_array_table(table);
  if (parsed.empty()) {
    return fallback;
  }
  return PatternTable(parsed.begin(), parsed.end());
}

void load_settings_scan(const common::TomlDocument &doc, const std::string &prefix,
                        SettingsScanConfig &scan) {
  scan.enabled = doc.get_bool(prefix + ".enabled", scan.enabled);
  scan.max_depth = doc.get_int(prefix + ".max_depth", scan.max_depth);
  scan.settings_files = doc.get_string_array(prefix + ".settings_files", scan.settings_files);
}

void load_security(const common::TomlDocument &doc, SecurityConfig &security) {
  security.mode = common::to_lower(doc.get_string("security.mode", security.mode));
  security.allowed_containers =
      doc.get_string_array("security.allowed_containers", security.allowed_containers);
  security.exec_whitelist =
      get_table(doc, "security.exec_whitelist", security.exec_whitelist);

  auto &perms = security.permissions;
  perms.logs = doc.get_bool("security.permissions.logs", perms.logs);
  perms.inspect = doc.get_bool("security.permissions.inspect", perms.inspect);
  perms.stats = doc.get_bool("security.permissions.stats", perms.stats);
  perms.exec = doc.get_bool("security.permissions.exec", perms.exec);
  perms.lifecycle = doc.get_bool("security.permissions.lifecycle", perms.lifecycle);

  auto &dangerously = security.exec_dangerously;
  dangerously.enabled = doc.get_bool("security.exec_dangerously.enabled", dangerously.enabled);
  dangerously.commands =
      get_table(doc, "security.exec_dangerously.commands", dangerously.commands);

  auto &blocked = security.blocked_paths;
  blocked.manual = get_table(doc, "security.blocked_paths.manual", blocked.manual);
  auto &auto_import = blocked.auto_import;
  const std::string ai = "security.blocked_paths.auto_import";
  auto_import.enabled = doc.get_bool(ai + ".enabled", auto_import.enabled);
  auto_import.workspace_root =
      expand_config_value(doc.get_string(ai + ".workspace_root", auto_import.workspace_root));
  auto_import.scan_files = doc.get_string_array(ai + ".scan_files", auto_import.scan_files);
  auto_import.global_patterns =
      doc.get_string_array(ai + ".global_patterns", auto_import.global_patterns);
  load_settings_scan(doc, ai + ".claude_code_settings", auto_import.claude_code_settings);
  load_settings_scan(doc, ai + ".gemini_settings", auto_import.gemini_settings);

  auto &masking = security.output_masking;
  masking.enabled = doc.get_bool("security.output_masking.enabled", masking.enabled);
  masking.replacement = doc.get_string("security.output_masking.replacement", masking.replacement);
  masking.patterns = doc.get_string_array("security.output_masking.patterns", masking.patterns);
  masking.apply_to_logs =
      doc.get_bool("security.output_masking.apply_to.logs", masking.apply_to_logs);
  masking.apply_to_exec =
      doc.get_bool("security.output_masking.apply_to.exec", masking.apply_to_exec);
  masking.apply_to_inspect =
      doc.get_bool("security.output_masking.apply_to.inspect", masking.apply_to_inspect);

  auto &host_paths = security.host_path_masking;
  host_paths.enabled = doc.get_bool("security.host_path_masking.enabled", host_paths.enabled);
  host_paths.replacement =
      doc.get_string("security.host_path_masking.replacement", host_paths.replacement);
}

void load_host_access(const common::TomlDocument &doc, HostAccessConfig &host) {
  host.workspace_root =
      expand_config_value(doc.get_string("host_access.workspace_root", host.workspace_root));

  auto &tools = host.host_tools;
  const std::string ht = "host_access.host_tools";
  tools.enabled = doc.get_bool(ht + ".enabled", tools.enabled);
  tools.directories = expand_all(doc.get_string_array(ht + ".directories", tools.directories));
  tools.approved_dir = expand_config_value(doc.get_string(ht + ".approved_dir", tools.approved_dir));
  tools.staging_dirs = expand_all(doc.get_string_array(ht + ".staging_dirs", tools.staging_dirs));
  tools.common = doc.get_bool(ht + ".common", tools.common);
  tools.allowed_extensions =
      doc.get_string_array(ht + ".allowed_extensions", tools.allowed_extensions);
  tools.timeout_seconds = doc.get_int(ht + ".timeout", tools.timeout_seconds);

  auto &commands = host.host_commands;
  const std::string hc = "host_access.host_commands";
  commands.enabled = doc.get_bool(hc + ".enabled", commands.enabled);
  commands.allowed_containers =
      doc.get_string_array(hc + ".allowed_containers", commands.allowed_containers);
  commands.whitelist = get_table(doc, hc + ".whitelist", commands.whitelist);
  commands.deny = get_table(doc, hc + ".deny", commands.deny);
  commands.dangerously.enabled =
      doc.get_bool(hc + ".dangerously.enabled", commands.dangerously.enabled);
  commands.dangerously.commands =
      get_table(doc, hc + ".dangerously.commands", commands.dangerously.commands);
  commands.timeout_seconds = doc.get_int(hc + ".timeout", commands.timeout_seconds);
  commands.blocked_path_scope =
      doc.get_string(hc + ".blocked_path_scope", commands.blocked_path_scope);
}

void render_table(std::ostringstream &out, const std::string &header, const PatternTable &table) {
  out << "\n[" << header << "]\n";
  for (const auto &[key, values] : table) {
    out << common::quote_toml_string(key) << " = [";
    for (std::size_t i = 0; i < values.size(); ++i) {
      out << (i == 0 ? "" : ", ") << common::quote_toml_string(values[i]);
    }
    out << "]\n";
  }
}

void render_list(std::ostringstream &out, const std::string &key,
                 const std::vector<std::string> &values) {
  out << key << " = [";
  for (std::size_t i = 0; i < values.size(); ++i) {
    out << (i == 0 ? "" : ", ") << common::quote_toml_string(values[i]);
  }
  out << "]\n";
}

const char *toml_bool(const bool value) { return value ? "true" : "false"; }

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error(), home.kind());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error(), cfg_dir.kind());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  g_config_path_override = std::move(path);
}

void clear_config_path_override() { g_config_path_override.reset(); }

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error(), parsed.kind());
  }

  Config config;
  const auto &doc = parsed.value();
  load_security(doc, config.security);
  load_host_access(doc, config.host_access);

  config.docker.binary = doc.get_string("docker.binary", config.docker.binary);
  config.docker.timeout_seconds = doc.get_int("docker.timeout", config.docker.timeout_seconds);
  config.docker.default_log_tail =
      doc.get_int("docker.default_log_tail", config.docker.default_log_tail);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.log_level =
      common::to_lower(doc.get_string("observability.log_level", config.observability.log_level));
  config.observability.audit_file = common::expand_path(
      doc.get_string("observability.audit_file", config.observability.audit_file));

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config_file(const std::filesystem::path &path) {
  auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string(),
                                           content.kind());
  }
  auto config = parse_config(content.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error(),
                                           config.kind());
  }
  apply_env_overrides(config.value());
  return config;
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error(), cfg_path_result.kind());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }
  return load_config_file(path);
}

void apply_env_overrides(Config &config) {
  if (const char *mode = std::getenv("HOSTGATE_SECURITY_MODE"); mode != nullptr && *mode != '\0') {
    config.security.mode = common::to_lower(mode);
  }
  if (const char *root = std::getenv("HOSTGATE_WORKSPACE_ROOT"); root != nullptr && *root != '\0') {
    config.host_access.workspace_root = common::expand_path(root);
  }
  if (const char *level = std::getenv("HOSTGATE_LOG_LEVEL"); level != nullptr && *level != '\0') {
    config.observability.log_level = common::to_lower(level);
  }
  if (const char *backend = std::getenv("HOSTGATE_OBSERVABILITY_BACKEND");
      backend != nullptr && *backend != '\0') {
    config.observability.backend = backend;
  }
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  const std::string &mode = config.security.mode;
  if (mode != "strict" && mode != "moderate" && mode != "permissive") {
    return common::Result<std::vector<std::string>>::failure(
        "invalid security mode: " + mode + " (must be strict, moderate, or permissive)",
        common::ErrorKind::InvalidArgument);
  }
  if (mode == "permissive") {
    warnings.push_back("security.mode is permissive: any command may be executed in "
                       "accessible containers");
  }

  const std::string &level = config.observability.log_level;
  if (level != "debug" && level != "info" && level != "warn" && level != "warning" &&
      level != "error") {
    return common::Result<std::vector<std::string>>::failure("invalid log level: " + level,
                                                             common::ErrorKind::InvalidArgument);
  }

  if (config.docker.timeout_seconds <= 0) {
    return common::Result<std::vector<std::string>>::failure(
        "invalid docker timeout: " + std::to_string(config.docker.timeout_seconds) +
            " (must be > 0)",
        common::ErrorKind::InvalidArgument);
  }

  const auto &tools = config.host_access.host_tools;
  if (tools.enabled && tools.timeout_seconds <= 0) {
    return common::Result<std::vector<std::string>>::failure(
        "invalid host_tools timeout: " + std::to_string(tools.timeout_seconds) +
            " (must be > 0)",
        common::ErrorKind::InvalidArgument);
  }
  if (tools.enabled && tools.approved_dir.empty()) {
    warnings.push_back("host_tools.approved_dir is empty: tools run from their directories "
                       "without approval (legacy mode)");
  }

  const auto &commands = config.host_access.host_commands;
  if (commands.enabled && config.host_access.workspace_root.empty()) {
    return common::Result<std::vector<std::string>>::failure(
        "host_access.workspace_root is required when host_commands is enabled",
        common::ErrorKind::InvalidArgument);
  }
  if (commands.enabled && commands.timeout_seconds <= 0) {
    return common::Result<std::vector<std::string>>::failure(
        "invalid host_commands timeout: " + std::to_string(commands.timeout_seconds) +
            " (must be > 0)",
        common::ErrorKind::InvalidArgument);
  }

  if (config.security.exec_dangerously.enabled &&
      config.security.exec_dangerously.commands.empty()) {
    warnings.push_back("security.exec_dangerously is enabled but no commands are listed");
  }

  for (const auto &pattern : config.security.output_masking.patterns) {
    std::string body = pattern;
    if (common::starts_with(body, "(?i)")) {
      body = body.substr(4);
    }
    try {
      std::regex compiled(body);
      (void)compiled;
    } catch (const std::regex_error &ex) {
      warnings.push_back("output_masking pattern will be skipped (" + std::string(ex.what()) +
                         "): " + pattern);
    }
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

std::string render_config(const Config &config) {
  std::ostringstream out;
  const auto &security = config.security;
  out << "[security]\n";
  out << "mode = " << common::quote_toml_string(security.mode) << "\n";
  render_list(out, "allowed_containers", security.allowed_containers);

  out << "\n[security.permissions]\n";
  out << "logs = " << toml_bool(security.permissions.logs) << "\n";
  out << "inspect = " << toml_bool(security.permissions.inspect) << "\n";
  out << "stats = " << toml_bool(security.permissions.stats) << "\n";
  out << "exec = " << toml_bool(security.permissions.exec) << "\n";
  out << "lifecycle = " << toml_bool(security.permissions.lifecycle) << "\n";

  render_table(out, "security.exec_whitelist", security.exec_whitelist);
  out << "\n[security.exec_dangerously]\n";
  out << "enabled = " << toml_bool(security.exec_dangerously.enabled) << "\n";
  render_table(out, "security.exec_dangerously.commands", security.exec_dangerously.commands);

  render_table(out, "security.blocked_paths.manual", security.blocked_paths.manual);
  const auto &auto_import = security.blocked_paths.auto_import;
  out << "\n[security.blocked_paths.auto_import]\n";
  out << "enabled = " << toml_bool(auto_import.enabled) << "\n";
  out << "workspace_root = " << common::quote_toml_string(auto_import.workspace_root) << "\n";
  render_list(out, "scan_files", auto_import.scan_files);
  render_list(out, "global_patterns", auto_import.global_patterns);
  for (const auto &[name, scan] :
       {std::pair<std::string, const SettingsScanConfig *>{"claude_code_settings",
                                                           &auto_import.claude_code_settings},
        std::pair<std::string, const SettingsScanConfig *>{"gemini_settings",
                                                           &auto_import.gemini_settings}}) {
    out << "\n[security.blocked_paths.auto_import." << name << "]\n";
    out << "enabled = " << toml_bool(scan->enabled) << "\n";
    out << "max_depth = " << scan->max_depth << "\n";
    render_list(out, "settings_files", scan->settings_files);
  }

  const auto &masking = security.output_masking;
  out << "\n[security.output_masking]\n";
  out << "enabled = " << toml_bool(masking.enabled) << "\n";
  out << "replacement = " << common::quote_toml_string(masking.replacement) << "\n";
  render_list(out, "patterns", masking.patterns);
  out << "\n[security.output_masking.apply_to]\n";
  out << "logs = " << toml_bool(masking.apply_to_logs) << "\n";
  out << "exec = " << toml_bool(masking.apply_to_exec) << "\n";
  out << "inspect = " << toml_bool(masking.apply_to_inspect) << "\n";

  out << "\n[security.host_path_masking]\n";
  out << "enabled = " << toml_bool(security.host_path_masking.enabled) << "\n";
  out << "replacement = " << common::quote_toml_string(security.host_path_masking.replacement)
      << "\n";

  const auto &host = config.host_access;
  out << "\n[host_access]\n";
  out << "workspace_root = " << common::quote_toml_string(host.workspace_root) << "\n";

  out << "\n[host_access.host_tools]\n";
  out << "enabled = " << toml_bool(host.host_tools.enabled) << "\n";
  render_list(out, "directories", host.host_tools.directories);
  out << "approved_dir = " << common::quote_toml_string(host.host_tools.approved_dir) << "\n";
  render_list(out, "staging_dirs", host.host_tools.staging_dirs);
  out << "common = " << toml_bool(host.host_tools.common) << "\n";
  render_list(out, "allowed_extensions", host.host_tools.allowed_extensions);
  out << "timeout = " << host.host_tools.timeout_seconds << "\n";

  out << "\n[host_access.host_commands]\n";
  out << "enabled = " << toml_bool(host.host_commands.enabled) << "\n";
  render_list(out, "allowed_containers", host.host_commands.allowed_containers);
  out << "timeout = " << host.host_commands.timeout_seconds << "\n";
  out << "blocked_path_scope = " << common::quote_toml_string(host.host_commands.blocked_path_scope)
      << "\n";
  render_table(out, "host_access.host_commands.whitelist", host.host_commands.whitelist);
  render_table(out, "host_access.host_commands.deny", host.host_commands.deny);
  out << "\n[host_access.host_commands.dangerously]\n";
  out << "enabled = " << toml_bool(host.host_commands.dangerously.enabled) << "\n";
  render_table(out, "host_access.host_commands.dangerously.commands",
               host.host_commands.dangerously.commands);

  out << "\n[docker]\n";
  out << "binary = " << common::quote_toml_string(config.docker.binary) << "\n";
  out << "timeout = " << config.docker.timeout_seconds << "\n";
  out << "default_log_tail = " << config.docker.default_log_tail << "\n";

  out << "\n[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  out << "log_level = " << common::quote_toml_string(config.observability.log_level) << "\n";
  if (!config.observability.audit_file.empty()) {
    out << "audit_file = " << common::quote_toml_string(config.observability.audit_file) << "\n";
  }
  return out.str();
}

} // namespace hostgate::config
