#include "hostgate/security/blocked_paths.hpp"

#include "hostgate/common/fs.hpp"
#include "hostgate/common/json_util.hpp"
#include "hostgate/observability/global.hpp"
#include "hostgate/security/pattern.hpp"

#include <algorithm>
#include <regex>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace hostgate::security {

namespace {

constexpr const char *kComponent = "blocked_paths";

std::vector<std::string> split(const std::string &value, const char separator) {
  std::vector<std::string> parts;
  std::string part;
  std::istringstream stream(value);
  while (std::getline(stream, part, separator)) {
    parts.push_back(part);
  }
  if (!value.empty() && value.back() == separator) {
    parts.emplace_back();
  }
  return parts;
}

std::string basename_of(const std::string &clean) {
  if (clean == "/") {
    return "/";
  }
  const auto slash = clean.find_last_of('/');
  return slash == std::string::npos ? clean : clean.substr(slash + 1);
}

bool is_compose_file(const std::string &name) {
  return common::ends_with(name, "docker-compose.yml") ||
         common::ends_with(name, "docker-compose.yaml") || common::ends_with(name, "compose.yml") ||
         common::ends_with(name, "compose.yaml");
}

bool skip_scan_directory(const std::string &name) {
  return common::starts_with(name, ".") || name == "node_modules" || name == "vendor" ||
         name == "__pycache__";
}

} // namespace

const char *block_source_name(const BlockSource source) {
  switch (source) {
  case BlockSource::Manual:
    return "manual";
  case BlockSource::AutoImported:
    return "auto-imported";
  }
  return "manual";
}

std::string BlockedPath::describe() const {
  std::string out = "path matches blocked pattern '" + pattern + "'";
  out += is_global() ? " (all containers" : " (container " + scope;
  out += ", reason: " + reason;
  if (!source.empty()) {
    out += ", source: " + source;
  }
  out += ")";
  return out;
}

bool blocked_pattern_matches(const std::string &path, const std::string &pattern) {
  if (pattern.empty()) {
    return false;
  }
  const std::string clean = common::clean_path(path);
  const std::string pat = common::clean_path(pattern);

  if (clean == pat) {
    return true;
  }

  if (pat.find('/') == std::string::npos) {
    const std::string base = basename_of(clean);
    if (base == pat || glob_match(pat, base)) {
      return true;
    }
  }

  for (const std::string suffix : {"/*", "/**"}) {
    if (!common::ends_with(pat, suffix)) {
      continue;
    }
    const std::string dir_with_slash = pat.substr(0, pat.size() - suffix.size()) + "/";
    if (common::starts_with(clean, dir_with_slash) ||
        (dir_with_slash.front() != '/' && clean.find("/" + dir_with_slash) != std::string::npos)) {
      return true;
    }
  }

  // "**/name" style patterns match at any directory boundary.
  if (common::starts_with(pat, "**/")) {
    const std::string rest = pat.substr(3);
    for (std::size_t pos = 0; pos != std::string::npos; pos = clean.find('/', pos + 1)) {
      const std::string tail = clean.substr(pos == 0 && clean.front() != '/' ? 0 : pos + 1);
      if (blocked_pattern_matches(tail, rest)) {
        return true;
      }
    }
  }

  return glob_match(pat, clean);
}

void BlockedPathIndex::add(BlockedPath entry) { entries_.push_back(std::move(entry)); }

void BlockedPathIndex::add_all(std::vector<BlockedPath> entries) {
  for (auto &entry : entries) {
    entries_.push_back(std::move(entry));
  }
}

std::optional<BlockedPath> BlockedPathIndex::find(const std::string &scope,
                                                  const std::string &path) const {
  for (const auto &entry : entries_) {
    if (!entry.is_global() && entry.scope == scope &&
        blocked_pattern_matches(path, entry.pattern)) {
      return entry;
    }
  }
  for (const auto &entry : entries_) {
    if (entry.is_global() && blocked_pattern_matches(path, entry.pattern)) {
      return entry;
    }
  }
  return std::nullopt;
}

std::vector<BlockedPath> BlockedPathIndex::entries_for(const std::string &scope) const {
  std::vector<BlockedPath> out;
  for (const auto &entry : entries_) {
    if (entry.is_global() || entry.scope == scope) {
      out.push_back(entry);
    }
  }
  return out;
}

BlockedPathImporter::BlockedPathImporter(config::AutoImportConfig config,
                                         std::vector<std::string> known_containers)
    : config_(std::move(config)), known_containers_(std::move(known_containers)) {}

bool BlockedPathImporter::is_known_container(const std::string &segment) const {
  if (segment.empty()) {
    return false;
  }
  for (const auto &container : known_containers_) {
    if (segment == container) {
      return true;
    }
    if (container.find('*') != std::string::npos && glob_match(container, segment)) {
      return true;
    }
  }
  return false;
}

std::optional<BlockedPath> BlockedPathImporter::from_mount_target(const std::string &target,
                                                                  const std::string &source,
                                                                  const std::string &reason) const {
  const auto parts = split(target, '/');
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (!is_known_container(parts[i])) {
      continue;
    }
    std::vector<std::string> rest(parts.begin() + static_cast<long>(i + 1), parts.end());
    std::string pattern = "/" + common::join(rest, "/");
    if (pattern == "/") {
      pattern = "/*";
    }
    return BlockedPath{.scope = parts[i],
                       .pattern = pattern,
                       .reason = reason,
                       .source = source,
                       .original_path = target,
                       .origin = BlockSource::AutoImported};
  }

  const std::string base = basename_of(common::clean_path(target));
  if (base.empty() || base == "." || base == "/") {
    return std::nullopt;
  }
  return BlockedPath{.scope = kAnyContainer,
                     .pattern = base,
                     .reason = reason,
                     .source = source,
                     .original_path = target,
                     .origin = BlockSource::AutoImported};
}

common::Result<std::vector<BlockedPath>>
BlockedPathImporter::parse_compose_file(const std::filesystem::path &path) const {
  std::vector<BlockedPath> out;
  const std::string source = path.string();
  try {
    const YAML::Node root = YAML::LoadFile(source);
    const YAML::Node services = root["services"];
    if (!services || !services.IsMap()) {
      return common::Result<std::vector<BlockedPath>>::success(std::move(out));
    }

    auto push = [&](const std::string &target, const std::string &reason) {
      if (auto blocked = from_mount_target(target, source, reason); blocked.has_value()) {
        out.push_back(std::move(*blocked));
      }
    };

    for (const auto &service : services) {
      const YAML::Node spec = service.second;
      if (!spec.IsMap()) {
        continue;
      }

      const YAML::Node volumes = spec["volumes"];
      if (volumes && volumes.IsSequence()) {
        for (const auto &volume : volumes) {
          if (volume.IsScalar()) {
            const auto text = volume.as<std::string>();
            if (common::starts_with(text, "/dev/null:")) {
              const auto parts = split(text, ':');
              if (parts.size() >= 2 && !parts[1].empty()) {
                push(parts[1], "volume_mount_to_dev_null");
              }
            }
          } else if (volume.IsMap()) {
            const std::string type = volume["type"] ? volume["type"].as<std::string>() : "";
            const std::string src = volume["source"] ? volume["source"].as<std::string>() : "";
            const std::string target =
                volume["target"] ? volume["target"].as<std::string>() : "";
            if (target.empty()) {
              continue;
            }
            if (src == "/dev/null") {
              push(target, "volume_mount_to_dev_null");
            } else if (type == "tmpfs") {
              push(target, "tmpfs_mount");
            }
          }
        }
      }

      const YAML::Node tmpfs = spec["tmpfs"];
      if (tmpfs && tmpfs.IsScalar()) {
        push(split(tmpfs.as<std::string>(), ':').front(), "tmpfs_mount");
      } else if (tmpfs && tmpfs.IsSequence()) {
        for (const auto &entry : tmpfs) {
          if (entry.IsScalar()) {
            push(split(entry.as<std::string>(), ':').front(), "tmpfs_mount");
          }
        }
      }
    }
  } catch (const YAML::Exception &ex) {
    return common::Result<std::vector<BlockedPath>>::failure(
        "invalid compose file " + source + ": " + ex.what(), common::ErrorKind::ParseError);
  }
  return common::Result<std::vector<BlockedPath>>::success(std::move(out));
}

common::Result<std::vector<BlockedPath>>
BlockedPathImporter::parse_devcontainer_file(const std::filesystem::path &path) const {
  auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<std::vector<BlockedPath>>::failure(content.error(), content.kind());
  }

  static const std::regex dev_null_mount(R"re(source=/dev/null[^"]*target=([^,"]+))re");
  static const std::regex tmpfs_mount(R"re(type=(?:tmpfs|volume)[^"]*target=([^,"]+))re");

  std::vector<BlockedPath> out;
  const std::string &text = content.value();
  const std::string source = path.string();
  for (const auto &[re, reason] : {std::pair<const std::regex *, const char *>{
                                       &dev_null_mount, "devcontainer_bind_mount"},
                                   std::pair<const std::regex *, const char *>{
                                       &tmpfs_mount, "devcontainer_tmpfs_mount"}}) {
    for (auto it = std::sregex_iterator(text.begin(), text.end(), *re);
         it != std::sregex_iterator(); ++it) {
      if (auto blocked = from_mount_target((*it)[1].str(), source, reason); blocked.has_value()) {
        out.push_back(std::move(*blocked));
      }
    }
  }
  return common::Result<std::vector<BlockedPath>>::success(std::move(out));
}

common::Result<std::vector<BlockedPath>>
BlockedPathImporter::parse_claude_settings(const std::filesystem::path &path) const {
  auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<std::vector<BlockedPath>>::failure(content.error(), content.kind());
  }
  const std::string text = common::trim(content.value());
  if (text.empty() || text.front() != '{' || text.back() != '}') {
    return common::Result<std::vector<BlockedPath>>::failure(
        "settings file is not a JSON object: " + path.string(), common::ErrorKind::ParseError);
  }

  static const std::regex read_rule(R"re(^Read\(([^)]+)\)$)re");
  const std::string permissions = common::json_get_object(text, "permissions");
  std::vector<BlockedPath> out;
  for (const auto &deny : common::json_get_string_array(permissions, "deny")) {
    std::smatch match;
    if (!std::regex_match(deny, match, read_rule)) {
      continue;
    }
    std::string pattern = match[1].str();
    if (common::starts_with(pattern, "./")) {
      pattern = pattern.substr(2);
    }

    BlockedPath blocked{.scope = kAnyContainer,
                        .pattern = pattern,
                        .reason = "claude_code_settings_deny",
                        .source = path.string(),
                        .original_path = pattern,
                        .origin = BlockSource::AutoImported};
    const auto parts = split(pattern, '/');
    for (std::size_t i = 0; i < parts.size(); ++i) {
      if (parts[i].find('*') != std::string::npos || !is_known_container(parts[i])) {
        continue;
      }
      std::vector<std::string> rest(parts.begin() + static_cast<long>(i + 1), parts.end());
      const std::string file_pattern = common::join(rest, "/");
      blocked.scope = parts[i];
      blocked.pattern = file_pattern.empty() ? pattern : file_pattern;
      break;
    }
    out.push_back(std::move(blocked));
  }
  return common::Result<std::vector<BlockedPath>>::success(std::move(out));
}

common::Result<std::vector<BlockedPath>>
BlockedPathImporter::parse_ignore_file(const std::filesystem::path &path) const {
  auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<std::vector<BlockedPath>>::failure(content.error(), content.kind());
  }

  std::vector<BlockedPath> out;
  std::istringstream stream(content.value());
  std::string line;
  while (std::getline(stream, line)) {
    std::string pattern = common::trim(line);
    // Negations cannot be expressed as a block and are dropped.
    if (pattern.empty() || pattern.front() == '#' || pattern.front() == '!') {
      continue;
    }
    if (pattern.back() == '/') {
      pattern += "*";
    }
    if (pattern.front() == '/') {
      pattern = pattern.substr(1);
    }
    if (pattern.empty()) {
      continue;
    }
    out.push_back(BlockedPath{.scope = kAnyContainer,
                              .pattern = pattern,
                              .reason = "ai_exclude_file",
                              .source = path.string(),
                              .original_path = pattern,
                              .origin = BlockSource::AutoImported});
  }
  return common::Result<std::vector<BlockedPath>>::success(std::move(out));
}

void BlockedPathImporter::import_file(const std::filesystem::path &path, FileParser parser,
                                      std::vector<BlockedPath> &out) const {
  auto parsed = (this->*parser)(path);
  if (!parsed.ok()) {
    observability::record_warning(kComponent, "skipping " + path.string() + ": " + parsed.error());
    return;
  }
  observability::record_blocked_paths_imported(path.string(), parsed.value().size());
  for (auto &entry : parsed.value()) {
    out.push_back(std::move(entry));
  }
}

void BlockedPathImporter::scan_settings_below(const std::filesystem::path &dir,
                                              const config::SettingsScanConfig &scan,
                                              const int depth, FileParser parser,
                                              std::vector<BlockedPath> &out) const {
  if (depth > scan.max_depth) {
    return;
  }

  std::error_code ec;
  std::vector<std::filesystem::path> subdirs;
  for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code type_ec;
    if (!it->is_directory(type_ec) || skip_scan_directory(it->path().filename().string())) {
      continue;
    }
    subdirs.push_back(it->path());
  }
  std::sort(subdirs.begin(), subdirs.end());

  for (const auto &subdir : subdirs) {
    for (const auto &name : scan.settings_files) {
      const auto candidate = subdir / name;
      std::error_code exists_ec;
      if (std::filesystem::is_regular_file(candidate, exists_ec)) {
        import_file(candidate, parser, out);
      }
    }
    if (depth < scan.max_depth) {
      scan_settings_below(subdir, scan, depth + 1, parser, out);
    }
  }
}

void BlockedPathImporter::scan_settings(const config::SettingsScanConfig &scan, FileParser parser,
                                        std::vector<BlockedPath> &out) const {
  if (!scan.enabled) {
    return;
  }
  const std::filesystem::path root =
      config_.workspace_root.empty() ? std::filesystem::path(".") : std::filesystem::path(config_.workspace_root);
  for (const auto &name : scan.settings_files) {
    const auto candidate = root / name;
    std::error_code ec;
    if (std::filesystem::is_regular_file(candidate, ec)) {
      import_file(candidate, parser, out);
    }
  }
  if (scan.max_depth > 0) {
    scan_settings_below(root, scan, 1, parser, out);
  }
}

std::vector<BlockedPath> BlockedPathImporter::import_all() const {
  std::vector<BlockedPath> out;
  const std::filesystem::path root =
      config_.workspace_root.empty() ? std::filesystem::path(".") : std::filesystem::path(config_.workspace_root);

  for (const auto &scan_file : config_.scan_files) {
    const auto full_path = root / scan_file;
    std::error_code ec;
    if (!std::filesystem::exists(full_path, ec)) {
      continue;
    }
    if (is_compose_file(scan_file)) {
      import_file(full_path, &BlockedPathImporter::parse_compose_file, out);
    } else if (common::ends_with(scan_file, "devcontainer.json")) {
      import_file(full_path, &BlockedPathImporter::parse_devcontainer_file, out);
    } else {
      observability::record_warning(kComponent, "unsupported scan file type: " + scan_file);
    }
  }

  scan_settings(config_.claude_code_settings, &BlockedPathImporter::parse_claude_settings, out);
  scan_settings(config_.gemini_settings, &BlockedPathImporter::parse_ignore_file, out);
  return out;
}

BlockedPathIndex build_blocked_path_index(const config::BlockedPathsConfig &config,
                                          const std::vector<std::string> &known_containers) {
  BlockedPathIndex index;
  for (const auto &[scope, patterns] : config.manual) {
    for (const auto &pattern : patterns) {
      index.add(BlockedPath{.scope = scope,
                            .pattern = pattern,
                            .reason = "manual_block",
                            .source = "config",
                            .original_path = pattern,
                            .origin = BlockSource::Manual});
    }
  }
  for (const auto &pattern : config.auto_import.global_patterns) {
    index.add(BlockedPath{.scope = kAnyContainer,
                          .pattern = pattern,
                          .reason = "global_pattern",
                          .source = "config",
                          .original_path = pattern,
                          .origin = BlockSource::Manual});
  }
  if (config.auto_import.enabled) {
    BlockedPathImporter importer(config.auto_import, known_containers);
    index.add_all(importer.import_all());
  }
  return index;
}

} // namespace hostgate::security
