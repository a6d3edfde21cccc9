#pragma once

#include "hostgate/common/result.hpp"
#include "hostgate/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace hostgate::security {

inline constexpr const char *kAnyContainer = "*";

enum class BlockSource { Manual, AutoImported };

[[nodiscard]] const char *block_source_name(BlockSource source);

struct BlockedPath {
  std::string scope = kAnyContainer;
  std::string pattern;
  std::string reason;
  std::string source;
  std::string original_path;
  BlockSource origin = BlockSource::Manual;

  [[nodiscard]] bool is_global() const { return scope == kAnyContainer; }
  /// One-line explanation suitable for returning to the caller.
  [[nodiscard]] std::string describe() const;
};

/// Path-vs-pattern rules, tried in order after lexical cleanup of both sides:
///   1. exact equality;
///   2. a pattern without `/` matches the basename (literally or as a glob);
///   3. a pattern ending in `/*` matches anything below that directory name;
///   4. a full-path glob.
[[nodiscard]] bool blocked_pattern_matches(const std::string &path, const std::string &pattern);

class BlockedPathIndex {
public:
  void add(BlockedPath entry);
  void add_all(std::vector<BlockedPath> entries);

  /// Scope-specific entries are consulted before global ones; the first
  /// matching entry is returned so callers can explain the refusal.
  [[nodiscard]] std::optional<BlockedPath> find(const std::string &scope,
                                                const std::string &path) const;

  [[nodiscard]] const std::vector<BlockedPath> &entries() const { return entries_; }
  [[nodiscard]] std::vector<BlockedPath> entries_for(const std::string &scope) const;
  [[nodiscard]] std::size_t size() const { return entries_.size(); }
  [[nodiscard]] bool empty() const { return entries_.empty(); }

private:
  std::vector<BlockedPath> entries_;
};

/// Scans compose files, devcontainer definitions and AI-tool settings for paths
/// the workspace already hides from its containers. Every per-file failure is
/// logged and skipped; the scan as a whole never fails.
class BlockedPathImporter {
public:
  BlockedPathImporter(config::AutoImportConfig config, std::vector<std::string> known_containers);

  [[nodiscard]] std::vector<BlockedPath> import_all() const;

  [[nodiscard]] common::Result<std::vector<BlockedPath>>
  parse_compose_file(const std::filesystem::path &path) const;
  [[nodiscard]] common::Result<std::vector<BlockedPath>>
  parse_devcontainer_file(const std::filesystem::path &path) const;
  [[nodiscard]] common::Result<std::vector<BlockedPath>>
  parse_claude_settings(const std::filesystem::path &path) const;
  [[nodiscard]] common::Result<std::vector<BlockedPath>>
  parse_ignore_file(const std::filesystem::path &path) const;

  /// Maps a mount target to a blocked entry: the segment naming a known
  /// container becomes the scope and the remainder the pattern, otherwise the
  /// basename becomes a global pattern.
  [[nodiscard]] std::optional<BlockedPath> from_mount_target(const std::string &target,
                                                             const std::string &source,
                                                             const std::string &reason) const;

private:
  using FileParser = common::Result<std::vector<BlockedPath>> (BlockedPathImporter::*)(
      const std::filesystem::path &) const;

  void scan_settings(const config::SettingsScanConfig &scan, FileParser parser,
                     std::vector<BlockedPath> &out) const;
  void scan_settings_below(const std::filesystem::path &dir, const config::SettingsScanConfig &scan,
                           int depth, FileParser parser, std::vector<BlockedPath> &out) const;
  void import_file(const std::filesystem::path &path, FileParser parser,
                   std::vector<BlockedPath> &out) const;
  [[nodiscard]] bool is_known_container(const std::string &segment) const;

  config::AutoImportConfig config_;
  std::vector<std::string> known_containers_;
};

/// Manual entries, then the configured global patterns, then (when enabled)
/// auto-imported entries.
[[nodiscard]] BlockedPathIndex build_blocked_path_index(const config::BlockedPathsConfig &config,
                                                        const std::vector<std::string> &known_containers);

} // namespace hostgate::security
