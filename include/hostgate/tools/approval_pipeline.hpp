#pragma once

#include "hostgate/common/result.hpp"
#include "hostgate/config/schema.hpp"

#include <cstddef>
#include <deque>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

namespace hostgate::tools {

enum class SyncStatus { New, Updated, Unchanged };

[[nodiscard]] const char *sync_status_name(SyncStatus status);

struct SyncItem {
  std::string name;
  std::string description;
  SyncStatus status = SyncStatus::New;
  std::filesystem::path staging_path;
  std::filesystem::path approved_path;
};

/// Missing approved copy is New; a size difference is Updated without
/// hashing; equal sizes compare SHA-256 digests.
[[nodiscard]] common::Result<SyncStatus> compare_files(const std::filesystem::path &staging,
                                                       const std::filesystem::path &approved);

/// Line-by-line diff of the approved copy against the staging copy, `-` for
/// approved lines and `+` for staging lines.
[[nodiscard]] common::Result<std::string> line_diff(const std::filesystem::path &staging,
                                                    const std::filesystem::path &approved);

enum class SyncDecision { Accept, Skip, ShowDiff };

/// Operator side of the approval loop: the pipeline presents an item, the
/// prompt answers, the pipeline applies the answer and reports back.
class ISyncPrompt {
public:
  virtual ~ISyncPrompt() = default;

  /// `diff_available` is true for Updated items, which may answer ShowDiff.
  [[nodiscard]] virtual SyncDecision ask(const SyncItem &item, bool diff_available) = 0;
  virtual void show_diff(const SyncItem &item, const std::string &diff) = 0;
  virtual void report(const SyncItem &item, const std::string &outcome) = 0;
};

/// Answers from a fixed decision list; runs out into Skip.
class ScriptedSyncPrompt final : public ISyncPrompt {
public:
  explicit ScriptedSyncPrompt(std::vector<SyncDecision> decisions);

  [[nodiscard]] SyncDecision ask(const SyncItem &item, bool diff_available) override;
  void show_diff(const SyncItem &item, const std::string &diff) override;
  void report(const SyncItem &item, const std::string &outcome) override;

  [[nodiscard]] const std::vector<std::string> &asked() const { return asked_; }
  [[nodiscard]] const std::vector<std::string> &diffs() const { return diffs_; }
  [[nodiscard]] const std::vector<std::string> &outcomes() const { return outcomes_; }

private:
  std::deque<SyncDecision> decisions_;
  std::vector<std::string> asked_;
  std::vector<std::string> diffs_;
  std::vector<std::string> outcomes_;
};

/// Line-oriented terminal prompt: "y"/"yes" accepts, "d"/"diff" shows the
/// diff of an updated tool, anything else (including end of input) skips.
class StreamSyncPrompt final : public ISyncPrompt {
public:
  StreamSyncPrompt(std::istream &in, std::ostream &out);

  [[nodiscard]] SyncDecision ask(const SyncItem &item, bool diff_available) override;
  void show_diff(const SyncItem &item, const std::string &diff) override;
  void report(const SyncItem &item, const std::string &outcome) override;

private:
  std::istream &in_;
  std::ostream &out_;
};

struct SyncFailure {
  std::string name;
  std::string error;
};

struct SyncReport {
  std::vector<SyncItem> items;
  std::size_t copied = 0;
  std::size_t skipped = 0;
  std::vector<SyncFailure> failures;

  [[nodiscard]] bool up_to_date() const;
};

/// Write side of host tools: copies operator-approved staging scripts into the
/// project's approved directory.
class ApprovalPipeline {
public:
  ApprovalPipeline(config::HostToolsConfig config, std::filesystem::path workspace_root);

  [[nodiscard]] common::Result<std::filesystem::path> approved_dir() const;

  [[nodiscard]] common::Result<std::vector<SyncItem>> detect_changes() const;

  /// Every run writes the `.project` marker. Per-item copy failures are
  /// recorded in the report and do not stop the remaining items.
  [[nodiscard]] common::Result<SyncReport> run_interactive_sync(ISyncPrompt &prompt) const;

private:
  [[nodiscard]] std::vector<std::filesystem::path> staging_dirs() const;

  config::HostToolsConfig config_;
  std::filesystem::path workspace_root_;
};

} // namespace hostgate::tools
