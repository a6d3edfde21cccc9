#include "hostgate/tools/approval_pipeline.hpp"

#include "hostgate/common/fs.hpp"
#include "hostgate/common/hash.hpp"
#include "hostgate/common/json_util.hpp"
#include "hostgate/observability/global.hpp"
#include "hostgate/tools/project.hpp"
#include "hostgate/tools/tool_parser.hpp"

#include <algorithm>
#include <istream>
#include <ostream>
#include <sstream>

namespace hostgate::tools {

namespace {

constexpr const char *kComponent = "approval";

using common::ErrorKind;

std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (true) {
    const auto newline = text.find('\n', start);
    if (newline == std::string::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, newline - start));
    start = newline + 1;
  }
  return lines;
}

common::Status copy_preserving_mode(const std::filesystem::path &from,
                                    const std::filesystem::path &to) {
  std::error_code ec;
  std::filesystem::create_directories(to.parent_path(), ec);
  if (ec) {
    return common::Status::error("creating " + to.parent_path().string() + ": " + ec.message());
  }
  std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    return common::Status::error("copying " + from.string() + ": " + ec.message());
  }
  const auto perms = std::filesystem::status(from, ec).permissions();
  if (ec) {
    return common::Status::error("reading mode of " + from.string() + ": " + ec.message());
  }
  std::filesystem::permissions(to, perms, std::filesystem::perm_options::replace, ec);
  if (ec) {
    return common::Status::error("setting mode of " + to.string() + ": " + ec.message());
  }
  return common::Status::success();
}

std::string trimmed_lower_line(std::istream &in, bool &eof) {
  std::string line;
  if (!std::getline(in, line)) {
    eof = true;
    return "";
  }
  return common::to_lower(common::trim(line));
}

} // namespace

const char *sync_status_name(const SyncStatus status) {
  switch (status) {
  case SyncStatus::New:
    return "new";
  case SyncStatus::Updated:
    return "updated";
  case SyncStatus::Unchanged:
    return "unchanged";
  }
  return "new";
}

common::Result<SyncStatus> compare_files(const std::filesystem::path &staging,
                                         const std::filesystem::path &approved) {
  std::error_code ec;
  if (!std::filesystem::exists(approved, ec)) {
    if (ec) {
      return common::Result<SyncStatus>::failure(approved.string() + ": " + ec.message());
    }
    return common::Result<SyncStatus>::success(SyncStatus::New);
  }
  const auto approved_size = std::filesystem::file_size(approved, ec);
  if (ec) {
    return common::Result<SyncStatus>::failure(approved.string() + ": " + ec.message());
  }
  const auto staging_size = std::filesystem::file_size(staging, ec);
  if (ec) {
    return common::Result<SyncStatus>::failure(staging.string() + ": " + ec.message(),
                                               ErrorKind::NotFound);
  }
  if (approved_size != staging_size) {
    return common::Result<SyncStatus>::success(SyncStatus::Updated);
  }

  auto staging_hash = common::sha256_file_hex(staging);
  if (!staging_hash.ok()) {
    return common::Result<SyncStatus>::failure(staging_hash.error(), staging_hash.kind());
  }
  auto approved_hash = common::sha256_file_hex(approved);
  if (!approved_hash.ok()) {
    return common::Result<SyncStatus>::failure(approved_hash.error(), approved_hash.kind());
  }
  return common::Result<SyncStatus>::success(staging_hash.value() == approved_hash.value()
                                                 ? SyncStatus::Unchanged
                                                 : SyncStatus::Updated);
}

common::Result<std::string> line_diff(const std::filesystem::path &staging,
                                      const std::filesystem::path &approved) {
  auto staging_text = common::read_file(staging);
  if (!staging_text.ok()) {
    return common::Result<std::string>::failure("reading staging file: " + staging_text.error(),
                                                staging_text.kind());
  }
  auto approved_text = common::read_file(approved);
  if (!approved_text.ok()) {
    return common::Result<std::string>::failure("reading approved file: " + approved_text.error(),
                                                approved_text.kind());
  }

  const auto staging_lines = split_lines(staging_text.value());
  const auto approved_lines = split_lines(approved_text.value());
  std::ostringstream out;
  out << "--- approved (current)\n+++ staging (new)\n";
  const std::size_t count = std::max(staging_lines.size(), approved_lines.size());
  for (std::size_t i = 0; i < count; ++i) {
    const std::string current = i < approved_lines.size() ? approved_lines[i] : "";
    const std::string next = i < staging_lines.size() ? staging_lines[i] : "";
    if (current == next) {
      continue;
    }
    if (i < approved_lines.size()) {
      out << "- " << current << "\n";
    }
    if (i < staging_lines.size()) {
      out << "+ " << next << "\n";
    }
  }
  return common::Result<std::string>::success(out.str());
}

ScriptedSyncPrompt::ScriptedSyncPrompt(std::vector<SyncDecision> decisions)
    : decisions_(decisions.begin(), decisions.end()) {}

SyncDecision ScriptedSyncPrompt::ask(const SyncItem &item, bool) {
  asked_.push_back(item.name);
  if (decisions_.empty()) {
    return SyncDecision::Skip;
  }
  const SyncDecision decision = decisions_.front();
  decisions_.pop_front();
  return decision;
}

void ScriptedSyncPrompt::show_diff(const SyncItem &, const std::string &diff) {
  diffs_.push_back(diff);
}

void ScriptedSyncPrompt::report(const SyncItem &item, const std::string &outcome) {
  outcomes_.push_back(item.name + ": " + outcome);
}

StreamSyncPrompt::StreamSyncPrompt(std::istream &in, std::ostream &out) : in_(in), out_(out) {}

SyncDecision StreamSyncPrompt::ask(const SyncItem &item, const bool diff_available) {
  out_ << "  " << (item.status == SyncStatus::New ? "New" : "Updated") << " tool found:\n";
  out_ << "    " << item.name;
  if (!item.description.empty()) {
    out_ << " - \"" << item.description << "\"";
  }
  out_ << "\n    Source: " << item.staging_path.string() << "\n";
  if (diff_available) {
    out_ << "    -> Update " << item.approved_path.string() << "? [y/N/d(iff)] ";
  } else {
    out_ << "    -> Copy to " << item.approved_path.string() << "? [y/N] ";
  }
  out_.flush();

  bool eof = false;
  const std::string answer = trimmed_lower_line(in_, eof);
  if (eof) {
    out_ << "\n";
    return SyncDecision::Skip;
  }
  if (answer == "y" || answer == "yes") {
    return SyncDecision::Accept;
  }
  if (diff_available && (answer == "d" || answer == "diff")) {
    return SyncDecision::ShowDiff;
  }
  return SyncDecision::Skip;
}

void StreamSyncPrompt::show_diff(const SyncItem &, const std::string &diff) {
  std::istringstream lines(diff);
  std::string line;
  while (std::getline(lines, line)) {
    out_ << "    " << line << "\n";
  }
}

void StreamSyncPrompt::report(const SyncItem &, const std::string &outcome) {
  out_ << "    " << outcome << "\n\n";
}

bool SyncReport::up_to_date() const {
  return std::all_of(items.begin(), items.end(),
                     [](const SyncItem &item) { return item.status == SyncStatus::Unchanged; });
}

ApprovalPipeline::ApprovalPipeline(config::HostToolsConfig config,
                                   std::filesystem::path workspace_root)
    : config_(std::move(config)), workspace_root_(common::absolute_clean(workspace_root)) {}

common::Result<std::filesystem::path> ApprovalPipeline::approved_dir() const {
  return project_approved_dir(config_.approved_dir, workspace_root_);
}

std::vector<std::filesystem::path> ApprovalPipeline::staging_dirs() const {
  const auto &configured =
      config_.staging_dirs.empty() ? config_.directories : config_.staging_dirs;
  std::vector<std::filesystem::path> dirs;
  for (const auto &dir : configured) {
    const std::filesystem::path path(common::expand_path(dir));
    dirs.push_back(path.is_absolute() ? path : workspace_root_ / path);
  }
  return dirs;
}

common::Result<std::vector<SyncItem>> ApprovalPipeline::detect_changes() const {
  auto approved = approved_dir();
  if (!approved.ok()) {
    return common::Result<std::vector<SyncItem>>::failure(
        "resolving approved directory: " + approved.error(), approved.kind());
  }

  std::vector<SyncItem> items;
  for (const auto &dir : staging_dirs()) {
    auto tools = list_tools_in_dir(dir, config_.allowed_extensions);
    if (!tools.ok()) {
      continue;
    }
    for (const auto &tool : tools.value()) {
      if (auto status = validate_tool_name(tool.name); !status.ok()) {
        continue;
      }
      SyncItem item{.name = tool.name,
                    .description = tool.description,
                    .status = SyncStatus::New,
                    .staging_path = dir / tool.name,
                    .approved_path = approved.value() / tool.name};
      auto status = compare_files(item.staging_path, item.approved_path);
      if (!status.ok()) {
        return common::Result<std::vector<SyncItem>>::failure(
            "comparing " + tool.name + ": " + status.error(), status.kind());
      }
      item.status = status.value();
      items.push_back(std::move(item));
    }
  }
  return common::Result<std::vector<SyncItem>>::success(std::move(items));
}

common::Result<SyncReport> ApprovalPipeline::run_interactive_sync(ISyncPrompt &prompt) const {
  auto items = detect_changes();
  if (!items.ok()) {
    return common::Result<SyncReport>::failure(items.error(), items.kind());
  }
  auto approved = approved_dir();
  if (!approved.ok()) {
    return common::Result<SyncReport>::failure(approved.error(), approved.kind());
  }
  auto created = common::ensure_dir(approved.value());
  if (!created.ok()) {
    return common::Result<SyncReport>::failure("creating approved directory " +
                                                   approved.value().string() + ": " +
                                                   created.error(),
                                               created.kind());
  }

  const std::string meta = "{\n  \"workspace\": \"" + common::json_escape(workspace_root_.string()) +
                           "\"\n}\n";
  if (auto written = common::write_file(approved.value() / kProjectMetaFile, meta);
      !written.ok()) {
    observability::record_warning(kComponent,
                                  "failed to write project metadata: " + written.error());
  }

  SyncReport report;
  report.items = items.value();
  for (const auto &item : report.items) {
    if (item.status == SyncStatus::Unchanged) {
      continue;
    }
    const bool updated = item.status == SyncStatus::Updated;
    SyncDecision decision = prompt.ask(item, updated);
    if (decision == SyncDecision::ShowDiff) {
      auto diff = line_diff(item.staging_path, item.approved_path);
      prompt.show_diff(item, diff.ok() ? diff.value() : "error: " + diff.error());
      decision = prompt.ask(item, false);
    }

    if (decision != SyncDecision::Accept) {
      ++report.skipped;
      prompt.report(item, "skipped");
      observability::record_tool_sync(item.name, "skipped");
      continue;
    }

    if (auto copied = copy_preserving_mode(item.staging_path, item.approved_path); !copied.ok()) {
      report.failures.push_back(SyncFailure{.name = item.name, .error = copied.error()});
      prompt.report(item, "error: " + copied.error());
      observability::record_error(kComponent, item.name + ": " + copied.error());
      continue;
    }
    ++report.copied;
    prompt.report(item, updated ? "updated" : "copied");
    observability::record_tool_sync(item.name, updated ? "updated" : "copied");
  }
  return common::Result<SyncReport>::success(std::move(report));
}

} // namespace hostgate::tools
