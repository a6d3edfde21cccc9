#include "hostgate/security/output_masking.hpp"

#include "hostgate/common/fs.hpp"
#include "hostgate/observability/global.hpp"

#include <array>
#include <optional>
#include <string_view>

namespace hostgate::security {

namespace {

constexpr const char *kComponent = "output_masking";
constexpr std::string_view kPathTerminators = "\"' ,]}\n\t";
constexpr std::size_t kMaxMaskSegment = 8192;

std::optional<std::regex> compile_rule(const std::string &pattern, std::string &error) {
  std::string body = pattern;
  auto flags = std::regex::ECMAScript;
  if (common::starts_with(body, "(?i)")) {
    body = body.substr(4);
    flags |= std::regex::icase;
  }
  try {
    return std::regex(body, flags);
  } catch (const std::regex_error &ex) {
    error = ex.what();
    return std::nullopt;
  }
}

// Replaces `prefix` plus the following account-name segment (up to a separator
// or a terminator) with `replacement`.
std::string mask_account_segment(const std::string &input, const std::string &prefix,
                                 const std::string &replacement, const std::string_view separators) {
  std::string result = input;
  std::size_t start = 0;
  while (true) {
    const auto idx = result.find(prefix, start);
    if (idx == std::string::npos) {
      break;
    }
    const std::size_t name_start = idx + prefix.size();
    std::size_t name_end = name_start;
    while (name_end < result.size() && separators.find(result[name_end]) == std::string_view::npos &&
           kPathTerminators.find(result[name_end]) == std::string_view::npos) {
      ++name_end;
    }
    if (name_end > name_start) {
      result.replace(idx, name_end - idx, replacement);
      start = idx + replacement.size();
    } else {
      start = idx + 1;
    }
  }
  return result;
}

// One piece per line. Lines longer than kMaxMaskSegment are cut after the last
// blank inside the window (or hard at the limit when there is none), so no
// regex run ever scans more than kMaxMaskSegment bytes.
std::vector<std::string_view> mask_segments(const std::string_view text) {
  std::vector<std::string_view> segments;
  std::size_t pos = 0;
  while (pos < text.size()) {
    const auto newline = text.find('\n', pos);
    std::size_t end = newline == std::string_view::npos ? text.size() : newline + 1;
    if (end - pos > kMaxMaskSegment) {
      end = pos + kMaxMaskSegment;
      const auto blank = text.find_last_of(" \t", end - 1);
      if (blank != std::string_view::npos && blank >= pos) {
        end = blank + 1;
      }
    }
    segments.push_back(text.substr(pos, end - pos));
    pos = end;
  }
  return segments;
}

} // namespace

bool MaskingRule::applies_to(const MaskTarget target) const {
  switch (target) {
  case MaskTarget::Logs:
    return logs;
  case MaskTarget::Exec:
    return exec;
  case MaskTarget::Inspect:
    return inspect;
  }
  return false;
}

OutputMasker::OutputMasker(const std::vector<MaskingRuleSpec> &specs,
                           std::string host_path_replacement)
    : host_path_replacement_(std::move(host_path_replacement)) {
  for (const auto &spec : specs) {
    std::string error;
    auto compiled = compile_rule(spec.pattern, error);
    if (!compiled.has_value()) {
      rejected_.push_back(spec.pattern);
      observability::record_warning(kComponent,
                                    "skipping invalid pattern " + spec.pattern + ": " + error);
      continue;
    }
    rules_.push_back(MaskingRule{.pattern = spec.pattern,
                                 .regex = std::move(*compiled),
                                 .replacement = spec.replacement,
                                 .logs = spec.logs,
                                 .exec = spec.exec,
                                 .inspect = spec.inspect});
  }

  // Masked output must stay stable under a second pass.
  std::vector<MaskingRule> stable;
  for (auto &rule : rules_) {
    bool rematches = false;
    for (const auto &other : rules_) {
      if (!other.replacement.empty() && std::regex_search(other.replacement, rule.regex)) {
        rematches = true;
        break;
      }
    }
    if (rematches) {
      rejected_.push_back(rule.pattern);
      observability::record_warning(kComponent, "skipping pattern that matches a replacement: " +
                                                    rule.pattern);
      continue;
    }
    stable.push_back(std::move(rule));
  }
  rules_ = std::move(stable);
}

OutputMasker OutputMasker::from_config(const config::OutputMaskingConfig &masking,
                                       const config::HostPathMaskingConfig &host_paths) {
  std::vector<MaskingRuleSpec> specs;
  if (masking.enabled) {
    const std::string replacement = masking.replacement.empty() ? "[MASKED]" : masking.replacement;
    for (const auto &pattern : masking.patterns) {
      specs.push_back(MaskingRuleSpec{.pattern = pattern,
                                      .replacement = replacement,
                                      .logs = masking.apply_to_logs,
                                      .exec = masking.apply_to_exec,
                                      .inspect = masking.apply_to_inspect});
    }
  }
  std::string host_replacement;
  if (host_paths.enabled) {
    host_replacement = host_paths.replacement.empty() ? "[HOST_PATH]" : host_paths.replacement;
  }
  return OutputMasker(specs, std::move(host_replacement));
}

std::string OutputMasker::mask(const std::string &text, const MaskTarget target) const {
  std::vector<const MaskingRule *> active;
  for (const auto &rule : rules_) {
    if (rule.applies_to(target)) {
      active.push_back(&rule);
    }
  }
  if (active.empty()) {
    return text;
  }

  std::string out;
  out.reserve(text.size());
  for (const auto segment : mask_segments(text)) {
    std::string piece(segment);
    for (const auto *rule : active) {
      piece = std::regex_replace(piece, rule->regex, rule->replacement,
                                 std::regex_constants::format_literal);
    }
    out += piece;
  }
  return out;
}

std::string OutputMasker::mask_host_paths(const std::string &text) const {
  if (host_path_replacement_.empty()) {
    return text;
  }

  static const std::array<const char *, 8> kWindowsPrefixes = {
      R"(C:\Users\)", R"(c:\Users\)", R"(D:\Users\)", R"(d:\Users\)",
      "C:/Users/",    "c:/Users/",    "D:/Users/",    "d:/Users/"};
  static const std::array<const char *, 4> kPosixPrefixes = {"/c/Users/", "/C/Users/", "/Users/",
                                                             "/home/"};

  std::string out = text;
  for (const char *prefix : kWindowsPrefixes) {
    out = mask_account_segment(out, prefix, host_path_replacement_, "\\/");
  }
  for (const char *prefix : kPosixPrefixes) {
    out = mask_account_segment(out, prefix, host_path_replacement_, "/");
  }
  return out;
}

} // namespace hostgate::security
