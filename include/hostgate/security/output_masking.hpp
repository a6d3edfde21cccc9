#pragma once

#include "hostgate/config/schema.hpp"

#include <regex>
#include <string>
#include <vector>

namespace hostgate::security {

enum class MaskTarget { Logs, Exec, Inspect };

struct MaskingRuleSpec {
  std::string pattern;
  std::string replacement = "[MASKED]";
  bool logs = true;
  bool exec = true;
  bool inspect = true;
};

struct MaskingRule {
  std::string pattern;
  std::regex regex;
  std::string replacement;
  bool logs = true;
  bool exec = true;
  bool inspect = true;

  [[nodiscard]] bool applies_to(MaskTarget target) const;
};

/// Regex redaction applied to every textual result before it leaves the
/// gateway. Rules run in declaration order. A pattern that fails to compile,
/// or that would match a configured replacement (breaking idempotence), is
/// dropped at construction and reported through the warning log.
class OutputMasker {
public:
  OutputMasker() = default;
  explicit OutputMasker(const std::vector<MaskingRuleSpec> &specs,
                        std::string host_path_replacement = "");

  [[nodiscard]] static OutputMasker from_config(const config::OutputMaskingConfig &masking,
                                                const config::HostPathMaskingConfig &host_paths);

  /// Applied line by line; a line longer than 8 KiB is split at whitespace
  /// into segments of at most that size before any rule runs.
  [[nodiscard]] std::string mask(const std::string &text, MaskTarget target) const;

  /// Replaces `/home/<user>`, `/Users/<user>` and `C:\Users\<user>` style
  /// prefixes so host account names do not leak. No-op when disabled.
  [[nodiscard]] std::string mask_host_paths(const std::string &text) const;

  [[nodiscard]] const std::vector<MaskingRule> &rules() const { return rules_; }
  [[nodiscard]] const std::vector<std::string> &rejected_patterns() const { return rejected_; }
  [[nodiscard]] bool host_path_masking_enabled() const { return !host_path_replacement_.empty(); }

private:
  std::vector<MaskingRule> rules_;
  std::vector<std::string> rejected_;
  std::string host_path_replacement_;
};

} // namespace hostgate::security
