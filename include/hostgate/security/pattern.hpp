#pragma once

#include <optional>
#include <string>
#include <vector>

namespace hostgate::security {

/// Shell-style glob over a single path element: `*` and `?` never cross `/`,
/// `[a-z]` / `[!x]` are character classes. A malformed pattern matches nothing.
[[nodiscard]] bool glob_match(const std::string &pattern, const std::string &text);

[[nodiscard]] bool matches_any_glob(const std::vector<std::string> &patterns,
                                    const std::string &text);

/// Command-rule matching: exact equality, or a trailing `*` turning the rest of
/// the pattern into a literal prefix ("diff *" matches "diff HEAD~1").
[[nodiscard]] bool matches_command_pattern(const std::string &pattern, const std::string &value);

/// First pattern in `patterns` accepting `value`, if any.
[[nodiscard]] std::optional<std::string>
find_command_pattern(const std::vector<std::string> &patterns, const std::string &value);

} // namespace hostgate::security
