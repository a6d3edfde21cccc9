#pragma once

#include "hostgate/common/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace hostgate::security {

/// Returns the first shell control sequence found in `command` (`|`, `>`, `<`,
/// `;`, `&`, backtick, newline or `$(`), or nullopt when there is none. `&&` and
/// `||` are caught through their single-character forms.
[[nodiscard]] std::optional<std::string> find_shell_metacharacter(const std::string &command);

/// Quote-aware split: single quotes are literal, double quotes honour `\"` and
/// `\\`, a backslash outside quotes escapes the next character. Unterminated
/// quotes or a dangling backslash fail with ErrorKind::ParseError.
[[nodiscard]] common::Result<std::vector<std::string>> tokenize_command(const std::string &command);

/// True when any token contains a `..` sequence.
[[nodiscard]] bool has_path_traversal(const std::vector<std::string> &tokens);

/// Arguments (tokens after the first) that look like filesystem paths: not a
/// flag, and starting with `/` or `.` or containing a `/`.
[[nodiscard]] std::vector<std::string> extract_path_arguments(const std::vector<std::string> &tokens);

} // namespace hostgate::security
