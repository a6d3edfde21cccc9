#include "hostgate/security/pattern.hpp"

#include <regex>

namespace hostgate::security {

namespace {

// Translates a glob into an anchored ECMAScript regex. Returns nullopt for an
// unterminated character class.
std::optional<std::string> glob_to_regex(const std::string &pattern) {
  std::string out = "^";
  out.reserve(pattern.size() * 2 + 2);
  for (std::size_t i = 0; i < pattern.size(); ++i) {
    const char ch = pattern[i];
    switch (ch) {
    case '*':
      out += "[^/]*";
      break;
    case '?':
      out += "[^/]";
      break;
    case '[': {
      const auto close = pattern.find(']', i + 1);
      if (close == std::string::npos) {
        return std::nullopt;
      }
      std::string body = pattern.substr(i + 1, close - i - 1);
      bool negated = false;
      if (!body.empty() && (body.front() == '!' || body.front() == '^')) {
        negated = true;
        body = body.substr(1);
      }
      if (body.empty()) {
        return std::nullopt;
      }
      std::string escaped = negated ? "^" : "";
      for (const char c : body) {
        if (c == '\\' || c == ']' || c == '[') {
          escaped += '\\';
        }
        escaped += c;
      }
      out += "[" + escaped + "]";
      i = close;
      break;
    }
    case '\\':
      if (i + 1 < pattern.size()) {
        ++i;
        out += '\\';
        out += pattern[i];
      } else {
        return std::nullopt;
      }
      break;
    case '.':
    case '+':
    case '^':
    case '$':
    case '(':
    case ')':
    case ']':
    case '{':
    case '}':
    case '|':
      out += '\\';
      out += ch;
      break;
    default:
      out += ch;
      break;
    }
  }
  out += '$';
  return out;
}

} // namespace

bool glob_match(const std::string &pattern, const std::string &text) {
  if (pattern.find_first_of("*?[\\") == std::string::npos) {
    return pattern == text;
  }
  const auto regex_text = glob_to_regex(pattern);
  if (!regex_text.has_value()) {
    return false;
  }
  try {
    const std::regex re(*regex_text);
    return std::regex_match(text, re);
  } catch (const std::regex_error &) {
    return false;
  }
}

bool matches_any_glob(const std::vector<std::string> &patterns, const std::string &text) {
  for (const auto &pattern : patterns) {
    if (glob_match(pattern, text)) {
      return true;
    }
  }
  return false;
}

bool matches_command_pattern(const std::string &pattern, const std::string &value) {
  if (value == pattern) {
    return true;
  }
  if (!pattern.empty() && pattern.back() == '*') {
    const std::string prefix = pattern.substr(0, pattern.size() - 1);
    return value.rfind(prefix, 0) == 0;
  }
  return false;
}

std::optional<std::string> find_command_pattern(const std::vector<std::string> &patterns,
                                                const std::string &value) {
  for (const auto &pattern : patterns) {
    if (matches_command_pattern(pattern, value)) {
      return pattern;
    }
  }
  return std::nullopt;
}

} // namespace hostgate::security
