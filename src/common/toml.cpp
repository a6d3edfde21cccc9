#include "hostgate/common/toml.hpp"

#include "hostgate/common/fs.hpp"

#include <algorithm>
#include <charconv>
#include <sstream>

namespace hostgate::common {

namespace {

// Tracks whether a scan position sits inside a basic ("...") or literal ('...')
// string. Basic strings honour backslash escapes, literal strings do not.
class QuoteState {
public:
  void feed(const std::string &text, const std::size_t i) {
    const char ch = text[i];
    if (quote_ == '"' && ch == '\\' && !escaped_) {
      escaped_ = true;
      return;
    }
    if (quote_ == 0 && (ch == '"' || ch == '\'')) {
      quote_ = ch;
    } else if (quote_ != 0 && ch == quote_ && !escaped_) {
      quote_ = 0;
    }
    escaped_ = false;
  }

  [[nodiscard]] bool inside() const { return quote_ != 0; }

private:
  char quote_ = 0;
  bool escaped_ = false;
};

std::string strip_comment(const std::string &line) {
  QuoteState state;
  std::string output;
  output.reserve(line.size());

  for (std::size_t i = 0; i < line.size(); ++i) {
    const bool was_inside = state.inside();
    state.feed(line, i);
    if (!was_inside && !state.inside() && line[i] == '#') {
      break;
    }
    output.push_back(line[i]);
  }

  return output;
}

int bracket_balance(const std::string &text) {
  QuoteState state;
  int depth = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const bool was_inside = state.inside();
    state.feed(text, i);
    if (was_inside || state.inside()) {
      continue;
    }
    if (text[i] == '[') {
      ++depth;
    } else if (text[i] == ']') {
      --depth;
    }
  }
  return depth;
}

std::vector<std::string> split_array_elements(const std::string &array_value) {
  std::vector<std::string> result;
  std::string current;
  QuoteState state;

  for (std::size_t i = 0; i < array_value.size(); ++i) {
    const bool was_inside = state.inside();
    state.feed(array_value, i);
    if (!was_inside && !state.inside() && array_value[i] == ',') {
      result.push_back(trim(current));
      current.clear();
      continue;
    }
    current.push_back(array_value[i]);
  }

  if (!trim(current).empty()) {
    result.push_back(trim(current));
  }

  return result;
}

std::string unescape_basic(const std::string &body) {
  std::string out;
  out.reserve(body.size());
  bool escaped = false;
  for (const char ch : body) {
    if (!escaped) {
      if (ch == '\\') {
        escaped = true;
      } else {
        out.push_back(ch);
      }
      continue;
    }
    switch (ch) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case '"':
    case '\\':
      out.push_back(ch);
      break;
    default:
      // Unknown escapes keep their backslash so regex classes like \s survive.
      out.push_back('\\');
      out.push_back(ch);
      break;
    }
    escaped = false;
  }
  return out;
}

std::string unquote(std::string value) {
  value = trim(value);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    return unescape_basic(value.substr(1, value.size() - 2));
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return unquote(it->second);
}

bool TomlDocument::get_bool(const std::string &key, bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = to_lower(trim(it->second));
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return fallback;
}

int TomlDocument::get_int(const std::string &key, int fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  const std::string normalized = trim(it->second);
  int parsed = 0;
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return fallback;
  }

  return parsed;
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  const std::string raw = trim(it->second);
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
    return fallback;
  }

  const std::string body = raw.substr(1, raw.size() - 2);
  std::vector<std::string> values_out;
  for (const auto &element : split_array_elements(body)) {
    if (!element.empty()) {
      values_out.push_back(unquote(element));
    }
  }

  return values_out;
}

std::vector<std::string> TomlDocument::table_keys(const std::string &table) const {
  const std::string prefix = table + ".";
  std::vector<std::string> keys;
  for (const auto &[key, _] : values) {
    if (!starts_with(key, prefix)) {
      continue;
    }
    const std::string child = key.substr(prefix.size());
    const bool quoted = !child.empty() && (child.front() == '"' || child.front() == '\'');
    if (!quoted && child.find('.') != std::string::npos) {
      continue;
    }
    keys.push_back(unquote(child));
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

StringListMap TomlDocument::get_string_array_table(const std::string &table) const {
  const std::string prefix = table + ".";
  StringListMap out;
  for (const auto &[key, raw] : values) {
    if (!starts_with(key, prefix)) {
      continue;
    }
    const std::string child = key.substr(prefix.size());
    const bool quoted = !child.empty() && (child.front() == '"' || child.front() == '\'');
    if (!quoted && child.find('.') != std::string::npos) {
      continue;
    }
    const std::string value = trim(raw);
    if (value.empty() || value.front() != '[') {
      continue;
    }
    out[unquote(child)] = get_string_array(key);
  }
  return out;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string current_section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean_line = trim(strip_comment(line));
    if (clean_line.empty()) {
      continue;
    }

    if (clean_line.front() == '[' && clean_line.back() == ']') {
      current_section = trim(clean_line.substr(1, clean_line.size() - 2));
      if (current_section.empty()) {
        return Result<TomlDocument>::failure("Invalid empty section at line " +
                                                 std::to_string(line_number),
                                             ErrorKind::ParseError);
      }
      continue;
    }

    const std::size_t equals_index = clean_line.find('=');
    if (equals_index == std::string::npos) {
      return Result<TomlDocument>::failure("Invalid key/value at line " +
                                               std::to_string(line_number),
                                           ErrorKind::ParseError);
    }

    const std::string key = trim(clean_line.substr(0, equals_index));
    std::string value = trim(clean_line.substr(equals_index + 1));
    if (key.empty()) {
      return Result<TomlDocument>::failure("Missing key at line " + std::to_string(line_number),
                                           ErrorKind::ParseError);
    }

    // Arrays may continue over several lines until their brackets balance.
    const std::size_t start_line = line_number;
    while (!value.empty() && value.front() == '[' && bracket_balance(value) > 0) {
      if (!std::getline(stream, line)) {
        return Result<TomlDocument>::failure("Unterminated array starting at line " +
                                                 std::to_string(start_line),
                                             ErrorKind::ParseError);
      }
      ++line_number;
      value += " " + trim(strip_comment(line));
    }

    const std::string full_key = current_section.empty() ? key : current_section + "." + key;
    document.values[full_key] = value;
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 2);
  escaped.push_back('"');
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(ch);
  }
  escaped.push_back('"');
  return escaped;
}

} // namespace hostgate::common
