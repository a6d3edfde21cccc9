#include "hostgate/common/json_util.hpp"

#include <cctype>
#include <cstdint>

namespace hostgate::common {

namespace {

std::size_t skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t find_string_end(const std::string &json, const std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t find_matching_token(const std::string &json, const std::size_t open_pos,
                                const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (ch == '"') {
      const auto end = find_string_end(json, i);
      if (end == std::string::npos) {
        return std::string::npos;
      }
      i = end;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

// Position of the first character of the value belonging to `"field":`, or npos.
// Occurrences of the quoted name that are not followed by a colon (string values
// that happen to equal the field name) are skipped.
std::size_t find_value_start(const std::string &json, const std::string &field) {
  const std::string quoted = "\"" + field + "\"";
  std::size_t from = 0;
  while (true) {
    const auto key_pos = json.find(quoted, from);
    if (key_pos == std::string::npos) {
      return std::string::npos;
    }
    const auto after = skip_ws(json, key_pos + quoted.size());
    if (after < json.size() && json[after] == ':') {
      return skip_ws(json, after + 1);
    }
    from = key_pos + quoted.size();
  }
}

std::string extract_nested(const std::string &json, const std::string &field, const char open_ch,
                           const char close_ch) {
  const auto pos = find_value_start(json, field);
  if (pos == std::string::npos || pos >= json.size() || json[pos] != open_ch) {
    return "";
  }
  const auto end = find_matching_token(json, pos, open_ch, close_ch);
  if (end == std::string::npos) {
    return "";
  }
  return json.substr(pos, end - pos + 1);
}

void append_utf8(std::string &out, const std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        static constexpr char kHex[] = "0123456789abcdef";
        escaped += "\\u00";
        escaped.push_back(kHex[(ch >> 4) & 0x0F]);
        escaped.push_back(kHex[ch & 0x0F]);
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u':
      if (i + 4 < raw.size()) {
        std::uint32_t cp = 0;
        bool valid = true;
        for (std::size_t k = 1; k <= 4; ++k) {
          const char h = raw[i + k];
          cp <<= 4;
          if (h >= '0' && h <= '9') {
            cp |= static_cast<std::uint32_t>(h - '0');
          } else if (h >= 'a' && h <= 'f') {
            cp |= static_cast<std::uint32_t>(h - 'a' + 10);
          } else if (h >= 'A' && h <= 'F') {
            cp |= static_cast<std::uint32_t>(h - 'A' + 10);
          } else {
            valid = false;
            break;
          }
        }
        if (valid) {
          append_utf8(out, cp);
          i += 4;
          break;
        }
      }
      out.push_back('u');
      break;
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::string json_get_object(const std::string &json, const std::string &field) {
  return extract_nested(json, field, '{', '}');
}

std::string json_get_array(const std::string &json, const std::string &field) {
  return extract_nested(json, field, '[', ']');
}

std::vector<std::string> json_get_string_array(const std::string &json,
                                               const std::string &field) {
  const std::string array_str = json_get_array(json, field);
  if (array_str.empty()) {
    return {};
  }

  std::vector<std::string> out;
  std::size_t pos = 1; // skip opening [
  while (pos < array_str.size()) {
    pos = skip_ws(array_str, pos);
    if (pos >= array_str.size() || array_str[pos] == ']') {
      break;
    }
    if (array_str[pos] != '"') {
      ++pos;
      continue;
    }
    const auto end = find_string_end(array_str, pos);
    if (end == std::string::npos) {
      break;
    }
    out.push_back(json_unescape(array_str.substr(pos + 1, end - pos - 1)));
    pos = end + 1;
  }
  return out;
}

JsonFlatMap json_parse_flat(const std::string &json) {
  JsonFlatMap result;
  std::size_t pos = skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return result;
  }
  ++pos;

  while (pos < json.size()) {
    pos = skip_ws(json, pos);
    if (pos >= json.size() || json[pos] == '}') {
      break;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }
    if (json[pos] != '"') {
      ++pos;
      continue;
    }

    const auto key_end = find_string_end(json, pos);
    if (key_end == std::string::npos) {
      break;
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    pos = skip_ws(json, key_end + 1);
    if (pos >= json.size() || json[pos] != ':') {
      break;
    }
    pos = skip_ws(json, pos + 1);
    if (pos >= json.size()) {
      break;
    }

    if (json[pos] == '"') {
      const auto val_end = find_string_end(json, pos);
      if (val_end == std::string::npos) {
        break;
      }
      result[key] = json_unescape(json.substr(pos + 1, val_end - pos - 1));
      pos = val_end + 1;
    } else if (json[pos] == '{' || json[pos] == '[') {
      const char open = json[pos];
      const char close = (open == '{') ? '}' : ']';
      const auto end = find_matching_token(json, pos, open, close);
      if (end == std::string::npos) {
        break;
      }
      result[key] = json.substr(pos, end - pos + 1);
      pos = end + 1;
    } else {
      // true / false / null / number
      const std::size_t start = pos;
      while (pos < json.size() && json[pos] != ',' && json[pos] != '}' &&
             std::isspace(static_cast<unsigned char>(json[pos])) == 0) {
        ++pos;
      }
      result[key] = json.substr(start, pos - start);
    }
  }

  return result;
}

} // namespace hostgate::common
