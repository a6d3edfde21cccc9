#pragma once

#include "hostgate/common/result.hpp"

#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace hostgate::common {

using StringListMap = std::map<std::string, std::vector<std::string>>;

struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] int get_int(const std::string &key, int fallback) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;

  /// Direct child keys of `table`, unquoted (`"*"` becomes `*`), sorted.
  [[nodiscard]] std::vector<std::string> table_keys(const std::string &table) const;

  /// Every array-valued child of `table` as name -> values, e.g.
  /// `[host.whitelist]` + `git = ["status"]` yields {"git": ["status"]}.
  [[nodiscard]] StringListMap get_string_array_table(const std::string &table) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace hostgate::common
