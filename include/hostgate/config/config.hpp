#pragma once

#include "hostgate/common/result.hpp"
#include "hostgate/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace hostgate::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

/// Loads the file at config_path(); a missing file yields the defaults.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> load_config_file(const std::filesystem::path &path);
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);

/// Hard errors fail the Result; soft problems come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

/// Renders the effective configuration back to TOML.
[[nodiscard]] std::string render_config(const Config &config);

} // namespace hostgate::config
