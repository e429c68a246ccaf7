#pragma once

#include "ollacode/common/result.hpp"
#include "ollacode/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ollacode::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Defaults, then the TOML file, then `.env` files and the environment.
[[nodiscard]] common::Result<Config> load_config();

/// Parse a TOML document into `config`, leaving absent keys untouched.
[[nodiscard]] common::Status apply_toml(Config &config, const std::string &content);

/// Load `.env` files without overwriting variables already present.
void load_dotenv_files();
void load_dotenv_file(const std::filesystem::path &path);

void apply_env_overrides(Config &config);

/// Make `workspace_dir` absolute and normalized.
void resolve_workspace(Config &config);

/// Hard errors fail; soft problems come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

/// Comma-separated integer ids; entries that are not integers are skipped.
[[nodiscard]] std::vector<std::int64_t> parse_user_ids(const std::string &csv);

} // namespace ollacode::config
