#include "ollacode/config/config.hpp"

#include "ollacode/common/fs.hpp"
#include "ollacode/common/toml.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>

namespace ollacode::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".ollacode";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("OLLACODE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::optional<std::string> env_value(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

std::optional<std::uint64_t> parse_u64(const std::string &text) {
  const std::string trimmed = common::trim(text);
  std::uint64_t parsed = 0;
  const auto *first = trimmed.data();
  const auto *last = first + trimmed.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (trimmed.empty() || ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

std::string strip_env_quotes(const std::string &raw) {
  const std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      if (value[i] == '\\' && i + 2 < value.size()) {
        const char esc = value[++i];
        out.push_back(esc == 'n' ? '\n' : esc == 't' ? '\t' : esc);
      } else {
        out.push_back(value[i]);
      }
    }
    return out;
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty() ||
      !(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    if (!(std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
  setenv(name.c_str(), value.c_str(), 0);
}

bool parse_flag(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  return normalized == "true" || normalized == "1" || normalized == "yes";
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec)) {
      return common::Result<std::filesystem::path>::success(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec)) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto dir = config_dir();
  if (!dir.ok()) {
    return common::Result<std::filesystem::path>::failure(dir.error());
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  g_config_path_override = std::move(path);
}

std::optional<std::filesystem::path> config_path_override() { return g_config_path_override; }

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }
  std::ifstream file(path);
  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }
    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    set_env_if_missing(common::trim(trimmed.substr(0, eq)), strip_env_quotes(trimmed.substr(eq + 1)));
  }
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const auto env_file = env_value("OLLACODE_ENV_FILE"); env_file.has_value()) {
    candidates.emplace_back(common::expand_path(*env_file));
  }
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }
  // Earlier files win: set_env_if_missing never overwrites.
  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

common::Status apply_toml(Config &config, const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Status::error(parsed.error());
  }
  const auto &doc = parsed.value();

  config.ollama.host = doc.get_string("ollama.host", config.ollama.host);
  config.ollama.model = doc.get_string("ollama.model", config.ollama.model);
  config.ollama.temperature = doc.get_double("ollama.temperature", config.ollama.temperature);
  if (const auto seed = doc.get_i64("ollama.seed"); seed.has_value()) {
    config.ollama.seed = *seed;
  }
  config.ollama.request_timeout_secs =
      doc.get_u64("ollama.request_timeout_secs", config.ollama.request_timeout_secs);

  if (doc.has("workspace_dir")) {
    config.workspace_dir = common::expand_path(doc.get_string("workspace_dir"));
  }
  config.max_context_tokens = doc.get_u64("max_context_tokens", config.max_context_tokens);
  config.compact_mode = doc.get_bool("compact_mode", config.compact_mode);

  config.telegram.bot_token =
      common::expand_path(doc.get_string("telegram.bot_token", config.telegram.bot_token));
  if (doc.has("telegram.allowed_users")) {
    config.telegram.allowed_users.clear();
    for (const auto &entry : doc.get_array("telegram.allowed_users")) {
      const auto ids = parse_user_ids(entry);
      config.telegram.allowed_users.insert(config.telegram.allowed_users.end(), ids.begin(),
                                           ids.end());
    }
  }
  config.telegram.poll_timeout_secs =
      doc.get_u64("telegram.poll_timeout_secs", config.telegram.poll_timeout_secs);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.level = doc.get_string("observability.level", config.observability.level);
  config.tools.command_timeout_secs =
      doc.get_u64("tools.command_timeout_secs", config.tools.command_timeout_secs);
  return common::Status::success();
}

void apply_env_overrides(Config &config) {
  if (auto host = env_value("OLLAMA_HOST"); host.has_value()) {
    config.ollama.host = *host;
  }
  if (auto model = env_value("OLLAMA_MODEL"); model.has_value()) {
    config.ollama.model = *model;
  }
  if (auto token = env_value("TELEGRAM_BOT_TOKEN"); token.has_value()) {
    config.telegram.bot_token = *token;
  }
  if (auto users = env_value("TELEGRAM_ALLOWED_USERS"); users.has_value()) {
    config.telegram.allowed_users = parse_user_ids(*users);
  }
  if (auto workspace = env_value("WORKSPACE_DIR"); workspace.has_value()) {
    config.workspace_dir = common::expand_path(*workspace);
  }
  if (auto tokens = env_value("MAX_CONTEXT_TOKENS"); tokens.has_value()) {
    if (const auto parsed = parse_u64(*tokens); parsed.has_value()) {
      config.max_context_tokens = *parsed;
    }
  }
  if (auto compact = env_value("COMPACT_MODE"); compact.has_value()) {
    config.compact_mode = parse_flag(*compact);
  }
  if (auto backend = env_value("OLLACODE_LOG"); backend.has_value()) {
    config.observability.backend = *backend;
  }
  if (auto level = env_value("OLLACODE_LOG_LEVEL"); level.has_value()) {
    config.observability.level = *level;
  }
}

void resolve_workspace(Config &config) {
  std::error_code ec;
  auto absolute = std::filesystem::absolute(config.workspace_dir, ec);
  if (ec) {
    return;
  }
  auto canonical = std::filesystem::weakly_canonical(absolute, ec);
  config.workspace_dir = (ec ? absolute.lexically_normal() : canonical).string();
}

common::Result<Config> load_config() {
  Config config;

  const auto path = config_path();
  if (!path.ok()) {
    return common::Result<Config>::failure(path.error());
  }

  std::error_code ec;
  if (std::filesystem::exists(path.value(), ec)) {
    const auto content = common::read_file_bytes(path.value());
    if (!content.ok()) {
      return common::Result<Config>::failure("Unable to open config file: " +
                                             path.value().string());
    }
    if (auto status = apply_toml(config, content.value()); !status.ok()) {
      return common::Result<Config>::failure(path.value().string() + ": " + status.error());
    }
  }

  load_dotenv_files();
  apply_env_overrides(config);
  resolve_workspace(config);
  return common::Result<Config>::success(std::move(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Warnings = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  const std::string host = common::trim(config.ollama.host);
  if (host.empty()) {
    return Warnings::failure("ollama.host must not be empty");
  }
  if (!common::starts_with(host, "http://") && !common::starts_with(host, "https://")) {
    return Warnings::failure("ollama.host must start with http:// or https://: " + host);
  }
  if (common::trim(config.ollama.model).empty()) {
    return Warnings::failure("ollama.model must not be empty");
  }
  if (config.ollama.temperature < 0.0 || config.ollama.temperature > 2.0) {
    return Warnings::failure("ollama.temperature must be between 0.0 and 2.0");
  }
  if (config.max_context_tokens == 0) {
    return Warnings::failure("max_context_tokens must be greater than 0");
  }
  if (config.tools.command_timeout_secs == 0) {
    return Warnings::failure("tools.command_timeout_secs must be greater than 0");
  }

  std::error_code ec;
  if (!std::filesystem::is_directory(config.workspace_dir, ec)) {
    return Warnings::failure("workspace_dir is not a directory: " + config.workspace_dir);
  }

  if (config.max_context_tokens < 1024) {
    warnings.push_back("max_context_tokens below 1024 will compact almost every turn");
  }
  const std::string backend = common::to_lower(config.observability.backend);
  if (backend != "log" && backend != "none" && backend != "noop") {
    warnings.push_back("unknown observability.backend '" + config.observability.backend +
                       "', using none");
  }

  return Warnings::success(std::move(warnings));
}

std::vector<std::int64_t> parse_user_ids(const std::string &csv) {
  std::vector<std::int64_t> ids;
  for (const auto &part : common::split(csv, ',')) {
    const std::string trimmed = common::trim(part);
    std::int64_t value = 0;
    const auto *first = trimmed.data();
    const auto *last = first + trimmed.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (!trimmed.empty() && ec == std::errc() && ptr == last) {
      ids.push_back(value);
    }
  }
  return ids;
}

} // namespace ollacode::config
