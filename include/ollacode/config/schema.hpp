#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ollacode::config {

struct OllamaConfig {
  std::string host = "http://localhost:11434";
  std::string model = "qwen3-coder:30b";
  double temperature = 0.7;
  std::optional<std::int64_t> seed;
  std::uint64_t request_timeout_secs = 300;
};

struct TelegramConfig {
  std::string bot_token;
  std::vector<std::int64_t> allowed_users;
  std::uint64_t poll_timeout_secs = 10;
};

struct ObservabilityConfig {
  std::string backend = "log";
  std::string level = "warn";
};

struct ToolsConfig {
  std::uint64_t command_timeout_secs = 60;
};

struct Config {
  OllamaConfig ollama;
  std::string workspace_dir = ".";
  std::uint64_t max_context_tokens = 8192;
  bool compact_mode = true;
  TelegramConfig telegram;
  ObservabilityConfig observability;
  ToolsConfig tools;
};

} // namespace ollacode::config
