#include "tests/helpers/test_helpers.hpp"

#include <cstdlib>
#include <fstream>
#include <random>
#include <sstream>

namespace ollacode::testing {

void ScriptedBackend::push_reply(std::string reply) {
  steps_.push_back(Step{.reply = std::move(reply)});
}

void ScriptedBackend::push_error(std::string error_message) {
  steps_.push_back(Step{.error = std::move(error_message)});
}

common::Result<std::string> ScriptedBackend::next_step() {
  if (steps_.empty()) {
    return common::Result<std::string>::failure("scripted backend exhausted");
  }
  Step step = std::move(steps_.front());
  steps_.pop_front();
  if (!step.reply.has_value()) {
    return common::Result<std::string>::failure(step.error);
  }
  return common::Result<std::string>::success(std::move(*step.reply));
}

common::Result<providers::ChatResponse>
ScriptedBackend::chat(const std::vector<providers::ChatMessage> &messages) {
  requests.push_back(messages);
  auto step = next_step();
  if (!step.ok()) {
    return common::Result<providers::ChatResponse>::failure(step.error());
  }
  return common::Result<providers::ChatResponse>::success(
      providers::ChatResponse{.content = step.value()});
}

common::Result<providers::ChatResponse>
ScriptedBackend::chat_stream(const std::vector<providers::ChatMessage> &messages,
                             const providers::FragmentCallback &on_fragment) {
  requests.push_back(messages);
  auto step = next_step();
  if (!step.ok()) {
    return common::Result<providers::ChatResponse>::failure(step.error());
  }
  const std::string &text = step.value();
  const std::size_t size = fragment_size == 0 ? 1 : fragment_size;
  for (std::size_t pos = 0; pos < text.size(); pos += size) {
    if (!on_fragment(std::string_view(text).substr(pos, size))) {
      return common::Result<providers::ChatResponse>::failure(
          "Provider error [cancelled] stream cancelled by consumer");
    }
  }
  return common::Result<providers::ChatResponse>::success(providers::ChatResponse{.content = text});
}

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() /
          ("ollacode-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
  path_ = std::filesystem::canonical(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
  out << content;
}

std::string TempWorkspace::read_file(const std::string &name) const {
  std::ifstream in(path_ / name, std::ios::binary);
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

config::Config temp_config(const TempWorkspace &workspace) {
  config::Config config;
  config.workspace_dir = workspace.path().string();
  config.observability.backend = "none";
  return config;
}

ScopedEnv::ScopedEnv(std::string name, const std::optional<std::string> &value)
    : name_(std::move(name)) {
  if (const char *current = std::getenv(name_.c_str()); current != nullptr) {
    previous_ = current;
  }
  if (value.has_value()) {
    setenv(name_.c_str(), value->c_str(), 1);
  } else {
    unsetenv(name_.c_str());
  }
}

ScopedEnv::~ScopedEnv() {
  if (previous_.has_value()) {
    setenv(name_.c_str(), previous_->c_str(), 1);
  } else {
    unsetenv(name_.c_str());
  }
}

} // namespace ollacode::testing
