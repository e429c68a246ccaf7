#pragma once

#include "ollacode/common/json_util.hpp"
#include "ollacode/config/schema.hpp"
#include "ollacode/providers/traits.hpp"

#include <memory>
#include <optional>
#include <string>

namespace ollacode::providers {

/// Client for the Ollama `/api/chat` endpoint.
class OllamaClient final : public ChatBackend {
public:
  explicit OllamaClient(config::OllamaConfig config,
                        std::shared_ptr<HttpClient> http_client = std::make_shared<CurlHttpClient>());

  [[nodiscard]] common::Result<ChatResponse>
  chat(const std::vector<ChatMessage> &messages) override;

  [[nodiscard]] common::Result<ChatResponse>
  chat_stream(const std::vector<ChatMessage> &messages,
              const FragmentCallback &on_fragment) override;

  [[nodiscard]] bool check_health() override;
  [[nodiscard]] std::string model() const override { return config_.model; }
  [[nodiscard]] std::string host() const override { return base_url_; }

  [[nodiscard]] std::string build_body(const std::vector<ChatMessage> &messages,
                                       bool stream) const;

private:
  [[nodiscard]] std::uint64_t timeout_ms() const;

  config::OllamaConfig config_;
  std::string base_url_;
  std::shared_ptr<HttpClient> http_client_;
};

/// Counters from the top level of a response object; missing ones stay zero.
[[nodiscard]] ChatStats parse_chat_stats(const common::JsonFlatMap &object);

/// `message.content` of a response object, or nullopt when absent or malformed.
[[nodiscard]] std::optional<std::string> extract_message_content(const common::JsonFlatMap &object);

} // namespace ollacode::providers
