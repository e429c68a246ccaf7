#pragma once

#include "ollacode/common/result.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ollacode::providers {

enum class ProviderErrorCode {
  ApiError,
  NetworkError,
  ModelNotFound,
  InvalidResponse,
  Timeout,
  Cancelled,
};

struct ProviderError {
  ProviderErrorCode code = ProviderErrorCode::ApiError;
  std::uint16_t status = 0;
  std::string message;

  [[nodiscard]] std::string to_string() const;
};

struct ChatMessage {
  std::string role;
  std::string content;
};

/// Usage counters reported by the backend on the final response. Durations are
/// nanoseconds.
struct ChatStats {
  std::uint64_t prompt_eval_count = 0;
  std::uint64_t eval_count = 0;
  std::uint64_t prompt_eval_duration = 0;
  std::uint64_t eval_duration = 0;
  std::uint64_t load_duration = 0;
  std::uint64_t total_duration = 0;

  /// Generated tokens per second, or 0 when the backend gave no timing.
  [[nodiscard]] double tokens_per_second() const;
};

struct ChatResponse {
  std::string content;
  ChatStats stats;
};

using Headers = std::unordered_map<std::string, std::string>;

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  Headers headers;
  bool timeout = false;
  bool network_error = false;
  bool aborted = false;
  std::string network_error_message;
};

/// Receives body bytes as they arrive. Returning false aborts the transfer.
using StreamChunkCallback = std::function<bool(std::string_view)>;

class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse post_json(const std::string &url, const Headers &headers,
                                               const std::string &body,
                                               std::uint64_t timeout_ms) = 0;
  [[nodiscard]] virtual HttpResponse post_json_stream(const std::string &url,
                                                      const Headers &headers,
                                                      const std::string &body,
                                                      std::uint64_t timeout_ms,
                                                      const StreamChunkCallback &on_chunk) = 0;
  [[nodiscard]] virtual HttpResponse get(const std::string &url, const Headers &headers,
                                         std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  [[nodiscard]] HttpResponse post_json(const std::string &url, const Headers &headers,
                                       const std::string &body, std::uint64_t timeout_ms) override;
  [[nodiscard]] HttpResponse post_json_stream(const std::string &url, const Headers &headers,
                                              const std::string &body, std::uint64_t timeout_ms,
                                              const StreamChunkCallback &on_chunk) override;
  [[nodiscard]] HttpResponse get(const std::string &url, const Headers &headers,
                                 std::uint64_t timeout_ms) override;
};

/// Receives each non-empty text fragment. Returning false cancels the request.
using FragmentCallback = std::function<bool(std::string_view)>;

/// A chat-completion backend. The engine depends only on this interface.
class ChatBackend {
public:
  virtual ~ChatBackend() = default;

  [[nodiscard]] virtual common::Result<ChatResponse>
  chat(const std::vector<ChatMessage> &messages) = 0;

  /// Streams fragments in order; the returned content is their concatenation.
  /// A cancelled stream fails with a ProviderErrorCode::Cancelled message.
  [[nodiscard]] virtual common::Result<ChatResponse>
  chat_stream(const std::vector<ChatMessage> &messages, const FragmentCallback &on_fragment) = 0;

  [[nodiscard]] virtual bool check_health() = 0;
  [[nodiscard]] virtual std::string model() const = 0;
  [[nodiscard]] virtual std::string host() const = 0;
};

/// Maps transport failures and non-2xx statuses to a ProviderError message.
[[nodiscard]] common::Status validate_response_status(const HttpResponse &response);

/// Prefix every cancellation error carries, so callers can tell it apart.
[[nodiscard]] bool is_cancellation_error(const std::string &error);

} // namespace ollacode::providers
