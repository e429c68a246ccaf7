#include "ollacode/providers/ollama.hpp"

#include "ollacode/common/fs.hpp"
#include "ollacode/common/json_util.hpp"
#include "ollacode/observability/global.hpp"

#include <charconv>
#include <chrono>
#include <sstream>

namespace ollacode::providers {

namespace {

constexpr std::uint64_t HEALTH_TIMEOUT_MS = 5'000;

const Headers &json_headers() {
  static const Headers headers = {{"Content-Type", "application/json"}};
  return headers;
}

std::uint64_t read_u64(const common::JsonFlatMap &object, const std::string &key) {
  const auto it = object.find(key);
  if (it == object.end()) {
    return 0;
  }
  std::uint64_t value = 0;
  const auto *first = it->second.data();
  const auto *last = first + it->second.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  return (ec == std::errc() && ptr == last) ? value : 0;
}

common::Result<ChatResponse> failure(const ProviderErrorCode code, std::string message) {
  return common::Result<ChatResponse>::failure(
      ProviderError{.code = code, .message = std::move(message)}.to_string());
}

void record_usage(const ChatStats &stats, const std::chrono::steady_clock::time_point started) {
  observability::record_metric(observability::RequestLatencyMetric{
      .latency = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started)});
  observability::record_metric(observability::TokensUsedMetric{
      .prompt_tokens = stats.prompt_eval_count, .completion_tokens = stats.eval_count});
}

} // namespace

ChatStats parse_chat_stats(const common::JsonFlatMap &object) {
  return ChatStats{
      .prompt_eval_count = read_u64(object, "prompt_eval_count"),
      .eval_count = read_u64(object, "eval_count"),
      .prompt_eval_duration = read_u64(object, "prompt_eval_duration"),
      .eval_duration = read_u64(object, "eval_duration"),
      .load_duration = read_u64(object, "load_duration"),
      .total_duration = read_u64(object, "total_duration"),
  };
}

std::optional<std::string> extract_message_content(const common::JsonFlatMap &object) {
  const auto message_it = object.find("message");
  if (message_it == object.end()) {
    return std::nullopt;
  }
  const auto message = common::json_parse_object(message_it->second);
  if (!message.has_value()) {
    return std::nullopt;
  }
  const auto content_it = message->find("content");
  if (content_it == message->end()) {
    return std::string();
  }
  return content_it->second;
}

OllamaClient::OllamaClient(config::OllamaConfig config, std::shared_ptr<HttpClient> http_client)
    : config_(std::move(config)), base_url_(common::trim(config_.host)),
      http_client_(std::move(http_client)) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::uint64_t OllamaClient::timeout_ms() const { return config_.request_timeout_secs * 1000; }

std::string OllamaClient::build_body(const std::vector<ChatMessage> &messages,
                                     const bool stream) const {
  std::ostringstream body;
  body << "{";
  body << "\"model\":\"" << common::json_escape(config_.model) << "\",";
  body << "\"messages\":[";
  for (std::size_t i = 0; i < messages.size(); ++i) {
    if (i > 0) {
      body << ',';
    }
    body << "{\"role\":\"" << common::json_escape(messages[i].role) << "\",\"content\":\""
         << common::json_escape(messages[i].content) << "\"}";
  }
  body << "],";
  body << "\"stream\":" << (stream ? "true" : "false") << ",";
  body << "\"options\":{\"temperature\":" << config_.temperature;
  if (config_.seed.has_value()) {
    body << ",\"seed\":" << *config_.seed;
  }
  body << "}}";
  return body.str();
}

common::Result<ChatResponse> OllamaClient::chat(const std::vector<ChatMessage> &messages) {
  const auto started = std::chrono::steady_clock::now();
  const auto response = http_client_->post_json(base_url_ + "/api/chat", json_headers(),
                                                build_body(messages, false), timeout_ms());
  if (auto status = validate_response_status(response); !status.ok()) {
    return common::Result<ChatResponse>::failure(status.error());
  }

  const auto parsed = common::json_parse_object(response.body);
  if (!parsed.has_value()) {
    return failure(ProviderErrorCode::InvalidResponse, "response is not a JSON object");
  }
  if (const auto error = parsed->find("error"); error != parsed->end()) {
    return failure(ProviderErrorCode::ApiError, error->second);
  }
  auto content = extract_message_content(*parsed);
  if (!content.has_value()) {
    return failure(ProviderErrorCode::InvalidResponse, "message.content missing");
  }

  ChatResponse out{.content = std::move(*content), .stats = parse_chat_stats(*parsed)};
  record_usage(out.stats, started);
  return common::Result<ChatResponse>::success(std::move(out));
}

common::Result<ChatResponse> OllamaClient::chat_stream(const std::vector<ChatMessage> &messages,
                                                       const FragmentCallback &on_fragment) {
  const auto started = std::chrono::steady_clock::now();
  ChatResponse out;
  std::string line_buffer;
  bool done = false;
  bool cancelled = false;
  std::optional<std::string> stream_error;

  // Returns false once the stream should stop: done, cancelled or errored.
  const auto handle_line = [&](const std::string &raw_line) {
    const std::string line = common::trim(raw_line);
    if (line.empty()) {
      return true;
    }
    const auto chunk = common::json_parse_object(line);
    if (!chunk.has_value()) {
      return true;
    }
    if (const auto error = chunk->find("error"); error != chunk->end()) {
      stream_error = error->second;
      return false;
    }
    if (const auto fragment = extract_message_content(*chunk);
        fragment.has_value() && !fragment->empty()) {
      out.content += *fragment;
      if (on_fragment && !on_fragment(*fragment)) {
        cancelled = true;
        return false;
      }
    }
    if (common::json_member(*chunk, "done") == "true") {
      out.stats = parse_chat_stats(*chunk);
      done = true;
      return false;
    }
    return true;
  };

  const auto on_bytes = [&](const std::string_view bytes) {
    line_buffer.append(bytes);
    std::size_t line_end = std::string::npos;
    while ((line_end = line_buffer.find('\n')) != std::string::npos) {
      const std::string line = line_buffer.substr(0, line_end);
      line_buffer.erase(0, line_end + 1);
      if (!handle_line(line)) {
        return false;
      }
    }
    return true;
  };

  const auto response = http_client_->post_json_stream(
      base_url_ + "/api/chat", json_headers(), build_body(messages, true), timeout_ms(), on_bytes);

  if (!done && !cancelled && !stream_error.has_value() && !line_buffer.empty() &&
      !response.aborted && response.status >= 200 && response.status < 300) {
    (void)handle_line(line_buffer);
  }

  if (cancelled) {
    return failure(ProviderErrorCode::Cancelled, "stream cancelled by consumer");
  }
  if (stream_error.has_value()) {
    const auto code =
        response.status == 404 ? ProviderErrorCode::ModelNotFound : ProviderErrorCode::ApiError;
    return common::Result<ChatResponse>::failure(
        ProviderError{.code = code, .status = response.status, .message = *stream_error}
            .to_string());
  }
  if (!done) {
    if (auto status = validate_response_status(response); !status.ok()) {
      return common::Result<ChatResponse>::failure(status.error());
    }
  }

  record_usage(out.stats, started);
  return common::Result<ChatResponse>::success(std::move(out));
}

bool OllamaClient::check_health() {
  const auto response = http_client_->get(base_url_ + "/", {}, HEALTH_TIMEOUT_MS);
  return !response.network_error && !response.timeout && response.status == 200;
}

} // namespace ollacode::providers
