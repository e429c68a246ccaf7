#pragma once

#include "ollacode/common/result.hpp"
#include "ollacode/config/schema.hpp"
#include "ollacode/providers/traits.hpp"
#include "ollacode/sessions/store.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace ollacode::channels::telegram {

inline constexpr std::size_t MAX_MESSAGE_CHARS = 4000;

/// Telegram Bot API transport: long-polls getUpdates on a worker thread and
/// answers each user from their own engine in the session store.
class TelegramBot {
public:
  struct IncomingMessage {
    std::uint64_t update_id = 0;
    std::int64_t chat_id = 0;
    std::int64_t user_id = 0;
    std::string first_name;
    std::string text;
  };

  TelegramBot(config::Config config, std::shared_ptr<sessions::SessionStore> sessions,
              std::shared_ptr<providers::HttpClient> http_client =
                  std::make_shared<providers::CurlHttpClient>());
  ~TelegramBot();

  TelegramBot(const TelegramBot &) = delete;
  TelegramBot &operator=(const TelegramBot &) = delete;

  [[nodiscard]] common::Status start();
  void stop();
  [[nodiscard]] bool running() const { return running_.load(); }

  /// One getUpdates round trip; handles every message it returns.
  [[nodiscard]] common::Status poll_once();
  [[nodiscard]] common::Status parse_and_dispatch_updates(const std::string &response_body);
  void handle_message(const IncomingMessage &message);

  [[nodiscard]] common::Status send_text(std::int64_t chat_id, const std::string &text,
                                         bool html);

  [[nodiscard]] std::uint64_t next_update_offset() const;

private:
  void run_loop();
  void reply(std::int64_t chat_id, const std::string &response);
  [[nodiscard]] common::Status check_api_response(const providers::HttpResponse &response,
                                                  std::string_view operation) const;

  config::Config config_;
  std::shared_ptr<sessions::SessionStore> sessions_;
  std::shared_ptr<providers::HttpClient> http_client_;
  std::string base_url_;

  std::atomic<bool> running_{false};
  std::thread worker_;
  mutable std::mutex state_mutex_;
  std::uint64_t next_update_offset_ = 0;
};

[[nodiscard]] std::string html_escape(const std::string &text);

/// Telegram HTML for a reply: tool blocks removed, code fences and inline code
/// escaped into <pre>/<code>, **bold** and *italic* converted.
[[nodiscard]] std::string format_telegram_html(const std::string &markdown);

/// Split on line boundaries into parts of at most `max_chars` characters; a
/// line longer than that is cut into fixed-size pieces.
[[nodiscard]] std::vector<std::string> split_message(const std::string &text,
                                                     std::size_t max_chars = MAX_MESSAGE_CHARS);

} // namespace ollacode::channels::telegram
