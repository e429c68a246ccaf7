#include "ollacode/channels/telegram/telegram.hpp"

#include "ollacode/agent/tool_call_parser.hpp"
#include "ollacode/channels/allowlist.hpp"
#include "ollacode/common/fs.hpp"
#include "ollacode/common/json_util.hpp"
#include "ollacode/common/utf8.hpp"
#include "ollacode/observability/global.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <sstream>
#include <system_error>

namespace ollacode::channels::telegram {

namespace {

constexpr std::uint64_t kSendTimeoutMs = 15000;
constexpr std::size_t kErrorSnippetChars = 240;

template <typename T> std::optional<T> parse_integer(const std::string &raw) {
  const std::string text = common::trim(raw);
  T value{};
  const auto *first = text.data();
  const auto *last = first + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last || text.empty()) {
    return std::nullopt;
  }
  return value;
}

common::Result<TelegramBot::IncomingMessage> parse_update(const std::string &update_json) {
  using ParseResult = common::Result<TelegramBot::IncomingMessage>;
  const auto update = common::json_parse_object(update_json);
  if (!update.has_value()) {
    return ParseResult::failure("malformed update");
  }
  const auto update_id = parse_integer<std::uint64_t>(common::json_member(*update, "update_id"));
  if (!update_id.has_value()) {
    return ParseResult::failure("missing update_id");
  }

  TelegramBot::IncomingMessage message{.update_id = *update_id};
  const auto body = common::json_parse_object(common::json_member(*update, "message"));
  if (!body.has_value()) {
    return ParseResult::success(std::move(message));
  }
  message.text = common::json_member(*body, "text");

  const auto chat = common::json_parse_object(common::json_member(*body, "chat"));
  const auto chat_id =
      chat.has_value() ? parse_integer<std::int64_t>(common::json_member(*chat, "id")) : std::nullopt;
  if (!chat_id.has_value()) {
    return ParseResult::failure("message chat id missing");
  }
  message.chat_id = *chat_id;

  const auto from = common::json_parse_object(common::json_member(*body, "from"));
  if (from.has_value()) {
    message.user_id = parse_integer<std::int64_t>(common::json_member(*from, "id")).value_or(0);
    message.first_name = common::json_member(*from, "first_name");
  }
  return ParseResult::success(std::move(message));
}

/// Command name of a "/cmd@bot args" message, lower-cased; empty for plain text.
std::string command_name(const std::string &text) {
  if (text.empty() || text.front() != '/') {
    return "";
  }
  std::string name = text.substr(0, text.find_first_of(" \t\n"));
  name = name.substr(0, name.find('@'));
  return common::to_lower(name);
}

/// Wraps every `delim`...`delim` span that does not cross a line in the given tags.
std::string wrap_inline(const std::string &text, const std::string &delim, const std::string &open,
                        const std::string &close) {
  std::string out;
  std::size_t pos = 0;
  while (pos < text.size()) {
    if (text.compare(pos, delim.size(), delim) != 0) {
      out.push_back(text[pos++]);
      continue;
    }
    const std::size_t content = pos + delim.size();
    const std::size_t end = text.find(delim, content + 1);
    if (end == std::string::npos || text.find('\n', content) < end) {
      out.push_back(text[pos++]);
      continue;
    }
    out += open + text.substr(content, end - content) + close;
    pos = end + delim.size();
  }
  return out;
}

bool is_word_char(const char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

std::string extract_code_blocks(const std::string &text,
                                std::vector<std::pair<std::string, std::string>> &blocks) {
  std::string out;
  std::size_t pos = 0;
  while (pos < text.size()) {
    if (text.compare(pos, 3, "```") != 0) {
      out.push_back(text[pos++]);
      continue;
    }
    std::size_t cursor = pos + 3;
    while (cursor < text.size() && is_word_char(text[cursor])) {
      ++cursor;
    }
    const std::size_t close =
        cursor < text.size() && text[cursor] == '\n' ? text.find("```", cursor + 1)
                                                     : std::string::npos;
    if (close == std::string::npos) {
      out.push_back(text[pos++]);
      continue;
    }
    const std::string lang = text.substr(pos + 3, cursor - pos - 3);
    const std::string code = text.substr(cursor + 1, close - cursor - 1);
    const std::string placeholder = "__CODE_BLOCK_" + std::to_string(blocks.size()) + "__";
    blocks.emplace_back(placeholder, "<pre><code class=\"language-" + lang + "\">" +
                                         html_escape(code) + "</code></pre>");
    out += placeholder;
    pos = close + 3;
  }
  return out;
}

std::string extract_inline_code(const std::string &text,
                                std::vector<std::pair<std::string, std::string>> &codes) {
  std::string out;
  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t close = text[pos] == '`' ? text.find('`', pos + 1) : std::string::npos;
    if (close == std::string::npos || close == pos + 1) {
      out.push_back(text[pos++]);
      continue;
    }
    const std::string placeholder = "__INLINE_CODE_" + std::to_string(codes.size()) + "__";
    codes.emplace_back(placeholder,
                       "<code>" + html_escape(text.substr(pos + 1, close - pos - 1)) + "</code>");
    out += placeholder;
    pos = close + 1;
  }
  return out;
}

void replace_all(std::string &text, const std::string &from, const std::string &to) {
  std::size_t pos = text.find(from);
  while (pos != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos = text.find(from, pos + to.size());
  }
}

} // namespace

TelegramBot::TelegramBot(config::Config config, std::shared_ptr<sessions::SessionStore> sessions,
                         std::shared_ptr<providers::HttpClient> http_client)
    : config_(std::move(config)), sessions_(std::move(sessions)),
      http_client_(std::move(http_client)) {
  base_url_ = "https://api.telegram.org/bot" + common::trim(config_.telegram.bot_token);
}

TelegramBot::~TelegramBot() { stop(); }

common::Status TelegramBot::start() {
  if (running_.load()) {
    return common::Status::success();
  }
  if (common::trim(config_.telegram.bot_token).empty()) {
    return common::Status::error("TELEGRAM_BOT_TOKEN is not set");
  }
  if (http_client_ == nullptr || sessions_ == nullptr) {
    return common::Status::error("telegram bot is missing its http client or session store");
  }
  running_.store(true);
  worker_ = std::thread([this]() { run_loop(); });
  return common::Status::success();
}

void TelegramBot::stop() {
  running_.store(false);
  if (worker_.joinable()) {
    worker_.join();
  }
}

std::uint64_t TelegramBot::next_update_offset() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return next_update_offset_;
}

void TelegramBot::run_loop() {
  while (running_.load()) {
    const auto status = poll_once();
    if (!status.ok()) {
      observability::record_error("telegram", "poll error: " + status.error());
      for (int i = 0; i < 10 && running_.load(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
      }
    }
  }
}

common::Status TelegramBot::poll_once() {
  const std::uint64_t offset = next_update_offset();
  const std::uint64_t timeout_secs = config_.telegram.poll_timeout_secs;

  std::ostringstream body;
  body << "{\"offset\":" << offset << ",\"timeout\":" << timeout_secs
       << ",\"allowed_updates\":[\"message\"]}";

  const auto response =
      http_client_->post_json(base_url_ + "/getUpdates", {{"Content-Type", "application/json"}},
                              body.str(), (timeout_secs + 5) * 1000);
  if (const auto status = check_api_response(response, "getUpdates"); !status.ok()) {
    return status;
  }
  return parse_and_dispatch_updates(response.body);
}

common::Status TelegramBot::parse_and_dispatch_updates(const std::string &response_body) {
  const auto envelope = common::json_parse_object(response_body);
  if (!envelope.has_value() || envelope->count("result") == 0) {
    return common::Status::error("telegram getUpdates response missing result array");
  }

  for (const auto &update_json :
       common::json_split_top_level_objects(common::json_member(*envelope, "result"))) {
    const auto parsed = parse_update(update_json);
    if (!parsed.ok()) {
      observability::record_error("telegram", "skip update: " + parsed.error());
      continue;
    }
    const auto &incoming = parsed.value();
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      next_update_offset_ = std::max(next_update_offset_, incoming.update_id + 1);
    }
    if (common::trim(incoming.text).empty()) {
      continue;
    }
    handle_message(incoming);
  }
  return common::Status::success();
}

void TelegramBot::handle_message(const IncomingMessage &message) {
  observability::record_channel_message("telegram", "inbound");
  const bool allowed = check_allowlist(message.user_id, config_.telegram.allowed_users);
  const std::string command = command_name(message.text);
  const auto send = [&](const std::string &text, const bool html) {
    if (const auto status = send_text(message.chat_id, text, html); !status.ok()) {
      observability::record_error("telegram", status.error());
    }
  };

  if (command == "/help") {
    send("📖 <b>ollacode Help</b>\n\n"
         "Send a message to chat with the coding assistant.\n\n"
         "<b>Features:</b>\n"
         "• Code writing & review\n"
         "• Debugging help\n"
         "• File read/write/edit (diff-based)\n"
         "• File content search (grep)\n"
         "• Command execution\n"
         "• OLLACODE.md project memory\n\n"
         "<b>Commands:</b>\n"
         "/start — Start\n"
         "/clear — Reset conversation\n"
         "/model — Model & token info\n"
         "/help — This help",
         true);
    return;
  }

  if (!allowed) {
    if (command.empty() || command == "/start") {
      send("⛔ Access denied.", false);
    }
    return;
  }

  if (command == "/start") {
    const auto engine = sessions_->get_or_create(message.user_id);
    const std::string memory_status = engine->has_project_memory()
                                          ? "📋 OLLACODE.md loaded"
                                          : "📋 OLLACODE.md not found";
    send("👋 Hello, <b>" + html_escape(message.first_name) + "</b>!\n\n" +
             "I'm <b>ollacode</b> coding assistant.\n" + "🤖 Model: <code>" +
             html_escape(config_.ollama.model) + "</code>\n" + "📊 Max tokens: <code>" +
             std::to_string(config_.max_context_tokens) + "</code>\n" + memory_status +
             "\n\nSend me your coding questions!\n\n" + "<b>Commands:</b>\n" +
             "/clear — Reset conversation\n" + "/help — Help\n" + "/model — Model info",
         true);
    return;
  }
  if (command == "/clear") {
    sessions_->get_or_create(message.user_id)->clear();
    send("✅ Conversation history cleared.", false);
    return;
  }
  if (command == "/model") {
    const auto engine = sessions_->get_or_create(message.user_id);
    send("🤖 <b>Model Info</b>\n\n"
         "Model: <code>" +
             html_escape(config_.ollama.model) + "</code>\nServer: <code>" +
             html_escape(config_.ollama.host) + "</code>\nMessages: <code>" +
             std::to_string(engine->message_count()) + "</code>\nEst. tokens: <code>" +
             std::to_string(engine->estimated_tokens()) + "</code> / " +
             std::to_string(config_.max_context_tokens) + "\nCompact mode: <code>" +
             (config_.compact_mode ? "true" : "false") + "</code>\nProject memory: <code>" +
             (engine->has_project_memory() ? "loaded" : "none") + "</code>",
         true);
    return;
  }
  if (!command.empty()) {
    return;
  }

  const auto engine = sessions_->get_or_create(message.user_id);
  const auto typing = http_client_->post_json(
      base_url_ + "/sendChatAction", {{"Content-Type", "application/json"}},
      "{\"chat_id\":" + std::to_string(message.chat_id) + ",\"action\":\"typing\"}",
      kSendTimeoutMs);
  if (const auto status = check_api_response(typing, "sendChatAction"); !status.ok()) {
    observability::record_error("telegram", status.error());
  }

  const auto response = engine->respond(message.text);
  if (!response.ok()) {
    observability::record_error("telegram", "chat error for user " +
                                                std::to_string(message.user_id) + ": " +
                                                response.error());
    send("❌ Error:\n<code>" + html_escape(response.error()) + "</code>", true);
    return;
  }
  reply(message.chat_id, response.value());
}

void TelegramBot::reply(const std::int64_t chat_id, const std::string &response) {
  for (const auto &part : split_message(format_telegram_html(response))) {
    if (send_text(chat_id, part, true).ok()) {
      continue;
    }
    const auto fallback = send_text(chat_id, common::utf8_prefix(response, MAX_MESSAGE_CHARS), false);
    if (!fallback.ok()) {
      observability::record_error("telegram", fallback.error());
    }
  }
}

common::Status TelegramBot::send_text(const std::int64_t chat_id, const std::string &text,
                                      const bool html) {
  if (common::trim(text).empty()) {
    return common::Status::error("text is required");
  }
  std::ostringstream body;
  body << "{\"chat_id\":" << chat_id << ",\"text\":\"" << common::json_escape(text) << "\"";
  if (html) {
    body << ",\"parse_mode\":\"HTML\"";
  }
  body << "}";

  const auto response = http_client_->post_json(
      base_url_ + "/sendMessage", {{"Content-Type", "application/json"}}, body.str(),
      kSendTimeoutMs);
  auto status = check_api_response(response, "sendMessage");
  if (status.ok()) {
    observability::record_channel_message("telegram", "outbound");
  }
  return status;
}

common::Status TelegramBot::check_api_response(const providers::HttpResponse &response,
                                               const std::string_view operation) const {
  if (response.timeout) {
    return common::Status::error(std::string(operation) + " timeout");
  }
  if (response.network_error) {
    return common::Status::error(std::string(operation) +
                                 " network error: " + response.network_error_message);
  }
  if (response.status < 200 || response.status >= 300) {
    return common::Status::error(std::string(operation) + " failed status=" +
                                 std::to_string(response.status) + " body=" +
                                 common::utf8_prefix(common::trim(response.body),
                                                     kErrorSnippetChars));
  }
  const auto envelope = common::json_parse_object(response.body);
  if (!envelope.has_value() || common::json_member(*envelope, "ok") != "true") {
    return common::Status::error(std::string(operation) + " response missing ok=true");
  }
  return common::Status::success();
}

std::string html_escape(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (const char ch : text) {
    switch (ch) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&quot;";
      break;
    case '\'':
      out += "&#x27;";
      break;
    default:
      out.push_back(ch);
      break;
    }
  }
  return out;
}

std::string format_telegram_html(const std::string &markdown) {
  std::vector<std::pair<std::string, std::string>> code_blocks;
  std::vector<std::pair<std::string, std::string>> inline_codes;

  std::string processed = agent::strip_tool_blocks(markdown);
  processed = extract_code_blocks(processed, code_blocks);
  processed = extract_inline_code(processed, inline_codes);
  processed = html_escape(processed);
  processed = wrap_inline(processed, "**", "<b>", "</b>");
  processed = wrap_inline(processed, "*", "<i>", "</i>");

  for (const auto &[placeholder, replacement] : code_blocks) {
    replace_all(processed, placeholder, replacement);
  }
  for (const auto &[placeholder, replacement] : inline_codes) {
    replace_all(processed, placeholder, replacement);
  }
  return processed;
}

std::vector<std::string> split_message(const std::string &text, const std::size_t max_chars) {
  if (common::utf8_length(text) <= max_chars) {
    return {text};
  }

  std::vector<std::string> parts;
  std::string current;
  std::size_t current_chars = 0;
  for (auto line : common::split(text, '\n')) {
    std::size_t line_chars = common::utf8_length(line);
    if (current_chars + line_chars + 1 > max_chars) {
      if (!current.empty()) {
        parts.push_back(std::move(current));
      }
      while (line_chars > max_chars) {
        parts.push_back(common::utf8_prefix(line, max_chars));
        line = common::utf8_suffix(line, line_chars - max_chars);
        line_chars -= max_chars;
      }
      current = std::move(line);
      current_chars = line_chars;
    } else if (current.empty()) {
      current = std::move(line);
      current_chars = line_chars;
    } else {
      current += "\n" + line;
      current_chars += line_chars + 1;
    }
  }
  if (!current.empty()) {
    parts.push_back(std::move(current));
  }
  return parts;
}

} // namespace ollacode::channels::telegram
