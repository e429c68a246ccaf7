#include "ollacode/cli/commands.hpp"

#include "ollacode/channels/telegram/telegram.hpp"
#include "ollacode/common/fs.hpp"
#include "ollacode/config/config.hpp"
#include "ollacode/observability/factory.hpp"
#include "ollacode/observability/global.hpp"
#include "ollacode/providers/ollama.hpp"
#include "ollacode/sessions/store.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <signal.h>
#include <thread>
#include <utility>
#include <vector>

namespace ollacode::cli {

namespace {

constexpr const char *RESET = "\033[0m";
constexpr const char *BOLD = "\033[1m";
constexpr const char *DIM = "\033[2m";
constexpr const char *CYAN = "\033[36m";
constexpr const char *GREEN = "\033[32m";
constexpr const char *YELLOW = "\033[33m";
constexpr const char *MAGENTA = "\033[35m";
constexpr const char *RED = "\033[31m";

std::atomic<bool> g_interrupted{false};

void handle_interrupt(int) { g_interrupted.store(true); }

/// SIGINT/SIGTERM set a flag instead of killing the process. No SA_RESTART, so
/// a blocked read returns and the loop can notice.
void install_interrupt_handler() {
  struct sigaction action {};
  action.sa_handler = handle_interrupt;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  sigaction(SIGINT, &action, nullptr);
  sigaction(SIGTERM, &action, nullptr);
}

std::string version_string() {
#ifdef OLLACODE_VERSION
  const std::string version = OLLACODE_VERSION;
#else
  const std::string version = "0.1.0";
#endif
  return "ollacode " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

enum class OptionLookup { Absent, Taken, MissingValue };

/// Removes `--name value` or `--name=value` from `args`.
OptionLookup take_option(std::vector<std::string> &args, const std::string &long_name,
                         std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name) {
      if (i + 1 >= args.size()) {
        return OptionLookup::MissingValue;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return OptionLookup::Taken;
    }
    if (common::starts_with(args[i], long_name + "=")) {
      out_value = args[i].substr(long_name.size() + 1);
      args.erase(args.begin() + static_cast<long>(i));
      return OptionLookup::Taken;
    }
  }
  return OptionLookup::Absent;
}

bool take_valued_options(std::vector<std::string> &args,
                         const std::vector<std::pair<std::string, std::string *>> &options) {
  for (const auto &[name, value] : options) {
    if (take_option(args, name, *value) == OptionLookup::MissingValue) {
      std::cerr << name << " requires a value\n";
      return false;
    }
  }
  return true;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  const bool present = std::any_of(args.begin(), args.end(), [](const std::string &arg) {
    return arg == "--config" || common::starts_with(arg, "--config=");
  });
  if (!present) {
    return true;
  }
  std::string path;
  if (take_option(args, "--config", path) != OptionLookup::Taken || common::trim(path).empty()) {
    error = "missing value for --config";
    return false;
  }
  config::set_config_path_override(path);
  return true;
}

/// Loads, overrides and validates the configuration, then installs the observer.
common::Result<config::Config> prepare_config(const std::string &model,
                                              const std::string &workspace) {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return loaded;
  }
  auto cfg = loaded.value();
  if (!model.empty()) {
    cfg.ollama.model = model;
  }
  if (!workspace.empty()) {
    cfg.workspace_dir = workspace;
    config::resolve_workspace(cfg);
  }

  const auto validated = config::validate_config(cfg);
  if (!validated.ok()) {
    return common::Result<config::Config>::failure(validated.error());
  }
  for (const auto &warning : validated.value()) {
    std::cerr << YELLOW << "⚠️  " << warning << RESET << "\n";
  }
  observability::set_global_observer(observability::create_observer(cfg));
  return common::Result<config::Config>::success(std::move(cfg));
}

void print_banner(const agent::ConversationEngine &engine, const config::Config &cfg,
                  const bool auto_approve, std::ostream &out) {
  out << "\n" << BOLD << MAGENTA;
  out << "   ____  _ _         _____          _\n";
  out << "  / __ \\| | |       / ____|        | |\n";
  out << " | |  | | | | __ _ | |     ___   __| | ___\n";
  out << " | |  | | | |/ _` || |    / _ \\ / _` |/ _ \\\n";
  out << " | |__| | | | (_| || |___| (_) | (_| |  __/\n";
  out << "  \\____/|_|_|\\__,_| \\_____\\___/ \\__,_|\\___|\n" << RESET << "\n";
  out << DIM << "  Lightweight coding assistant " << version_string() << RESET << "\n";
  out << DIM << "  Model: " << RESET << CYAN << cfg.ollama.model << RESET << DIM
      << "  |  /help for commands" << RESET << "\n";
  if (engine.has_project_memory()) {
    out << DIM << "  📋 " << RESET << GREEN << "OLLACODE.md loaded" << RESET << "\n";
  } else {
    out << DIM << "  📋 OLLACODE.md not found (create in project root)" << RESET << "\n";
  }
  out << DIM << "  🔐 Auto-approve: " << RESET
      << (auto_approve ? std::string(GREEN) + "ON" : std::string(YELLOW) + "OFF") << RESET << "\n";
  out << DIM << "  📊 Max tokens: " << cfg.max_context_tokens
      << " | Compact: " << (cfg.compact_mode ? "ON" : "OFF") << RESET << "\n\n";
}

void print_repl_help(std::ostream &out) {
  out << "\n" << BOLD << CYAN << "📖 Usage" << RESET << "\n\n";
  out << "  Type a message to chat with the coding assistant.\n\n";
  out << BOLD << CYAN << "📌 Commands" << RESET << "\n\n";
  out << "  " << GREEN << "/help" << RESET << "        Show this help\n";
  out << "  " << GREEN << "/clear" << RESET << "       Reset conversation history\n";
  out << "  " << GREEN << "/model" << RESET << "       Show model info and token usage\n";
  out << "  " << GREEN << "/approve" << RESET << "     Toggle auto-approve mode\n";
  out << "  " << GREEN << "/quit" << RESET << "        Exit\n";
  out << "  " << GREEN << "Ctrl+C" << RESET << "       Interrupt a response\n\n";
  out << DIM << "  Tip: End a line with \\ for multi-line input" << RESET << "\n\n";
  out << BOLD << CYAN << "📋 Project Memory" << RESET << "\n\n";
  out << "  Create " << GREEN << "OLLACODE.md" << RESET << " in your project root\n";
  out << "  to automatically load project context.\n\n";
}

void print_help() {
  std::cout << "\n";
  std::cout << BOLD << MAGENTA << "  ollacode" << RESET << DIM
            << " — Lightweight coding assistant powered by Ollama" << RESET << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "ollacode [--config PATH] [command] [options]\n\n";

  std::cout << BOLD << "  COMMANDS" << RESET << "\n";
  std::cout << "  " << GREEN << "cli" << RESET << DIM << "            Interactive chat (default)"
            << RESET << "\n";
  std::cout << "  " << GREEN << "telegram" << RESET << DIM << "       Run the Telegram bot"
            << RESET << "\n";
  std::cout << "  " << GREEN << "config-path" << RESET << DIM
            << "    Print the configuration file path" << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "        Show version" << RESET
            << "\n\n";

  std::cout << BOLD << "  OPTIONS" << RESET << "\n";
  std::cout << "  " << YELLOW << "--model NAME" << RESET << DIM << "       Model to use" << RESET
            << "\n";
  std::cout << "  " << YELLOW << "--auto-approve" << RESET << DIM
            << "     Approve every tool action (cli)" << RESET << "\n";
  std::cout << "  " << YELLOW << "--workspace DIR" << RESET << DIM
            << "    Directory the tools may touch" << RESET << "\n\n";
}

/// Reads one logical input line; a trailing backslash continues it.
/// Returns false at end of input.
bool read_input(std::istream &in, std::ostream &out, std::string &input) {
  input.clear();
  std::string line;
  while (true) {
    if (!std::getline(in, line)) {
      return false;
    }
    if (!line.empty() && line.back() == '\\') {
      input += line.substr(0, line.size() - 1) + "\n";
      out << DIM << "  … " << RESET << std::flush;
      continue;
    }
    input += line;
    return true;
  }
}

int run_chat(std::vector<std::string> args) {
  std::string model;
  std::string workspace;
  if (!take_valued_options(args, {{"--model", &model}, {"--workspace", &workspace}})) {
    return 1;
  }
  const bool auto_approve = take_flag(args, "--auto-approve");
  if (!args.empty()) {
    std::cerr << "Unknown option: " << args.front() << "\n";
    return 1;
  }

  auto cfg = prepare_config(model, workspace);
  if (!cfg.ok()) {
    std::cerr << RED << "❌ " << cfg.error() << RESET << "\n";
    return 1;
  }
  const auto &config = cfg.value();

  auto backend = std::make_shared<providers::OllamaClient>(config.ollama);
  std::cout << "\n" << DIM << "🔌 Checking Ollama server..." << RESET << "\n";
  if (!backend->check_health()) {
    std::cout << RED << "❌ Cannot connect to Ollama server!" << RESET << "\n";
    std::cout << DIM << "   Server: " << config.ollama.host << RESET << "\n";
    std::cout << DIM << "   Run 'ollama serve' to start the server." << RESET << "\n";
    return 1;
  }

  agent::ConversationEngine engine(backend, config.workspace_dir, agent::engine_options(config));
  auto approval = std::make_shared<tools::PromptApproval>(std::cin, std::cout);
  approval->set_always(auto_approve);
  engine.set_approval_gate(approval);

  install_interrupt_handler();
  print_banner(engine, config, auto_approve, std::cout);
  return run_repl(engine, config, *approval, std::cin, std::cout);
}

int run_telegram(std::vector<std::string> args) {
  std::string model;
  if (!take_valued_options(args, {{"--model", &model}})) {
    return 1;
  }

  auto cfg = prepare_config(model, "");
  if (!cfg.ok()) {
    std::cerr << RED << "❌ " << cfg.error() << RESET << "\n";
    return 1;
  }
  const auto config = cfg.value();
  if (common::trim(config.telegram.bot_token).empty()) {
    std::cout << RED << "❌ TELEGRAM_BOT_TOKEN is not set." << RESET << "\n";
    std::cout << "   Set TELEGRAM_BOT_TOKEN in your .env file.\n";
    std::cout << "   Create a bot via @BotFather to get a token.\n";
    return 1;
  }

  auto sessions = std::make_shared<sessions::SessionStore>([config](std::int64_t) {
    auto backend = std::make_shared<providers::OllamaClient>(config.ollama);
    auto engine = std::make_shared<agent::ConversationEngine>(backend, config.workspace_dir,
                                                              agent::engine_options(config));
    engine->set_approval_gate(std::make_shared<tools::AutoApprove>());
    return engine;
  });

  std::string allowed = "all";
  if (!config.telegram.allowed_users.empty()) {
    std::ostringstream ids;
    for (std::size_t i = 0; i < config.telegram.allowed_users.size(); ++i) {
      ids << (i > 0 ? ", " : "") << config.telegram.allowed_users[i];
    }
    allowed = ids.str();
  }
  std::cout << "🤖 Starting ollacode Telegram bot...\n";
  std::cout << "   Model: " << config.ollama.model << "\n";
  std::cout << "   Server: " << config.ollama.host << "\n";
  std::cout << "   Allowed users: " << allowed << "\n";
  std::cout << "   Workspace: " << config.workspace_dir << "\n";
  std::cout << "   Max tokens: " << config.max_context_tokens << "\n";
  std::cout << "   Compact mode: " << (config.compact_mode ? "true" : "false") << "\n";
  std::cout << "   Ctrl+C to stop" << std::endl;

  channels::telegram::TelegramBot bot(config, sessions);
  install_interrupt_handler();
  if (const auto status = bot.start(); !status.ok()) {
    std::cerr << RED << "❌ " << status.error() << RESET << "\n";
    return 1;
  }
  while (!g_interrupted.load() && bot.running()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
  bot.stop();
  std::cout << "\n👋 Telegram bot stopped.\n";
  return 0;
}

} // namespace

int run_repl(agent::ConversationEngine &engine, const config::Config &config,
             tools::PromptApproval &approval, std::istream &in, std::ostream &out) {
  std::string input;
  while (true) {
    out << BOLD << CYAN << "ollacode ❯ " << RESET << std::flush;
    if (!read_input(in, out, input)) {
      if (g_interrupted.exchange(false)) {
        in.clear();
        out << "\n" << DIM << "Ctrl+C — use /quit to exit" << RESET << "\n";
        continue;
      }
      out << "\n";
      break;
    }

    input = common::trim(input);
    if (input.empty()) {
      continue;
    }

    if (input.front() == '/') {
      const std::string command = common::to_lower(input.substr(0, input.find_first_of(" \t\n")));
      if (command == "/quit" || command == "/exit" || command == "/q") {
        out << DIM << "👋 Goodbye!" << RESET << "\n";
        break;
      }
      if (command == "/clear") {
        engine.clear();
        out << GREEN << "✅ Conversation history cleared." << RESET << "\n";
      } else if (command == "/help") {
        print_repl_help(out);
      } else if (command == "/model") {
        out << DIM << "Model: " << RESET << CYAN << config.ollama.model << RESET << "\n"
            << DIM << "Server: " << RESET << CYAN << config.ollama.host << RESET << "\n"
            << DIM << "Messages: " << RESET << CYAN << engine.message_count() << RESET << "\n"
            << DIM << "Est. tokens: " << RESET << CYAN << engine.estimated_tokens() << RESET
            << " / " << config.max_context_tokens << "\n"
            << DIM << "Project memory: " << RESET << CYAN
            << (engine.has_project_memory() ? "loaded" : "none") << RESET << "\n"
            << DIM << "Compact mode: " << RESET << CYAN << (config.compact_mode ? "true" : "false")
            << RESET << "\n"
            << DIM << "Auto-approve: " << RESET << CYAN << (approval.always() ? "true" : "false")
            << RESET << "\n";
      } else if (command == "/approve") {
        approval.set_always(!approval.always());
        if (approval.always()) {
          out << GREEN << "🔓 Auto-approve ON — all tool actions auto-approved." << RESET << "\n";
        } else {
          out << YELLOW << "🔐 Auto-approve OFF — will ask before tool execution." << RESET
              << "\n";
        }
      } else {
        out << YELLOW << "Unknown command: " << command << RESET << "\n";
      }
      continue;
    }

    out << "\n";
    g_interrupted.store(false);
    const auto turn = engine.respond_stream(input, [&](std::string_view fragment) {
      if (g_interrupted.load()) {
        return false;
      }
      out << fragment << std::flush;
      return true;
    });
    if (!turn.ok()) {
      out << "\n" << RED << "❌ Error: " << turn.error() << RESET << "\n\n";
      continue;
    }
    if (turn.value().cancelled) {
      g_interrupted.store(false);
      out << "\n" << YELLOW << "⚠️ Response interrupted." << RESET << "\n\n";
      continue;
    }
    out << "\n\n";
  }
  return 0;
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  std::string subcommand = "cli";
  if (!args.empty() && !common::starts_with(args.front(), "--")) {
    subcommand = args.front();
    args.erase(args.begin());
  }

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help" ||
      take_flag(args, "--help")) {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version" ||
      take_flag(args, "--version")) {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "cli") {
    return run_chat(std::move(args));
  }
  if (subcommand == "telegram") {
    return run_telegram(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace ollacode::cli
