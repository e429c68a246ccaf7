#include "test_framework.hpp"

#include "ollacode/agent/compactor.hpp"
#include "ollacode/agent/engine.hpp"
#include "ollacode/agent/prompt.hpp"
#include "ollacode/agent/tool_call_parser.hpp"
#include "ollacode/common/fs.hpp"
#include "ollacode/tools/approval.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>
#include <memory>

namespace {

using ollacode::agent::Message;
using ollacode::agent::Role;
using ollacode::tests::require;

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

std::string tool_block(const std::string &json) { return "```tool\n" + json + "\n```"; }

struct EngineFixture {
  ollacode::testing::TempWorkspace workspace;
  std::shared_ptr<ollacode::testing::ScriptedBackend> backend =
      std::make_shared<ollacode::testing::ScriptedBackend>();

  std::unique_ptr<ollacode::agent::ConversationEngine>
  make(ollacode::agent::EngineOptions options = {}) {
    auto engine =
        std::make_unique<ollacode::agent::ConversationEngine>(backend, workspace.path(), options);
    engine->set_approval_gate(std::make_shared<ollacode::tools::AutoApprove>());
    return engine;
  }
};

std::vector<Message> long_history(std::size_t turns) {
  std::vector<Message> history{{.role = Role::System, .content = "system prompt"}};
  for (std::size_t i = 0; i < turns; ++i) {
    history.push_back({.role = Role::User, .content = "question " + std::to_string(i) + " " +
                                                      std::string(400, 'q')});
    history.push_back({.role = Role::Assistant,
                       .content = "answer " + std::to_string(i) + "\n" + std::string(400, 'a')});
  }
  return history;
}

} // namespace

void register_agent_tests(std::vector<ollacode::tests::TestCase> &tests) {
  tests.push_back({"parser_returns_nothing_without_blocks", [] {
                     require(ollacode::agent::parse_tool_calls("just prose\n```python\nx\n```").empty(),
                             "no tool blocks");
                     require(ollacode::agent::parse_tool_calls("").empty(), "empty text");
                   }});

  tests.push_back({"parser_extracts_name_and_parameters", [] {
                     const auto calls = ollacode::agent::parse_tool_calls(
                         "I'll read it.\n" +
                         tool_block(R"({"tool": "read_file", "path": "src/a.py", "start_line": 5})") +
                         "\nthanks");
                     require(calls.size() == 1, "one call");
                     require(calls[0].name == "read_file", "name");
                     require(calls[0].parameters.at("path") == "src/a.py", "string param");
                     require(calls[0].parameters.at("start_line") == "5", "number param as text");
                     require(calls[0].parameters.count("tool") == 0, "tool key removed");
                   }});

  tests.push_back({"parser_skips_invalid_blocks_and_keeps_order", [] {
                     const std::string text =
                         tool_block(R"({"tool": "list_directory"})") + "\n" +
                         tool_block("{not json}") + "\n" + tool_block(R"({"path": "x"})") + "\n" +
                         "```tool   \n  " + R"({"tool": "grep_search", "query": "TODO"})" + "\n```";
                     const auto calls = ollacode::agent::parse_tool_calls(text);
                     require(calls.size() == 2, "invalid and tool-less blocks skipped");
                     require(calls[0].name == "list_directory", "first in order");
                     require(calls[1].name == "grep_search", "second in order");
                     require(calls[1].parameters.at("query") == "TODO", "query param");
                   }});

  tests.push_back({"parser_requires_newline_after_fence", [] {
                     require(ollacode::agent::parse_tool_calls(
                                 R"(```tool {"tool": "read_file"}
```)")
                                 .empty(),
                             "fence and body on one line is not a block");
                     require(ollacode::agent::parse_tool_calls("```tool\n{\"tool\": \"x\"}").empty(),
                             "unterminated block");
                   }});

  tests.push_back({"strip_tool_blocks_removes_only_blocks", [] {
                     const auto stripped = ollacode::agent::strip_tool_blocks(
                         "before\n" + tool_block(R"({"tool": "read_file"})") + "\nafter");
                     require(stripped == "before\n\nafter", stripped);
                   }});

  tests.push_back({"estimate_tokens_weights_hangul", [] {
                     std::string text;
                     for (int i = 0; i < 8; ++i) {
                       text += "\xED\x95\x9C";
                     }
                     text += std::string(16, 'x');
                     require(ollacode::agent::estimate_tokens(text) == 9, "8/1.5 + 16/4 floors to 9");
                     require(ollacode::agent::estimate_tokens("") == 0, "empty");
                     require(ollacode::agent::estimate_tokens("abcdefgh") == 2, "ascii per four");
                   }});

  tests.push_back({"compaction_preserves_system_and_recent_messages", [] {
                     auto history = long_history(10);
                     const auto original = history;
                     const bool compacted = ollacode::agent::maybe_compact(
                         history, {.enabled = true, .max_context_tokens = 500});
                     require(compacted, "over budget history compacts");
                     require(history.size() == 2 + ollacode::agent::PRESERVE_RECENT, "size");
                     require(history[0].content == original[0].content, "system kept");
                     require(history[1].role == Role::User, "summary is a user message");
                     require(ollacode::common::starts_with(
                                 history[1].content, std::string(ollacode::agent::SUMMARY_HEADER)),
                             history[1].content);
                     for (std::size_t i = 0; i < ollacode::agent::PRESERVE_RECENT; ++i) {
                       require(history[history.size() - 1 - i].content ==
                                   original[original.size() - 1 - i].content,
                               "recent message kept verbatim");
                     }
                     const auto lines = ollacode::common::split(history[1].content, '\n');
                     require(lines.size() == 1 + ollacode::agent::MAX_SUMMARY_LINES,
                             "summary capped at ten lines");
                     require(contains(history[1].content, "Assistant: answer 6"),
                             "assistant first line summarized");
                     require(!contains(history[1].content, "aaaa"), "only the first line kept");
                   }});

  tests.push_back({"compaction_is_noop_when_disabled_small_or_short", [] {
                     auto history = long_history(10);
                     require(!ollacode::agent::maybe_compact(history, {.enabled = false,
                                                                       .max_context_tokens = 10}),
                             "disabled");
                     require(!ollacode::agent::maybe_compact(history, {.enabled = true,
                                                                       .max_context_tokens = 1'000'000}),
                             "under budget");
                     auto short_history = long_history(3);
                     require(!ollacode::agent::maybe_compact(short_history,
                                                             {.enabled = true, .max_context_tokens = 10}),
                             "seven messages or fewer are never compacted");
                     require(short_history.size() == 7, "unchanged");
                   }});

  tests.push_back({"compaction_summarizes_tool_results_as_placeholder", [] {
                     auto history = long_history(6);
                     history[3].content = std::string(ollacode::agent::TOOL_RESULTS_HEADER) +
                                          "\n\n" + std::string(500, 'r');
                     require(ollacode::agent::maybe_compact(history, {.enabled = true,
                                                                      .max_context_tokens = 100}),
                             "compacts");
                     require(contains(history[1].content, "[tool results processed]"),
                             history[1].content);
                   }});

  tests.push_back({"compact_tool_result_keeps_head_and_tail", [] {
                     const std::string small(800, 's');
                     require(ollacode::agent::compact_tool_result("read_file", small) == small,
                             "threshold is inclusive");
                     const std::string big = std::string(300, 'h') + std::string(400, 'm') +
                                             std::string(200, 't');
                     const auto compacted = ollacode::agent::compact_tool_result("read_file", big);
                     require(ollacode::common::starts_with(
                                 compacted, "[read_file result — 900 chars, compressed]\n"),
                             compacted.substr(0, 60));
                     require(contains(compacted, std::string(300, 'h') + "\n... (truncated) ...\n" +
                                                     std::string(200, 't')),
                             "head and tail present");
                     require(!contains(compacted, "mmm"), "middle dropped");
                   }});

  tests.push_back({"engine_answers_without_tools", [] {
                     EngineFixture fixture;
                     fixture.backend->push_reply("Hi there.");
                     auto engine = fixture.make();
                     const auto result = engine->respond("hello");
                     require(result.ok(), result.error());
                     require(result.value() == "Hi there.", "final text");
                     require(engine->message_count() == 2, "user and assistant recorded");
                     require(fixture.backend->requests.size() == 1, "one backend call");
                     const auto &sent = fixture.backend->requests[0];
                     require(sent.front().role == "system" && sent.back().role == "user" &&
                                 sent.back().content == "hello",
                             "system first, user last");
                   }});

  tests.push_back({"engine_runs_tools_and_feeds_results_back", [] {
                     EngineFixture fixture;
                     fixture.workspace.create_file("a.txt", "alpha\n");
                     fixture.backend->push_reply(
                         "Reading.\n" + tool_block(R"({"tool": "read_file", "path": "a.txt"})"));
                     fixture.backend->push_reply("The file says alpha.");
                     auto engine = fixture.make();

                     const auto result = engine->respond("what is in a.txt?");
                     require(result.ok(), result.error());
                     require(result.value() == "The file says alpha.", result.value());
                     const auto &history = engine->history();
                     require(history.size() == 5, "system, user, assistant, results, assistant");
                     const auto &follow_up = history[3].content;
                     require(history[3].role == Role::User, "results sent as user");
                     require(ollacode::common::starts_with(
                                 follow_up, std::string(ollacode::agent::TOOL_RESULTS_HEADER)),
                             follow_up);
                     require(contains(follow_up, "**[read_file result]**\n📄 **a.txt**"), follow_up);
                     require(contains(follow_up, "Please respond to the user based on the above results."),
                             follow_up);
                     require(fixture.backend->requests[1].back().content == follow_up,
                             "second request ends with results");
                   }});

  tests.push_back({"engine_asks_for_fix_when_a_tool_fails", [] {
                     EngineFixture fixture;
                     fixture.backend->push_reply(
                         tool_block(R"({"tool": "list_directory"})") + "\n" +
                         tool_block(R"({"tool": "read_file", "path": "missing.txt"})"));
                     fixture.backend->push_reply("Sorry, it does not exist.");
                     auto engine = fixture.make();
                     const auto result = engine->respond("read missing.txt");
                     require(result.ok(), result.error());
                     const auto &follow_up = engine->history()[3].content;
                     require(contains(follow_up, "\n\n---\n\n**[read_file result]**\n❌"), follow_up);
                     require(contains(follow_up, "Some tools returned errors"), follow_up);
                   }});

  tests.push_back({"engine_stops_after_iteration_cap", [] {
                     EngineFixture fixture;
                     for (std::size_t i = 0; i < ollacode::agent::MAX_TOOL_ITERATIONS + 2; ++i) {
                       fixture.backend->push_reply("round " + std::to_string(i) + "\n" +
                                                   tool_block(R"({"tool": "list_directory"})"));
                     }
                     auto engine = fixture.make();
                     const auto result = engine->respond("loop forever");
                     require(result.ok(), result.error());
                     require(fixture.backend->requests.size() == ollacode::agent::MAX_TOOL_ITERATIONS,
                             "backend called exactly the cap");
                     require(ollacode::common::starts_with(result.value(), "round 9"),
                             "last response returned");
                     require(engine->history().size() == 2 + 2 * ollacode::agent::MAX_TOOL_ITERATIONS,
                             "each round stores reply and results");
                   }});

  tests.push_back({"engine_backend_error_keeps_user_message", [] {
                     EngineFixture fixture;
                     fixture.backend->push_error("Provider error [network] connection refused");
                     auto engine = fixture.make();
                     const auto result = engine->respond("hello?");
                     require(!result.ok(), "error surfaces");
                     require(contains(result.error(), "connection refused"), result.error());
                     require(engine->message_count() == 1, "only the user message added");
                     require(engine->history().back().content == "hello?", "user message kept");
                   }});

  tests.push_back({"engine_clear_resets_to_system_prompt", [] {
                     EngineFixture fixture;
                     fixture.backend->push_reply("one");
                     auto engine = fixture.make();
                     require(engine->respond("x").ok(), "respond");
                     engine->clear();
                     require(engine->history().size() == 1, "only system left");
                     require(engine->history()[0].role == Role::System, "system role");
                     require(engine->estimated_tokens() > 0, "prompt has tokens");
                   }});

  tests.push_back({"engine_appends_project_memory", [] {
                     EngineFixture fixture;
                     fixture.workspace.create_file("OLLACODE.md", "Always use tabs.\n");
                     auto engine = fixture.make();
                     require(engine->has_project_memory(), "memory detected");
                     const auto &system = engine->history()[0].content;
                     require(ollacode::common::starts_with(
                                 system, std::string(ollacode::agent::base_system_prompt())),
                             "base prompt first");
                     require(contains(system, "Always use tabs."), "rules appended");

                     ollacode::testing::TempWorkspace empty;
                     require(ollacode::agent::load_project_memory(empty.path()).empty(),
                             "no file gives no memory");
                   }});

  tests.push_back({"engine_stream_delivers_fragments_and_tool_notices", [] {
                     EngineFixture fixture;
                     fixture.workspace.create_file("n.txt", "x\n");
                     fixture.backend->push_reply("Listing.\n" +
                                                 tool_block(R"({"tool": "list_directory"})"));
                     fixture.backend->push_reply("One file.");
                     auto engine = fixture.make();

                     std::string streamed;
                     const auto result = engine->respond_stream("list", [&](std::string_view part) {
                       streamed.append(part);
                       return true;
                     });
                     require(result.ok(), result.error());
                     require(!result.value().cancelled, "not cancelled");
                     require(result.value().text == "One file.", result.value().text);
                     require(contains(streamed, "⚙️ *Running: list_directory...*"), streamed);
                     require(contains(streamed, "📄 n.txt"), "short result shown inline");
                     require(contains(streamed, "\n\n---\n\nOne file."), streamed);
                     require(engine->history().size() == 5, "same history as respond");
                   }});

  tests.push_back({"engine_stream_cancel_restores_history", [] {
                     EngineFixture fixture;
                     fixture.backend->push_reply("first answer");
                     fixture.backend->push_reply("a long streamed answer that gets interrupted");
                     auto engine = fixture.make();
                     require(engine->respond("first").ok(), "first turn");
                     const auto before = engine->history().size();

                     std::size_t delivered = 0;
                     const auto result = engine->respond_stream("second", [&](std::string_view) {
                       ++delivered;
                       return delivered < 2;
                     });
                     require(result.ok(), result.error());
                     require(result.value().cancelled, "cancelled");
                     require(delivered == 2, "no fragments after cancel");
                     require(engine->history().size() == before, "history restored");
                     require(engine->history().back().content == "first answer", "previous turn intact");
                   }});

  tests.push_back({"engine_stream_cancel_before_tool_skips_side_effects", [] {
                     EngineFixture fixture;
                     fixture.backend->push_reply(
                         tool_block(R"({"tool": "write_file", "path": "out.txt", "content": "x"})"));
                     auto engine = fixture.make();
                     const auto result = engine->respond_stream("write", [](std::string_view part) {
                       return part.find("Running") == std::string_view::npos;
                     });
                     require(result.ok(), result.error());
                     require(result.value().cancelled, "cancelled at tool notice");
                     require(!std::filesystem::exists(fixture.workspace.path() / "out.txt"),
                             "tool never ran");
                     require(engine->history().size() == 1, "history restored to system only");
                   }});
}
