#include "test_framework.hpp"

#include "ollacode/common/fs.hpp"
#include "ollacode/tools/approval.hpp"
#include "ollacode/tools/executor.hpp"
#include "ollacode/tools/tool_kind.hpp"
#include "ollacode/tools/workspace.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <cstdio>
#include <filesystem>
#include <memory>
#include <sstream>

namespace {

using ollacode::tests::require;
using ollacode::tools::ToolParams;
using ollacode::tools::ToolResult;

class RecordingGate final : public ollacode::tools::ApprovalGate {
public:
  explicit RecordingGate(bool answer) : answer_(answer) {}

  [[nodiscard]] bool decide(const std::string &tool_name,
                            const std::string &description) override {
    tools.push_back(tool_name);
    descriptions.push_back(description);
    return answer_;
  }

  std::vector<std::string> tools;
  std::vector<std::string> descriptions;

private:
  bool answer_;
};

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

void require_failure(const ToolResult &result, const std::string &context) {
  require(result.is_error, context + ": expected failure, got: " + result.text);
  require(ollacode::common::starts_with(result.text,
                                        std::string(ollacode::tools::FAILURE_MARKER)),
          context + ": failure marker missing: " + result.text);
}

void require_success(const ToolResult &result, const std::string &context) {
  require(!result.is_error && !result.skipped, context + ": " + result.text);
}

} // namespace

void register_tools_tests(std::vector<ollacode::tests::TestCase> &tests) {
  tests.push_back({"tool_kind_names_round_trip", [] {
                     for (const auto kind : ollacode::tools::ALL_TOOL_KINDS) {
                       const auto name = ollacode::tools::tool_kind_name(kind);
                       require(ollacode::tools::tool_kind_from_name(name) == kind,
                               "round trip for " + std::string(name));
                     }
                     require(!ollacode::tools::tool_kind_from_name("delete_everything").has_value(),
                             "unknown name");
                     require(ollacode::tools::requires_approval(ollacode::tools::ToolKind::RunCommand),
                             "commands need approval");
                     require(!ollacode::tools::requires_approval(ollacode::tools::ToolKind::ReadFile),
                             "reads need no approval");
                   }});

  tests.push_back({"workspace_resolve_rejects_escapes", [] {
                     ollacode::testing::TempWorkspace temp;
                     const ollacode::tools::Workspace workspace(temp.path());
                     require(workspace.resolve("src/../a.txt").ok(), "inner dotdot is fine");
                     require(workspace.resolve("").value() == workspace.root(), "empty is root");
                     require(!workspace.resolve("../x").ok(), "parent escape");
                     require(!workspace.resolve("/etc/passwd").ok(), "absolute escape");
                     require(workspace.resolve((temp.path() / "a.txt").string()).ok(),
                             "absolute inside is fine");
                     require(workspace.relative(temp.path() / "d" / "f.txt") == "d/f.txt",
                             "relative path");
                   }});

  tests.push_back({"workspace_resolve_rejects_symlink_escape", [] {
                     ollacode::testing::TempWorkspace temp;
                     std::filesystem::create_symlink("/etc", temp.path() / "link");
                     const ollacode::tools::Workspace workspace(temp.path());
                     require(!workspace.resolve("link/passwd").ok(), "symlink out of root");
                   }});

  tests.push_back({"every_path_tool_rejects_paths_outside_workspace", [] {
                     ollacode::testing::TempWorkspace temp;
                     ollacode::tools::ToolExecutor executor(temp.path());
                     executor.set_approval_gate(std::make_shared<ollacode::tools::AutoApprove>());
                     for (const std::string path : {"../x", "/etc/passwd"}) {
                       require_failure(executor.execute("read_file", {{"path", path}}), "read " + path);
                       require_failure(
                           executor.execute("write_file", {{"path", path}, {"content", "x"}}),
                           "write " + path);
                       require_failure(executor.execute("edit_file", {{"path", path},
                                                                      {"search", "root"},
                                                                      {"replace", "x"}}),
                                       "edit " + path);
                       require_failure(executor.execute("list_directory", {{"path", path}}),
                                       "list " + path);
                       require_failure(
                           executor.execute("search_files", {{"pattern", "*"}, {"path", path}}),
                           "search " + path);
                       require_failure(
                           executor.execute("grep_search", {{"query", "root"}, {"path", path}}),
                           "grep " + path);
                     }
                     require(!std::filesystem::exists(temp.path().parent_path() / "x"),
                             "nothing written outside");
                   }});

  tests.push_back({"unknown_tool_is_reported", [] {
                     ollacode::testing::TempWorkspace temp;
                     ollacode::tools::ToolExecutor executor(temp.path());
                     const auto result = executor.execute("format_disk", {});
                     require_failure(result, "unknown tool");
                     require(contains(result.text, "Unknown tool: format_disk"), result.text);
                   }});

  tests.push_back({"read_file_numbers_lines_and_windows", [] {
                     ollacode::testing::TempWorkspace temp;
                     std::string big;
                     for (int i = 1; i <= 250; ++i) {
                       big += "row " + std::to_string(i) + "\n";
                     }
                     temp.create_file("big.txt", big);
                     temp.create_file("small.txt", "alpha\nbeta");
                     ollacode::tools::ToolExecutor executor(temp.path());

                     const auto small = executor.execute("read_file", {{"path", "small.txt"}});
                     require_success(small, "small read");
                     require(contains(small.text, "📄 **small.txt** (2 lines)"), small.text);
                     require(contains(small.text, "   1 | alpha\n   2 | beta"), small.text);

                     const auto window = executor.execute("read_file", {{"path", "big.txt"}});
                     require(contains(window.text, "(251 lines, showing L1-200)"), window.text);
                     require(contains(window.text, "... (51 more lines)"), window.text);

                     const auto ranged = executor.execute(
                         "read_file", {{"path", "big.txt"}, {"start_line", "10"}, {"end_line", "12"}});
                     require(contains(ranged.text, "  10 | row 10\n  11 | row 11\n  12 | row 12"),
                             ranged.text);
                     require(!contains(ranged.text, "row 13"), "window end respected");
                   }});

  tests.push_back({"read_file_reports_missing_binary_and_bad_params", [] {
                     ollacode::testing::TempWorkspace temp;
                     temp.create_file("blob.bin", std::string("\x00\xFF\xFE", 3));
                     ollacode::tools::ToolExecutor executor(temp.path());
                     const auto missing = executor.execute("read_file", {{"path", "nope.txt"}});
                     require_failure(missing, "missing");
                     require(contains(missing.text, "File not found"), missing.text);
                     const auto binary = executor.execute("read_file", {{"path", "blob.bin"}});
                     require(contains(binary.text, "Cannot read binary file"), binary.text);
                     const auto dir = executor.execute("read_file", {{"path", "."}});
                     require(contains(dir.text, "Not a file"), dir.text);
                     temp.create_file("ok.txt", "x");
                     const auto bad = executor.execute("read_file",
                                                       {{"path", "ok.txt"}, {"start_line", "abc"}});
                     require_failure(bad, "non-numeric start_line");
                     require(contains(bad.text, "Tool error (read_file)"), bad.text);
                     const auto huge = executor.execute("read_file",
                                                        {{"path", "ok.txt"}, {"end_line", "1e300"}});
                     require_failure(huge, "out-of-range end_line");
                     require(contains(huge.text, "invalid integer for 'end_line'"), huge.text);
                     const auto negative = executor.execute(
                         "read_file", {{"path", "ok.txt"}, {"end_line", "-5"}});
                     require(contains(negative.text, "(1 more lines)"), negative.text);
                     require(!contains(negative.text, "L1--"), negative.text);
                   }});

  tests.push_back({"write_file_creates_parents_after_approval", [] {
                     ollacode::testing::TempWorkspace temp;
                     ollacode::tools::ToolExecutor executor(temp.path());
                     auto gate = std::make_shared<RecordingGate>(true);
                     executor.set_approval_gate(gate);

                     const auto created = executor.execute(
                         "write_file", {{"path", "src/new/app.py"}, {"content", "print(1)\nprint(2)\n"}});
                     require_success(created, "create");
                     require(contains(created.text, "✅ File create done: app.py (3 lines)"),
                             created.text);
                     require(temp.read_file("src/new/app.py") == "print(1)\nprint(2)\n", "content");
                     require(gate->tools.size() == 1 && gate->tools[0] == "write_file", "gate consulted");
                     require(contains(gate->descriptions[0], "📝 File create: app.py"),
                             gate->descriptions[0]);

                     const auto modified = executor.execute(
                         "write_file", {{"path", "src/new/app.py"}, {"content", "print(3)\n"}});
                     require(contains(modified.text, "File modify done"), modified.text);
                     require(contains(gate->descriptions[1], "```diff"), "overwrite shows diff");
                   }});

  tests.push_back({"denied_write_is_skipped_without_side_effects", [] {
                     ollacode::testing::TempWorkspace temp;
                     ollacode::tools::ToolExecutor executor(temp.path());
                     executor.set_approval_gate(std::make_shared<RecordingGate>(false));
                     const auto result =
                         executor.execute("write_file", {{"path", "x.txt"}, {"content", "data"}});
                     require(result.skipped && !result.is_error, "denial is a skip");
                     require(ollacode::common::starts_with(
                                 result.text, std::string(ollacode::tools::SKIPPED_MARKER)),
                             result.text);
                     require(!std::filesystem::exists(temp.path() / "x.txt"), "file not written");
                   }});

  tests.push_back({"edit_file_replaces_single_occurrence", [] {
                     ollacode::testing::TempWorkspace temp;
                     temp.create_file("a.txt", "hello\n");
                     ollacode::tools::ToolExecutor executor(temp.path());
                     executor.set_approval_gate(std::make_shared<ollacode::tools::AutoApprove>());

                     const auto result = executor.execute(
                         "edit_file", {{"path", "a.txt"}, {"search", "hello"}, {"replace", "world"}});
                     require_success(result, "edit");
                     require(contains(result.text, "✅") && contains(result.text, "1"), result.text);
                     require(temp.read_file("a.txt") == "world\n", "file updated");

                     const auto again = executor.execute(
                         "edit_file", {{"path", "a.txt"}, {"search", "hello"}, {"replace", "world"}});
                     require_failure(again, "second edit");
                     require(contains(again.text, "Search string not found."), again.text);
                     require(temp.read_file("a.txt") == "world\n", "file unchanged by failed edit");
                   }});

  tests.push_back({"edit_file_rejects_ambiguous_and_suggests_similar", [] {
                     ollacode::testing::TempWorkspace temp;
                     temp.create_file("c.py", "x = 1\nx = 1\ntotal_count = 0\n");
                     ollacode::tools::ToolExecutor executor(temp.path());
                     const auto ambiguous = executor.execute(
                         "edit_file", {{"path", "c.py"}, {"search", "x = 1"}, {"replace", "x = 2"}});
                     require(contains(ambiguous.text, "found 2 times"), ambiguous.text);

                     const auto typo = executor.execute(
                         "edit_file",
                         {{"path", "c.py"}, {"search", "total_cout = 0"}, {"replace", "y"}});
                     require(contains(typo.text, "Similar lines:"), typo.text);
                     require(contains(typo.text, "→ total_count = 0"), typo.text);

                     const auto empty = executor.execute("edit_file", {{"path", "c.py"}});
                     require(contains(empty.text, "'search' parameter is required."), empty.text);
                     require(temp.read_file("c.py") == "x = 1\nx = 1\ntotal_count = 0\n",
                             "file untouched");
                   }});

  tests.push_back({"denied_edit_is_skipped", [] {
                     ollacode::testing::TempWorkspace temp;
                     temp.create_file("a.txt", "hello\n");
                     ollacode::tools::ToolExecutor executor(temp.path());
                     auto gate = std::make_shared<RecordingGate>(false);
                     executor.set_approval_gate(gate);
                     const auto result = executor.execute(
                         "edit_file", {{"path", "a.txt"}, {"search", "hello"}, {"replace", "bye"}});
                     require(result.skipped, result.text);
                     require(contains(gate->descriptions[0], "-hello"), gate->descriptions[0]);
                     require(temp.read_file("a.txt") == "hello\n", "file unchanged");
                   }});

  tests.push_back({"list_directory_sorts_dirs_first_and_hides_dotfiles", [] {
                     ollacode::testing::TempWorkspace temp;
                     temp.create_file("b.txt", "12345");
                     temp.create_file("a.txt", "");
                     temp.create_file("zdir/inner.txt", "x");
                     temp.create_file(".hidden", "x");
                     ollacode::tools::ToolExecutor executor(temp.path());
                     const auto result = executor.execute("list_directory", {});
                     require_success(result, "list");
                     require(contains(result.text, "(3 items)"), result.text);
                     require(!contains(result.text, ".hidden"), result.text);
                     const auto dir_pos = result.text.find("📁 zdir");
                     const auto a_pos = result.text.find("📄 a.txt (0B)");
                     const auto b_pos = result.text.find("📄 b.txt (5B)");
                     require(dir_pos != std::string::npos && a_pos != std::string::npos &&
                                 b_pos != std::string::npos,
                             result.text);
                     require(dir_pos < a_pos && a_pos < b_pos, "order: dirs then names");

                     const auto not_dir = executor.execute("list_directory", {{"path", "a.txt"}});
                     require(contains(not_dir.text, "Not a directory"), not_dir.text);
                   }});

  tests.push_back({"search_files_matches_recursively", [] {
                     ollacode::testing::TempWorkspace temp;
                     temp.create_file("main.py", "");
                     temp.create_file("pkg/util.py", "");
                     temp.create_file("pkg/readme.md", "");
                     temp.create_file(".venv/lib.py", "");
                     ollacode::tools::ToolExecutor executor(temp.path());
                     const auto result = executor.execute("search_files", {{"pattern", "*.py"}});
                     require_success(result, "search");
                     require(contains(result.text, "(2 files)"), result.text);
                     require(contains(result.text, "📄 main.py") &&
                                 contains(result.text, "📄 pkg/util.py"),
                             result.text);
                     require(!contains(result.text, "lib.py"), "hidden directories skipped");

                     const auto none = executor.execute("search_files", {{"pattern", "*.rs"}});
                     require_success(none, "no matches is not an error");
                     require(contains(none.text, "No files matching '*.rs'"), none.text);
                   }});

  tests.push_back({"grep_search_finds_case_insensitive_matches", [] {
                     ollacode::testing::TempWorkspace temp;
                     temp.create_file("src/a.py", "x = 1\n# todo: fix\n");
                     temp.create_file("src/b.py", "  TODO later  \n");
                     temp.create_file("node_modules/dep.js", "// TODO vendor\n");
                     ollacode::tools::ToolExecutor executor(temp.path());
                     const auto result = executor.execute("grep_search", {{"query", "TODO"}});
                     require_success(result, "grep");
                     require(contains(result.text, "'TODO' results (2 matches)"), result.text);
                     require(contains(result.text, "  src/a.py:2: # todo: fix"), result.text);
                     require(contains(result.text, "  src/b.py:1: TODO later"), result.text);
                     require(!contains(result.text, "node_modules"), "vendor dirs skipped");

                     const auto none = executor.execute("grep_search", {{"query", "zzz"}});
                     require(contains(none.text, "'zzz' not found."), none.text);
                     const auto no_query = executor.execute("grep_search", {});
                     require_failure(no_query, "query required");
                   }});

  tests.push_back({"grep_search_truncates_long_lines_and_caps_matches", [] {
                     ollacode::testing::TempWorkspace temp;
                     const std::string long_line = "needle " + std::string(200, 'x');
                     temp.create_file("a_long.txt", "   " + long_line + "\n");
                     std::string many;
                     for (int i = 1; i <= 30; ++i) {
                       many += "needle " + std::to_string(i) + "\n";
                     }
                     temp.create_file("b_many.txt", many);
                     ollacode::tools::ToolExecutor executor(temp.path());

                     const auto result = executor.execute("grep_search", {{"query", "NEEDLE"}});
                     require_success(result, "grep");
                     require(contains(result.text, "(20 matches)"), result.text);
                     require(contains(result.text, "\n  a_long.txt:1: " + long_line.substr(0, 120) +
                                                       "\n"),
                             "long line trimmed and cut to 120 characters: " + result.text);
                     require(!contains(result.text, long_line.substr(0, 121)), "line not cut");
                     require(contains(result.text, "  b_many.txt:19: needle 19"), result.text);
                     require(!contains(result.text, "b_many.txt:20:"), "stops at 20 matches");
                   }});

  tests.push_back({"search_files_lists_first_fifty_with_full_count", [] {
                     ollacode::testing::TempWorkspace temp;
                     for (int i = 0; i < 60; ++i) {
                       char name[32];
                       std::snprintf(name, sizeof(name), "f%02d.txt", i);
                       temp.create_file(name, "");
                     }
                     ollacode::tools::ToolExecutor executor(temp.path());
                     const auto result = executor.execute("search_files", {{"pattern", "*.txt"}});
                     require_success(result, "search");
                     require(contains(result.text, "(60 files) — showing first 50"), result.text);
                     require(contains(result.text, "📄 f49.txt"), result.text);
                     require(!contains(result.text, "f50.txt"), "listing capped at 50");
                   }});

  tests.push_back({"list_directory_caps_entries_at_one_hundred", [] {
                     ollacode::testing::TempWorkspace temp;
                     for (int i = 0; i < 120; ++i) {
                       char name[32];
                       std::snprintf(name, sizeof(name), "e%03d.txt", i);
                       temp.create_file(name, "");
                     }
                     ollacode::tools::ToolExecutor executor(temp.path());
                     const auto result = executor.execute("list_directory", {});
                     require_success(result, "list");
                     require(contains(result.text, "(120 items)"), result.text);
                     require(contains(result.text, "📄 e099.txt"), result.text);
                     require(!contains(result.text, "e100.txt"), "listing capped at 100");
                     std::size_t shown = 0;
                     for (auto pos = result.text.find("📄 "); pos != std::string::npos;
                          pos = result.text.find("📄 ", pos + 1)) {
                       ++shown;
                     }
                     require(shown == 100, "shown entries: " + std::to_string(shown));
                   }});

  tests.push_back({"run_command_reports_exit_code_and_streams", [] {
                     ollacode::testing::TempWorkspace temp;
                     temp.create_file("marker.txt", "");
                     ollacode::tools::ToolExecutor executor(temp.path());
                     executor.set_approval_gate(std::make_shared<ollacode::tools::AutoApprove>());
                     const auto result = executor.execute(
                         "run_command", {{"command", "ls; echo oops >&2; exit 3"}});
                     require_success(result, "command ran");
                     require(contains(result.text, "(exit code: 3)"), result.text);
                     require(contains(result.text, "marker.txt"), "runs in workspace root");
                     require(contains(result.text, "**stderr:**\n```\noops\n```"), result.text);
                   }});

  tests.push_back({"run_command_rejects_dangerous_patterns_before_approval", [] {
                     ollacode::testing::TempWorkspace temp;
                     ollacode::tools::ToolExecutor executor(temp.path());
                     auto gate = std::make_shared<RecordingGate>(true);
                     executor.set_approval_gate(gate);
                     const auto result = executor.execute("run_command", {{"command", "rm -rf /"}});
                     require_failure(result, "rm -rf /");
                     require(contains(result.text, "Dangerous command detected"), result.text);
                     require(gate->tools.empty(), "gate never consulted");
                   }});

  tests.push_back({"run_command_times_out", [] {
                     ollacode::testing::TempWorkspace temp;
                     ollacode::tools::ToolExecutor executor(
                         temp.path(), {.command_timeout = std::chrono::seconds(1)});
                     const auto started = std::chrono::steady_clock::now();
                     const auto result = executor.execute("run_command", {{"command", "sleep 5"}});
                     const auto elapsed = std::chrono::steady_clock::now() - started;
                     require_failure(result, "timeout");
                     require(contains(result.text, "Command timed out (1s): sleep 5"), result.text);
                     require(elapsed < std::chrono::seconds(4), "killed near the deadline");
                   }});

  tests.push_back({"run_command_times_out_after_output_is_redirected", [] {
                     ollacode::testing::TempWorkspace temp;
                     ollacode::tools::ToolExecutor executor(
                         temp.path(), {.command_timeout = std::chrono::seconds(1)});
                     const std::string command = "exec sleep 5 > out.log 2>&1";
                     const auto started = std::chrono::steady_clock::now();
                     const auto result = executor.execute("run_command", {{"command", command}});
                     const auto elapsed = std::chrono::steady_clock::now() - started;
                     require_failure(result, "timeout without open pipes");
                     require(contains(result.text, "Command timed out (1s): " + command),
                             result.text);
                     require(elapsed < std::chrono::seconds(4), "killed near the deadline");
                   }});

  tests.push_back({"denied_command_does_not_run", [] {
                     ollacode::testing::TempWorkspace temp;
                     ollacode::tools::ToolExecutor executor(temp.path());
                     executor.set_approval_gate(std::make_shared<RecordingGate>(false));
                     const auto result =
                         executor.execute("run_command", {{"command", "touch created.txt"}});
                     require(result.skipped, result.text);
                     require(!std::filesystem::exists(temp.path() / "created.txt"), "not executed");
                   }});

  tests.push_back({"prompt_approval_reads_answers", [] {
                     std::istringstream in("n\ny\na\n");
                     std::ostringstream out;
                     ollacode::tools::PromptApproval gate(in, out);
                     require(!gate.decide("run_command", "⚙️ Run command: `ls`"), "n denies");
                     require(gate.decide("run_command", "x"), "y approves");
                     require(!gate.always(), "y is one-off");
                     require(gate.decide("run_command", "x"), "a approves");
                     require(gate.always(), "a switches to always");
                     require(gate.decide("run_command", "x"), "always approves without input");
                     require(contains(out.str(), "Run command"), "description shown");
                   }});

  tests.push_back({"prompt_approval_denies_on_end_of_input", [] {
                     std::istringstream in("");
                     std::ostringstream out;
                     ollacode::tools::PromptApproval gate(in, out);
                     require(!gate.decide("write_file", "x"), "eof denies");
                     require(ollacode::tools::consult(nullptr, "write_file", "x"), "null gate approves");
                   }});
}
