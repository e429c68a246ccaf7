#include "test_framework.hpp"

#include "ollacode/common/utf8.hpp"
#include "ollacode/tools/diff.hpp"

#include <algorithm>

namespace {

using ollacode::tests::require;

void require_round_trip(const std::string &before, const std::string &after) {
  const auto diff = ollacode::tools::unified_diff(before, after, "f.txt");
  const auto applied = ollacode::tools::apply_unified_diff(before, diff);
  require(applied.ok(), applied.error());
  require(applied.value() == after, "patched text should equal target:\n" + diff);
}

} // namespace

void register_diff_tests(std::vector<ollacode::tests::TestCase> &tests) {
  tests.push_back({"unified_diff_is_empty_for_equal_texts", [] {
                     require(ollacode::tools::unified_diff("a\nb\n", "a\nb\n", "f").empty(),
                             "no hunks expected");
                     require(ollacode::tools::diff_preview("x", "x", "f") == "(no changes)",
                             "preview of equal texts");
                   }});

  tests.push_back({"unified_diff_has_headers_and_hunk", [] {
                     const auto diff =
                         ollacode::tools::unified_diff("one\ntwo\nthree\n", "one\n2\nthree\n", "n.txt");
                     require(diff.find("--- a/n.txt\n+++ b/n.txt\n") == 0, diff);
                     require(diff.find("@@ -1,3 +1,3 @@") != std::string::npos, diff);
                     require(diff.find("\n-two\n+2\n") != std::string::npos, diff);
                   }});

  tests.push_back({"unified_diff_round_trips_edits", [] {
                     require_round_trip("a\nb\nc\n", "a\nB\nc\n");
                     require_round_trip("", "new file\n");
                     require_round_trip("gone\n", "");
                     require_round_trip("no newline", "no newline\n");
                     require_round_trip("1\n2\n3\n4\n5\n6\n7\n8\n9\n10\n11\n12\n",
                                        "1\nX\n3\n4\n5\n6\n7\n8\n9\n10\nY\n12\n13\n");
                   }});

  tests.push_back({"unified_diff_marks_missing_final_newline", [] {
                     const auto diff = ollacode::tools::unified_diff("a\n", "a\nb", "f");
                     require(diff.find("\\ No newline at end of file") != std::string::npos, diff);
                   }});

  tests.push_back({"apply_unified_diff_rejects_mismatched_context", [] {
                     const auto diff = ollacode::tools::unified_diff("a\nb\n", "a\nc\n", "f");
                     require(!ollacode::tools::apply_unified_diff("x\ny\n", diff).ok(),
                             "context mismatch must fail");
                   }});

  tests.push_back({"diff_preview_is_fenced_and_capped", [] {
                     std::string big;
                     for (int i = 0; i < 400; ++i) {
                       big += "line " + std::to_string(i) + "\n";
                     }
                     const auto preview = ollacode::tools::diff_preview("", big, "big.txt");
                     require(preview.find("```diff\n") == 0, preview.substr(0, 20));
                     require(ollacode::common::utf8_length(preview) < 1100, "preview capped");
                   }});

  tests.push_back({"close_matches_ranks_similar_lines", [] {
                     const auto matches = ollacode::tools::close_matches(
                         "int totl = 0;", {"int total = 0;", "return 1;", "int totals = 10;"});
                     require(!matches.empty(), "expected a match");
                     require(matches.front() == "int total = 0;", "best candidate first");
                     require(std::find(matches.begin(), matches.end(), "return 1;") == matches.end(),
                             "dissimilar line excluded");
                     const std::u32string a = U"abcd";
                     const std::u32string b = U"bcde";
                     require(ollacode::tools::similarity_ratio(a, b) == 0.75, "2*3/8");
                   }});
}
