#include "ollacode/tools/diff.hpp"

#include "ollacode/common/fs.hpp"
#include "ollacode/common/utf8.hpp"

#include <algorithm>
#include <cstdint>
#include <deque>
#include <regex>
#include <sstream>
#include <tuple>
#include <unordered_map>

namespace ollacode::tools {

namespace {

constexpr std::size_t PREVIEW_LIMIT = 1000;
// Above this many DP cells the changed region is reported as one replacement.
constexpr std::size_t MAX_LCS_CELLS = 4'000'000;
constexpr const char *NO_NEWLINE = "\\ No newline at end of file";

enum class Op { Equal, Delete, Insert };

struct Edit {
  Op op;
  std::size_t old_index;
  std::size_t new_index;
};

// Lines keep their trailing '\n'; only the last line may lack one.
std::vector<std::string> split_keep_ends(const std::string &text) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (start < text.size()) {
    const auto end = text.find('\n', start);
    if (end == std::string::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, end - start + 1));
    start = end + 1;
  }
  return lines;
}

std::vector<Edit> diff_lines(const std::vector<std::string> &a, const std::vector<std::string> &b) {
  std::vector<Edit> edits;
  std::size_t prefix = 0;
  while (prefix < a.size() && prefix < b.size() && a[prefix] == b[prefix]) {
    edits.push_back({Op::Equal, prefix, prefix});
    ++prefix;
  }
  std::size_t suffix = 0;
  while (suffix < a.size() - prefix && suffix < b.size() - prefix &&
         a[a.size() - 1 - suffix] == b[b.size() - 1 - suffix]) {
    ++suffix;
  }

  const std::size_t n = a.size() - prefix - suffix;
  const std::size_t m = b.size() - prefix - suffix;
  if (n > 0 && m > 0 && (n + 1) * (m + 1) <= MAX_LCS_CELLS) {
    std::vector<std::vector<std::uint32_t>> lcs(n + 1, std::vector<std::uint32_t>(m + 1, 0));
    for (std::size_t i = n; i-- > 0;) {
      for (std::size_t j = m; j-- > 0;) {
        if (a[prefix + i] == b[prefix + j]) {
          lcs[i][j] = lcs[i + 1][j + 1] + 1;
        } else {
          lcs[i][j] = std::max(lcs[i + 1][j], lcs[i][j + 1]);
        }
      }
    }
    std::size_t i = 0;
    std::size_t j = 0;
    while (i < n || j < m) {
      if (i < n && j < m && a[prefix + i] == b[prefix + j]) {
        edits.push_back({Op::Equal, prefix + i, prefix + j});
        ++i;
        ++j;
      } else if (i < n && (j == m || lcs[i + 1][j] >= lcs[i][j + 1])) {
        edits.push_back({Op::Delete, prefix + i, prefix + j});
        ++i;
      } else {
        edits.push_back({Op::Insert, prefix + i, prefix + j});
        ++j;
      }
    }
  } else {
    for (std::size_t i = 0; i < n; ++i) {
      edits.push_back({Op::Delete, prefix + i, prefix});
    }
    for (std::size_t j = 0; j < m; ++j) {
      edits.push_back({Op::Insert, prefix + n, prefix + j});
    }
  }

  for (std::size_t k = 0; k < suffix; ++k) {
    edits.push_back({Op::Equal, prefix + n + k, prefix + m + k});
  }
  return edits;
}

std::string format_range(const std::size_t start, const std::size_t length) {
  if (length == 1) {
    return std::to_string(start + 1);
  }
  const std::size_t beginning = length == 0 ? start : start + 1;
  return std::to_string(beginning) + "," + std::to_string(length);
}

void emit_line(std::ostringstream &out, const char prefix, const std::string &line) {
  out << prefix << line;
  if (line.empty() || line.back() != '\n') {
    out << "\n" << NO_NEWLINE << "\n";
  }
}

// Longest common block of a[alo:ahi] and b[blo:bhi] as (i, j, size).
std::tuple<std::size_t, std::size_t, std::size_t>
longest_match(const std::u32string_view a,
              const std::unordered_map<char32_t, std::vector<std::size_t>> &b2j,
              const std::size_t alo, const std::size_t ahi, const std::size_t blo,
              const std::size_t bhi) {
  std::size_t best_i = alo;
  std::size_t best_j = blo;
  std::size_t best_size = 0;
  std::unordered_map<std::size_t, std::size_t> j2len;
  for (std::size_t i = alo; i < ahi; ++i) {
    std::unordered_map<std::size_t, std::size_t> next;
    const auto it = b2j.find(a[i]);
    if (it != b2j.end()) {
      for (const std::size_t j : it->second) {
        if (j < blo) {
          continue;
        }
        if (j >= bhi) {
          break;
        }
        std::size_t k = 1;
        if (j > 0) {
          if (const auto prev = j2len.find(j - 1); prev != j2len.end()) {
            k = prev->second + 1;
          }
        }
        next[j] = k;
        if (k > best_size) {
          best_i = i + 1 - k;
          best_j = j + 1 - k;
          best_size = k;
        }
      }
    }
    j2len = std::move(next);
  }
  return {best_i, best_j, best_size};
}

} // namespace

std::string unified_diff(const std::string &old_text, const std::string &new_text,
                         const std::string &filename, const std::size_t context) {
  const auto a = split_keep_ends(old_text);
  const auto b = split_keep_ends(new_text);
  const auto edits = diff_lines(a, b);

  std::vector<std::size_t> changes;
  for (std::size_t k = 0; k < edits.size(); ++k) {
    if (edits[k].op != Op::Equal) {
      changes.push_back(k);
    }
  }
  if (changes.empty()) {
    return "";
  }

  std::ostringstream out;
  out << "--- a/" << filename << "\n";
  out << "+++ b/" << filename << "\n";

  std::size_t c = 0;
  while (c < changes.size()) {
    const std::size_t first = changes[c];
    std::size_t last = first;
    while (c + 1 < changes.size() && changes[c + 1] - last <= 2 * context + 1) {
      last = changes[++c];
    }
    ++c;

    const std::size_t begin = first >= context ? first - context : 0;
    const std::size_t end = std::min(edits.size(), last + context + 1);

    std::size_t old_count = 0;
    std::size_t new_count = 0;
    for (std::size_t k = begin; k < end; ++k) {
      old_count += edits[k].op != Op::Insert ? 1 : 0;
      new_count += edits[k].op != Op::Delete ? 1 : 0;
    }
    out << "@@ -" << format_range(edits[begin].old_index, old_count) << " +"
        << format_range(edits[begin].new_index, new_count) << " @@\n";

    for (std::size_t k = begin; k < end; ++k) {
      const auto &edit = edits[k];
      switch (edit.op) {
      case Op::Equal:
        emit_line(out, ' ', a[edit.old_index]);
        break;
      case Op::Delete:
        emit_line(out, '-', a[edit.old_index]);
        break;
      case Op::Insert:
        emit_line(out, '+', b[edit.new_index]);
        break;
      }
    }
  }
  return out.str();
}

std::string diff_preview(const std::string &old_text, const std::string &new_text,
                         const std::string &filename) {
  std::string diff = unified_diff(old_text, new_text, filename);
  if (diff.empty()) {
    return "(no changes)";
  }
  if (common::utf8_length(diff) > PREVIEW_LIMIT) {
    diff = common::utf8_prefix(diff, PREVIEW_LIMIT) + "\n... (diff truncated)";
  }
  return "```diff\n" + diff + "\n```";
}

common::Result<std::string> apply_unified_diff(const std::string &original,
                                               const std::string &diff) {
  static const std::regex hunk_re(R"(^@@ -(\d+)(?:,(\d+))? \+(\d+)(?:,(\d+))? @@)");

  const auto source = split_keep_ends(original);
  const auto diff_lines_raw = common::split(diff, '\n');

  std::string output;
  std::size_t cursor = 0;
  std::size_t index = 0;
  while (index < diff_lines_raw.size()) {
    const std::string &header = diff_lines_raw[index++];
    std::smatch match;
    if (!std::regex_search(header, match, hunk_re)) {
      continue;
    }
    const std::size_t old_start = std::stoul(match[1].str());
    const std::size_t old_count = match[2].matched ? std::stoul(match[2].str()) : 1;
    const std::size_t target = old_count == 0 ? old_start : old_start - 1;
    if (target < cursor || target > source.size()) {
      return common::Result<std::string>::failure("hunk out of order at: " + header);
    }
    while (cursor < target) {
      output += source[cursor++];
    }

    // Body lines with '\n' restored; a following marker line strips it again.
    std::vector<std::pair<char, std::string>> body;
    while (index < diff_lines_raw.size()) {
      const std::string &line = diff_lines_raw[index];
      if (line.empty() && index + 1 == diff_lines_raw.size()) {
        ++index;
        break;
      }
      if (line.empty()) {
        return common::Result<std::string>::failure("malformed hunk line");
      }
      const char tag = line.front();
      if (tag == '\\') {
        if (!body.empty() && !body.back().second.empty()) {
          body.back().second.pop_back();
        }
        ++index;
        continue;
      }
      if (tag != ' ' && tag != '-' && tag != '+') {
        break;
      }
      body.emplace_back(tag, line.substr(1) + "\n");
      ++index;
    }

    for (const auto &[tag, text] : body) {
      if (tag == '+') {
        output += text;
        continue;
      }
      if (cursor >= source.size() || source[cursor] != text) {
        return common::Result<std::string>::failure("context mismatch at original line " +
                                                    std::to_string(cursor + 1));
      }
      if (tag == ' ') {
        output += text;
      }
      ++cursor;
    }
  }

  while (cursor < source.size()) {
    output += source[cursor++];
  }
  return common::Result<std::string>::success(std::move(output));
}

double similarity_ratio(const std::u32string_view a, const std::u32string_view b) {
  const std::size_t total = a.size() + b.size();
  if (total == 0) {
    return 1.0;
  }

  std::unordered_map<char32_t, std::vector<std::size_t>> b2j;
  for (std::size_t j = 0; j < b.size(); ++j) {
    b2j[b[j]].push_back(j);
  }

  std::size_t matches = 0;
  std::deque<std::tuple<std::size_t, std::size_t, std::size_t, std::size_t>> queue;
  queue.emplace_back(0, a.size(), 0, b.size());
  while (!queue.empty()) {
    const auto [alo, ahi, blo, bhi] = queue.front();
    queue.pop_front();
    const auto [i, j, size] = longest_match(a, b2j, alo, ahi, blo, bhi);
    if (size == 0) {
      continue;
    }
    matches += size;
    if (alo < i && blo < j) {
      queue.emplace_back(alo, i, blo, j);
    }
    if (i + size < ahi && j + size < bhi) {
      queue.emplace_back(i + size, ahi, j + size, bhi);
    }
  }
  return 2.0 * static_cast<double>(matches) / static_cast<double>(total);
}

std::vector<std::string> close_matches(const std::string &word,
                                       const std::vector<std::string> &candidates,
                                       const std::size_t limit, const double cutoff) {
  const auto target = common::decode_utf8(word);
  std::vector<std::pair<double, std::string>> scored;
  for (const auto &candidate : candidates) {
    const auto decoded = common::decode_utf8(candidate);
    const std::size_t total = target.size() + decoded.size();
    // Upper bound on the ratio from lengths alone.
    if (total > 0 && 2.0 * static_cast<double>(std::min(target.size(), decoded.size())) /
                             static_cast<double>(total) <
                         cutoff) {
      continue;
    }
    const double score = similarity_ratio(decoded, target);
    if (score >= cutoff) {
      scored.emplace_back(score, candidate);
    }
  }
  std::sort(scored.begin(), scored.end(), [](const auto &lhs, const auto &rhs) {
    if (lhs.first != rhs.first) {
      return lhs.first > rhs.first;
    }
    return lhs.second > rhs.second;
  });

  std::vector<std::string> out;
  for (std::size_t k = 0; k < scored.size() && k < limit; ++k) {
    out.push_back(std::move(scored[k].second));
  }
  return out;
}

} // namespace ollacode::tools
