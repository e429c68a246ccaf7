#include "ollacode/tools/workspace.hpp"

#include "ollacode/common/fs.hpp"

namespace ollacode::tools {

namespace {

std::filesystem::path normalize(const std::filesystem::path &path) {
  std::error_code ec;
  auto canonical = std::filesystem::weakly_canonical(path, ec);
  if (ec) {
    return path.lexically_normal();
  }
  return canonical;
}

} // namespace

Workspace::Workspace(const std::filesystem::path &root) {
  std::error_code ec;
  auto absolute = std::filesystem::absolute(root, ec);
  root_ = normalize(ec ? root : absolute);
}

common::Result<std::filesystem::path> Workspace::resolve(const std::string &requested) const {
  std::filesystem::path candidate(requested.empty() ? "." : requested);
  if (!candidate.is_absolute()) {
    candidate = root_ / candidate;
  }
  candidate = normalize(candidate);

  if (!contains(candidate)) {
    return common::Result<std::filesystem::path>::failure(
        "Security error: cannot access path outside workspace.\n  Requested: " + requested +
        "\n  Workspace: " + root_.string());
  }
  return common::Result<std::filesystem::path>::success(candidate);
}

bool Workspace::contains(const std::filesystem::path &absolute) const {
  return common::is_subpath(normalize(absolute), root_);
}

std::string Workspace::relative(const std::filesystem::path &absolute) const {
  const auto rel = absolute.lexically_relative(root_);
  if (rel.empty()) {
    return absolute.generic_string();
  }
  return rel.generic_string();
}

} // namespace ollacode::tools
