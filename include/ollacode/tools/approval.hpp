#pragma once

#include <iosfwd>
#include <mutex>
#include <string>

namespace ollacode::tools {

/// Decides whether a mutating tool call may proceed. Consulted once per call,
/// before any side effect.
class ApprovalGate {
public:
  virtual ~ApprovalGate() = default;
  [[nodiscard]] virtual bool decide(const std::string &tool_name,
                                    const std::string &description) = 0;
};

class AutoApprove final : public ApprovalGate {
public:
  [[nodiscard]] bool decide(const std::string &, const std::string &) override { return true; }
};

/// Ask-and-wait gate: shows the description and reads y/n/a from `in`.
/// Answering "a" approves this call and every later one.
class PromptApproval final : public ApprovalGate {
public:
  PromptApproval(std::istream &in, std::ostream &out);

  [[nodiscard]] bool decide(const std::string &tool_name, const std::string &description) override;

  [[nodiscard]] bool always() const;
  void set_always(bool value);

private:
  std::istream &in_;
  std::ostream &out_;
  mutable std::mutex mutex_;
  bool always_ = false;
};

/// A null gate approves.
[[nodiscard]] bool consult(ApprovalGate *gate, const std::string &tool_name,
                           const std::string &description);

} // namespace ollacode::tools
