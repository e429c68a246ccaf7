#include "ollacode/tools/approval.hpp"

#include "ollacode/common/fs.hpp"

#include <istream>
#include <ostream>

namespace ollacode::tools {

PromptApproval::PromptApproval(std::istream &in, std::ostream &out) : in_(in), out_(out) {}

bool PromptApproval::decide(const std::string &tool_name, const std::string &description) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (always_) {
    return true;
  }

  out_ << "\n\033[1;33m🔐 Approval required — " << tool_name << "\033[0m\n";
  out_ << description << "\n";
  out_ << "  Approve? (y/n/a=always) ❯ " << std::flush;

  std::string answer;
  if (!std::getline(in_, answer)) {
    out_ << "\n  ❌ Denied\n";
    return false;
  }
  answer = common::to_lower(common::trim(answer));

  if (answer == "a" || answer == "always") {
    always_ = true;
    out_ << "  ✅ Auto-approving all future actions.\n";
    return true;
  }
  if (answer == "y" || answer == "yes") {
    out_ << "  ✅ Approved\n";
    return true;
  }
  out_ << "  ❌ Denied\n";
  return false;
}

bool PromptApproval::always() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return always_;
}

void PromptApproval::set_always(const bool value) {
  std::lock_guard<std::mutex> lock(mutex_);
  always_ = value;
}

bool consult(ApprovalGate *gate, const std::string &tool_name, const std::string &description) {
  if (gate == nullptr) {
    return true;
  }
  return gate->decide(tool_name, description);
}

} // namespace ollacode::tools
