#pragma once

#include "ollacode/agent/engine.hpp"
#include "ollacode/config/schema.hpp"
#include "ollacode/tools/approval.hpp"

#include <iosfwd>

namespace ollacode::cli {

[[nodiscard]] int run_cli(int argc, char **argv);

/// Interactive loop over `in`/`out` until /quit or end of input. `approval` is
/// the gate installed on `engine`; /approve toggles its always-approve state.
[[nodiscard]] int run_repl(agent::ConversationEngine &engine, const config::Config &config,
                           tools::PromptApproval &approval, std::istream &in, std::ostream &out);

} // namespace ollacode::cli
