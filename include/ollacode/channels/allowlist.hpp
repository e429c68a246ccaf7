#pragma once

#include <cstdint>
#include <vector>

namespace ollacode::channels {

/// An empty allow-list admits everyone.
[[nodiscard]] bool check_allowlist(std::int64_t user_id, const std::vector<std::int64_t> &allowlist);

} // namespace ollacode::channels
