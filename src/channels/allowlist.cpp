#include "ollacode/channels/allowlist.hpp"

#include <algorithm>

namespace ollacode::channels {

bool check_allowlist(const std::int64_t user_id, const std::vector<std::int64_t> &allowlist) {
  if (allowlist.empty()) {
    return true;
  }
  return std::find(allowlist.begin(), allowlist.end(), user_id) != allowlist.end();
}

} // namespace ollacode::channels
