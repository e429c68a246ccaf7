#include "ollacode/agent/message.hpp"

namespace ollacode::agent {

std::string_view role_name(const Role role) {
  switch (role) {
  case Role::System:
    return "system";
  case Role::User:
    return "user";
  case Role::Assistant:
    return "assistant";
  }
  return "user";
}

} // namespace ollacode::agent
