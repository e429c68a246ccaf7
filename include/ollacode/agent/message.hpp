#pragma once

#include <string>
#include <string_view>

namespace ollacode::agent {

enum class Role {
  System,
  User,
  Assistant,
};

[[nodiscard]] std::string_view role_name(Role role);

struct Message {
  Role role = Role::User;
  std::string content;
};

} // namespace ollacode::agent
