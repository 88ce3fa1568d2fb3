#include "rag_core/types.hpp"

#include <stdexcept>

namespace rag_core {

std::string to_string(Role role) {
  switch (role) {
    case Role::User:
      return "user";
    case Role::Assistant:
      return "assistant";
    case Role::System:
      return "system";
    default:
      return "user";
  }
}

Role role_from_string(const std::string& str) {
  if (str == "user")
    return Role::User;
  if (str == "assistant")
    return Role::Assistant;
  if (str == "system")
    return Role::System;
  throw std::invalid_argument("Unknown message role: " + str);
}

}  // namespace rag_core
