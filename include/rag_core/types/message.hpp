#pragma once

#include <string>
#include <vector>

namespace rag_core {

enum class Role { User, Assistant, System };

std::string to_string(Role role);
Role role_from_string(const std::string &str);

struct Message {
  Role role = Role::User;
  std::string content;

  bool operator==(const Message &other) const {
    return role == other.role && content == other.content;
  }
};

using Messages = std::vector<Message>;

}  // namespace rag_core
