#pragma once

#include <string>

namespace lucid_core {

struct ChatMessage {
  std::string role;
  std::string content;
};

inline bool operator==(const ChatMessage& lhs, const ChatMessage& rhs) {
  return lhs.role == rhs.role && lhs.content == rhs.content;
}

struct CompletionOptions {
  float temperature = 0.0f;
  int max_tokens = 0;
};

}  // namespace lucid_core
