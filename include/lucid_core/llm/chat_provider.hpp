#pragma once

#include <optional>
#include <string>
#include <vector>

#include "lucid_core/request_context.hpp"
#include "lucid_core/types/chat.hpp"

namespace lucid_core {

inline constexpr const char* DEFAULT_CHAT_MODEL = "gpt-3.5-turbo";

// Generative model behind the answer step. Implementations throw ProviderError.
class ChatProvider {
 public:
  virtual ~ChatProvider() = default;

  virtual std::string create_chat_completion(const std::vector<ChatMessage>& messages,
                                             const std::string& model_name,
                                             const std::optional<CompletionOptions>& options,
                                             const RequestContext& context) = 0;
};

}  // namespace lucid_core
