#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "lucid_core/llm/chat_provider.hpp"
#include "lucid_core/llm/embedding_provider.hpp"

namespace lucid_core {

// Local Ollama server, through ollama-hpp.
class OllamaClient : public EmbeddingProvider, public ChatProvider {
 public:
  // Throws ProviderError when no server answers at ollama_url.
  explicit OllamaClient(const std::string& ollama_url,
                        std::chrono::milliseconds timeout = std::chrono::seconds(30));
  ~OllamaClient() override = default;

  OllamaClient(const OllamaClient&) = delete;
  OllamaClient& operator=(const OllamaClient&) = delete;

  std::vector<float> create_embedding(const std::string& text,
                                      const std::string& model_name,
                                      const RequestContext& context) override;

  std::string create_chat_completion(const std::vector<ChatMessage>& messages,
                                     const std::string& model_name,
                                     const std::optional<CompletionOptions>& options,
                                     const RequestContext& context) override;

  bool is_server_available();

  // Generation options in Ollama's vocabulary. Unset fields are left to the server.
  struct GenerationOptions {
    std::optional<float> temperature;
    std::optional<int> num_predict;
  };

  // Zero values are treated as unset; max_tokens becomes num_predict.
  static GenerationOptions map_options(const std::optional<CompletionOptions>& options);

 private:
  void setup_server_connection();

  std::string ollama_url_;
  std::chrono::milliseconds timeout_;
};

}  // namespace lucid_core
