#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "lucid_core/llm/chat_provider.hpp"
#include "lucid_core/llm/embedding_provider.hpp"

namespace lucid_core {

/**
 * @brief Client for OpenAI-compatible REST APIs, over libcurl.
 *
 * Serves both provider roles. Each call uses its own curl handle, so one
 * client may be shared between threads.
 */
class OpenAIClient : public EmbeddingProvider, public ChatProvider {
 public:
  static constexpr const char* DEFAULT_BASE_URL = "https://api.openai.com/v1";

  explicit OpenAIClient(std::string api_key,
                        std::string base_url = DEFAULT_BASE_URL,
                        std::chrono::milliseconds timeout = std::chrono::seconds(30));

  std::vector<float> create_embedding(const std::string& text,
                                      const std::string& model_name,
                                      const RequestContext& context) override;

  std::string create_chat_completion(const std::vector<ChatMessage>& messages,
                                     const std::string& model_name,
                                     const std::optional<CompletionOptions>& options,
                                     const RequestContext& context) override;

  const std::string& base_url() const {
    return base_url_;
  }

  // Wire encoding, exposed for tests. Empty model names select the defaults.
  static std::string build_embedding_request(const std::string& text, const std::string& model);
  static std::string build_chat_request(const std::vector<ChatMessage>& messages,
                                        const std::string& model,
                                        const std::optional<CompletionOptions>& options);

  /**
   * @brief Decode a response body given its HTTP status.
   * @throws ProviderError for non-200 statuses, malformed JSON, or when the
   *         response carries no embedding / choice.
   */
  static std::vector<float> parse_embedding_response(long status, const std::string& body);
  static std::string parse_chat_response(long status, const std::string& body);

 private:
  struct HttpResult {
    long status;
    std::string body;
  };

  HttpResult post_json(const std::string& path,
                       const std::string& body,
                       const RequestContext& context) const;

  std::string api_key_;
  std::string base_url_;
  std::chrono::milliseconds timeout_;
};

}  // namespace lucid_core
