#include "lucid_core/llm/ollama_client.hpp"

#include <algorithm>
#include <cstdint>

#include "lucid_core/errors.hpp"
#include "ollama.hpp"

namespace lucid_core {

OllamaClient::OllamaClient(const std::string& ollama_url, std::chrono::milliseconds timeout)
    : ollama_url_(ollama_url), timeout_(timeout) {
  setup_server_connection();
}

void OllamaClient::setup_server_connection() {
  ollama::setServerURL(ollama_url_);
  const auto seconds = std::chrono::ceil<std::chrono::seconds>(timeout_).count();
  ollama::setReadTimeout(static_cast<int>(std::max<int64_t>(1, seconds)));
  if (!ollama::is_running()) {
    throw ProviderError("Ollama server is not running at " + ollama_url_);
  }
}

// The server answers /api/embed with a list of vectors, one per input.
std::vector<float> OllamaClient::create_embedding(const std::string& text,
                                                  const std::string& model_name,
                                                  const RequestContext& context) {
  context.check("ollama embed");
  try {
    ollama::response response = ollama::generate_embeddings(model_name, text);
    auto json_response = response.as_json();

    if (!json_response.contains("embeddings")) {
      throw ProviderError("Response does not contain embedding field");
    }

    auto embeddings = json_response["embeddings"];
    if (!embeddings.is_array() || embeddings.empty()) {
      throw ProviderError("no embedding returned");
    }
    context.check("ollama embed");
    if (embeddings[0].is_array()) {
      return embeddings[0].get<std::vector<float>>();
    }
    return embeddings.get<std::vector<float>>();
  } catch (const ollama::exception& e) {
    throw ProviderError("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception& e) {
    throw ProviderError("failed to unmarshal response: " + std::string(e.what()));
  }
}

std::string OllamaClient::create_chat_completion(const std::vector<ChatMessage>& messages,
                                                 const std::string& model_name,
                                                 const std::optional<CompletionOptions>& options,
                                                 const RequestContext& context) {
  context.check("ollama chat");

  ollama::messages conversation;
  for (const auto& message : messages) {
    conversation.push_back(ollama::message(message.role, message.content));
  }

  const GenerationOptions generation = map_options(options);
  ollama::options request_options;
  if (generation.temperature) {
    request_options["temperature"] = *generation.temperature;
  }
  if (generation.num_predict) {
    request_options["num_predict"] = *generation.num_predict;
  }

  try {
    ollama::response response = ollama::chat(model_name, conversation, request_options);
    context.check("ollama chat");
    return response.as_simple_string();
  } catch (const ollama::exception& e) {
    throw ProviderError("Chat completion failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception& e) {
    throw ProviderError("failed to unmarshal response: " + std::string(e.what()));
  }
}

OllamaClient::GenerationOptions OllamaClient::map_options(
    const std::optional<CompletionOptions>& options) {
  GenerationOptions generation;
  if (!options) {
    return generation;
  }
  if (options->temperature != 0.0f) {
    generation.temperature = options->temperature;
  }
  if (options->max_tokens != 0) {
    generation.num_predict = options->max_tokens;
  }
  return generation;
}

bool OllamaClient::is_server_available() {
  return ollama::is_running();
}

}  // namespace lucid_core
