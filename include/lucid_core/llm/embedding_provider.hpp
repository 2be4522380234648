#pragma once

#include <string>
#include <vector>

#include "lucid_core/request_context.hpp"

namespace lucid_core {

inline constexpr const char* DEFAULT_EMBEDDING_MODEL = "text-embedding-ada-002";

// Turns text into an embedding vector. Implementations throw ProviderError.
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual std::vector<float> create_embedding(const std::string& text,
                                              const std::string& model_name,
                                              const RequestContext& context) = 0;
};

}  // namespace lucid_core
