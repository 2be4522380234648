#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "lucid_core/chunking/chunker.hpp"
#include "lucid_core/db/chunk_store.hpp"
#include "lucid_core/llm/chat_provider.hpp"
#include "lucid_core/llm/embedding_provider.hpp"
#include "lucid_core/request_context.hpp"
#include "lucid_core/types/query.hpp"

namespace lucid_core {

struct RagServiceConfig {
  std::string embedding_model = DEFAULT_EMBEDDING_MODEL;
  std::string chat_model = DEFAULT_CHAT_MODEL;
  int default_top_k = 5;
  float default_threshold = 0.7f;
  // Concurrent embedding calls while indexing; 1 embeds sequentially.
  int index_workers = 1;
};

// Collaborators of the service. Any of them may be null.
struct RagDependencies {
  std::shared_ptr<EmbeddingProvider> embedder;
  std::shared_ptr<ChatProvider> chat;
  std::shared_ptr<Chunker> chunker;
  std::shared_ptr<ChunkStore> store;
};

struct RagCapabilities {
  bool can_query = false;
  bool can_index = false;
  bool can_delete = false;
};

/**
 * @brief Retrieval-augmented question answering over indexed documents.
 *
 * The operations the service can perform are fixed at construction from the
 * dependencies it was given. A missing capability turns Query into a
 * "not configured" answer and IndexDocument / DeleteDocumentChunks into
 * no-ops; it is never an error.
 */
class RagService {
 public:
  static constexpr const char* NOT_CONFIGURED_ANSWER =
      "RAG service is not configured. Please set OPENAI_API_KEY.";
  static constexpr const char* NO_CONTEXT_ANSWER =
      "I couldn't find any relevant information in the knowledge base to answer your question.";
  static constexpr const char* SYSTEM_PROMPT =
      "You are a helpful assistant. Answer questions based ONLY on the provided context.\n"
      "If the context doesn't contain enough information to answer the question, say so "
      "honestly.\n"
      "Be concise and helpful in your responses.";
  static constexpr float HIGH_CONFIDENCE = 0.85f;
  static constexpr float LOW_CONFIDENCE = 0.60f;

  RagService(RagServiceConfig config, RagDependencies deps);

  const RagCapabilities& capabilities() const {
    return capabilities_;
  }
  const RagServiceConfig& config() const {
    return config_;
  }

  /**
   * @brief Answers a question from the most similar stored chunks.
   * @throws InvalidQueryError if query.text is empty.
   * @throws ProviderError if embedding the query or generating the answer fails.
   * @throws ChunkStoreError if the search fails.
   * @throws DeadlineExceededError if the context expires between stages.
   */
  Response query(Query query, const RequestContext& context = {});

  /**
   * @brief Chunks, embeds and stores a document.
   *
   * Chunks whose embedding fails are logged and skipped. The survivors are
   * numbered from 0 in their original order and stored as one batch.
   *
   * @return Number of chunks stored.
   * @throws ChunkStoreError if the batch insert fails.
   */
  size_t index_document(const std::string& document_id,
                        const std::string& content,
                        const RequestContext& context = {});

  void delete_document_chunks(const std::string& document_id);

  // Exposed for tests.
  static std::string build_context(const std::vector<Chunk>& chunks);
  static float confidence_for(size_t found, int top_k);

 private:
  std::vector<std::optional<std::vector<float>>> embed_chunks(
      const std::string& document_id,
      const std::vector<std::string>& texts,
      const RequestContext& context);

  std::optional<std::vector<float>> embed_one(const std::string& document_id,
                                              size_t chunk_index,
                                              const std::string& text,
                                              const RequestContext& context);

  RagServiceConfig config_;
  RagDependencies deps_;
  RagCapabilities capabilities_;
};

}  // namespace lucid_core
