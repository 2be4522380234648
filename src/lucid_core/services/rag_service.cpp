#include "lucid_core/services/rag_service.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <iostream>

#include "lucid_core/errors.hpp"

namespace lucid_core {

namespace {

int64_t elapsed_ms(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               start)
      .count();
}

}  // namespace

RagService::RagService(RagServiceConfig config, RagDependencies deps)
    : config_(std::move(config)), deps_(std::move(deps)) {
  if (config_.embedding_model.empty()) {
    config_.embedding_model = DEFAULT_EMBEDDING_MODEL;
  }
  if (config_.chat_model.empty()) {
    config_.chat_model = DEFAULT_CHAT_MODEL;
  }
  if (config_.default_top_k <= 0) {
    config_.default_top_k = 5;
  }
  if (config_.default_threshold <= 0.0f) {
    config_.default_threshold = 0.7f;
  }
  if (config_.index_workers <= 0) {
    config_.index_workers = 1;
  }

  capabilities_.can_query = deps_.embedder && deps_.chat && deps_.store;
  capabilities_.can_index = deps_.embedder && deps_.chunker && deps_.store;
  capabilities_.can_delete = static_cast<bool>(deps_.store);
}

Response RagService::query(Query query, const RequestContext& context) {
  const auto start = std::chrono::steady_clock::now();

  if (query.text.empty()) {
    throw InvalidQueryError();
  }
  if (query.top_k <= 0) {
    query.top_k = config_.default_top_k;
  }
  if (query.threshold <= 0.0f) {
    query.threshold = config_.default_threshold;
  }

  if (!capabilities_.can_query) {
    return Response{NOT_CONFIGURED_ANSWER, {}, 0.0f, elapsed_ms(start)};
  }

  context.check("generate query embedding");
  std::vector<float> query_embedding;
  try {
    query_embedding = deps_.embedder->create_embedding(query.text, config_.embedding_model, context);
  } catch (const ProviderError& e) {
    throw ProviderError("generate query embedding: " + std::string(e.what()));
  }

  context.check("search chunks");
  std::vector<Chunk> relevant_chunks;
  try {
    relevant_chunks = deps_.store->search(query_embedding, query.top_k, query.threshold);
  } catch (const ChunkStoreError& e) {
    throw ChunkStoreError("search chunks: " + std::string(e.what()));
  }

  if (relevant_chunks.empty()) {
    return Response{NO_CONTEXT_ANSWER, {}, 0.0f, elapsed_ms(start)};
  }

  std::vector<ChatMessage> messages = {
      {"system", SYSTEM_PROMPT},
      {"user", "Context:\n" + build_context(relevant_chunks) + "\nQuestion: " + query.text},
  };

  context.check("generate answer");
  std::string answer;
  try {
    answer = deps_.chat->create_chat_completion(messages, config_.chat_model, std::nullopt, context);
  } catch (const ProviderError& e) {
    throw ProviderError("generate answer: " + std::string(e.what()));
  }

  const float confidence = confidence_for(relevant_chunks.size(), query.top_k);
  return Response{std::move(answer), std::move(relevant_chunks), confidence, elapsed_ms(start)};
}

size_t RagService::index_document(const std::string& document_id,
                                  const std::string& content,
                                  const RequestContext& context) {
  if (!capabilities_.can_index || content.empty()) {
    return 0;
  }

  const std::vector<std::string> texts = deps_.chunker->chunk(content);
  if (texts.empty()) {
    return 0;
  }

  auto embeddings = embed_chunks(document_id, texts, context);

  std::vector<Chunk> chunks;
  chunks.reserve(texts.size());
  for (size_t i = 0; i < texts.size(); ++i) {
    if (!embeddings[i]) {
      continue;
    }
    Chunk chunk;
    chunk.document_id = document_id;
    chunk.chunk_index = static_cast<int>(chunks.size());
    chunk.content = texts[i];
    chunk.embedding = std::move(*embeddings[i]);
    chunk.created_at = std::chrono::system_clock::now();
    chunks.push_back(std::move(chunk));
  }

  if (chunks.empty()) {
    std::cerr << "Warning: no chunks of document " << document_id
              << " could be embedded; nothing indexed" << std::endl;
    return 0;
  }

  context.check("create chunk batch");
  try {
    deps_.store->create_batch(chunks);
  } catch (const ChunkStoreError& e) {
    throw ChunkStoreError("create chunk batch: " + std::string(e.what()));
  }
  return chunks.size();
}

void RagService::delete_document_chunks(const std::string& document_id) {
  if (!capabilities_.can_delete) {
    return;
  }
  try {
    deps_.store->delete_by_document_id(document_id);
  } catch (const ChunkStoreError& e) {
    throw ChunkStoreError("delete document chunks: " + std::string(e.what()));
  }
}

std::string RagService::build_context(const std::vector<Chunk>& chunks) {
  std::string context;
  for (size_t i = 0; i < chunks.size(); ++i) {
    context += "[Source " + std::to_string(i + 1) + "]\n" + chunks[i].content + "\n\n";
  }
  return context;
}

float RagService::confidence_for(size_t found, int top_k) {
  return static_cast<int>(found) < top_k / 2 ? LOW_CONFIDENCE : HIGH_CONFIDENCE;
}

std::vector<std::optional<std::vector<float>>> RagService::embed_chunks(
    const std::string& document_id,
    const std::vector<std::string>& texts,
    const RequestContext& context) {
  std::vector<std::optional<std::vector<float>>> embeddings(texts.size());
  const size_t window = static_cast<size_t>(config_.index_workers);

  if (window <= 1) {
    for (size_t i = 0; i < texts.size(); ++i) {
      context.check("embed chunks");
      embeddings[i] = embed_one(document_id, i, texts[i], context);
    }
    return embeddings;
  }

  for (size_t begin = 0; begin < texts.size(); begin += window) {
    context.check("embed chunks");
    const size_t end = std::min(texts.size(), begin + window);

    std::vector<std::future<std::optional<std::vector<float>>>> pending;
    pending.reserve(end - begin);
    for (size_t i = begin; i < end; ++i) {
      pending.push_back(std::async(std::launch::async, [this, &document_id, &texts, &context, i]() {
        return embed_one(document_id, i, texts[i], context);
      }));
    }
    for (size_t i = begin; i < end; ++i) {
      embeddings[i] = pending[i - begin].get();
    }
  }
  return embeddings;
}

std::optional<std::vector<float>> RagService::embed_one(const std::string& document_id,
                                                        size_t chunk_index,
                                                        const std::string& text,
                                                        const RequestContext& context) {
  try {
    auto embedding = deps_.embedder->create_embedding(text, config_.embedding_model, context);
    if (embedding.empty()) {
      std::cerr << "Warning: failed to create embedding for chunk (document_id=" << document_id
                << ", chunk_index=" << chunk_index << ", error=empty embedding)" << std::endl;
      return std::nullopt;
    }
    return embedding;
  } catch (const DeadlineExceededError&) {
    throw;
  } catch (const std::exception& e) {
    std::cerr << "Warning: failed to create embedding for chunk (document_id=" << document_id
              << ", chunk_index=" << chunk_index << ", error=" << e.what() << ")" << std::endl;
    return std::nullopt;
  }
}

}  // namespace lucid_core
