#include "lucid_core/db/memory_chunk_store.hpp"

#include <algorithm>
#include <set>
#include <utility>

#include "lucid_core/errors.hpp"
#include "lucid_core/vector/similarity.hpp"

namespace lucid_core {

std::vector<Chunk> InMemoryChunkStore::create_batch(const std::vector<Chunk>& chunks) {
  if (chunks.empty()) {
    return {};
  }
  std::vector<Chunk> stamped = stamp_batch(chunks);

  std::lock_guard<std::mutex> lock(mtx_);
  check_stored_dimension(chunks_.empty() ? 0 : chunks_.front().embedding.size(), stamped);

  std::set<std::pair<std::string, int>> taken;
  for (const auto& existing : chunks_) {
    taken.emplace(existing.document_id, existing.chunk_index);
  }
  for (const auto& chunk : stamped) {
    if (!taken.emplace(chunk.document_id, chunk.chunk_index).second) {
      throw ChunkStoreError("create_batch failed: chunk " + std::to_string(chunk.chunk_index) +
                            " of document " + chunk.document_id + " already exists");
    }
  }

  chunks_.insert(chunks_.end(), stamped.begin(), stamped.end());
  return stamped;
}

std::vector<Chunk> InMemoryChunkStore::get_by_document_id(const std::string& document_id) {
  std::vector<Chunk> result;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    for (const auto& chunk : chunks_) {
      if (chunk.document_id == document_id) {
        result.push_back(chunk);
      }
    }
  }
  std::sort(result.begin(), result.end(),
            [](const Chunk& a, const Chunk& b) { return a.chunk_index < b.chunk_index; });
  return result;
}

void InMemoryChunkStore::delete_by_document_id(const std::string& document_id) {
  std::lock_guard<std::mutex> lock(mtx_);
  chunks_.erase(std::remove_if(chunks_.begin(), chunks_.end(),
                               [&](const Chunk& chunk) { return chunk.document_id == document_id; }),
                chunks_.end());
}

std::vector<Chunk> InMemoryChunkStore::search(const std::vector<float>& query_embedding,
                                              int top_k,
                                              double threshold) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto ranked = similarity::top_k_by_similarity(
      query_embedding, chunks_.size(),
      [this](size_t i) -> const std::vector<float>& { return chunks_[i].embedding; }, top_k,
      threshold);

  std::vector<Chunk> result;
  result.reserve(ranked.size());
  for (const auto& hit : ranked) {
    result.push_back(chunks_[hit.index]);
  }
  return result;
}

size_t InMemoryChunkStore::count() {
  std::lock_guard<std::mutex> lock(mtx_);
  return chunks_.size();
}

}  // namespace lucid_core
