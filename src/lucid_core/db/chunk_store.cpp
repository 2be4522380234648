#include "lucid_core/db/chunk_store.hpp"

#include <chrono>
#include <stdexcept>

#include "lucid_core/errors.hpp"
#include "lucid_core/utils/id_generator.hpp"

namespace lucid_core {

std::vector<Chunk> ChunkStore::stamp_batch(const std::vector<Chunk>& chunks) {
  std::vector<Chunk> stamped;
  stamped.reserve(chunks.size());

  const size_t dimension = chunks.empty() ? 0 : chunks.front().embedding.size();
  const auto now = std::chrono::system_clock::now();

  for (const auto& chunk : chunks) {
    if (chunk.document_id.empty()) {
      throw ChunkStoreError("create_batch failed: chunk " + std::to_string(chunk.chunk_index) +
                            " has no document_id");
    }
    if (chunk.content.empty()) {
      throw ChunkStoreError("create_batch failed: chunk " + std::to_string(chunk.chunk_index) +
                            " of document " + chunk.document_id + " has no content");
    }
    if (chunk.embedding.empty() || chunk.embedding.size() != dimension) {
      throw ChunkStoreError("create_batch failed: embedding dimension mismatch for document " +
                            chunk.document_id + ", chunk " + std::to_string(chunk.chunk_index) +
                            ". Expected " + std::to_string(dimension) + ", got " +
                            std::to_string(chunk.embedding.size()));
    }

    Chunk copy = chunk;
    if (copy.id.empty()) {
      try {
        copy.id = IdGenerator::generate();
      } catch (const std::runtime_error& e) {
        throw ChunkStoreError(std::string("create_batch failed: ") + e.what());
      }
    }
    if (copy.created_at == std::chrono::system_clock::time_point{}) {
      copy.created_at = now;
    }
    stamped.push_back(std::move(copy));
  }
  return stamped;
}

void ChunkStore::check_stored_dimension(size_t stored_dimension, const std::vector<Chunk>& batch) {
  if (stored_dimension == 0 || batch.empty()) {
    return;
  }
  const size_t dimension = batch.front().embedding.size();
  if (dimension != stored_dimension) {
    throw ChunkStoreError("create_batch failed: embedding dimension " + std::to_string(dimension) +
                          " does not match the stored dimension " +
                          std::to_string(stored_dimension));
  }
}

}  // namespace lucid_core
