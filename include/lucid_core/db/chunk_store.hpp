#pragma once

#include <string>
#include <vector>

#include "lucid_core/types/chunk.hpp"

namespace lucid_core {

/**
 * @brief Persistence contract for chunks.
 *
 * Implementations are free to choose the backend and the search strategy
 * (the bundled ones scan every stored embedding); callers rely only on the
 * ranking contract of search().
 *
 * Every failure is reported as ChunkStoreError.
 */
class ChunkStore {
 public:
  virtual ~ChunkStore() = default;

  /**
   * @brief Inserts all chunks or none of them.
   *
   * Chunks without an id or created_at get one. A batch must share the
   * embedding dimension of the chunks already stored, and a
   * (document_id, chunk_index) pair may not already be stored.
   *
   * @return The chunks as stored, in input order.
   */
  virtual std::vector<Chunk> create_batch(const std::vector<Chunk>& chunks) = 0;

  // Chunks of one document ordered by chunk_index; empty when there are none.
  virtual std::vector<Chunk> get_by_document_id(const std::string& document_id) = 0;

  // Idempotent.
  virtual void delete_by_document_id(const std::string& document_id) = 0;

  /**
   * @brief Ranks stored chunks by cosine similarity to the query embedding.
   * @return At most top_k chunks scoring >= threshold, best first.
   */
  virtual std::vector<Chunk> search(const std::vector<float>& query_embedding,
                                    int top_k,
                                    double threshold) = 0;

  virtual size_t count() = 0;

 protected:
  // Validates a batch and fills in missing ids and timestamps.
  static std::vector<Chunk> stamp_batch(const std::vector<Chunk>& chunks);

  // Throws ChunkStoreError unless the batch matches stored_dimension. A
  // stored_dimension of 0 means the store is empty.
  static void check_stored_dimension(size_t stored_dimension, const std::vector<Chunk>& batch);
};

}  // namespace lucid_core
