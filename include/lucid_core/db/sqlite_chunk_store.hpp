#pragma once

#include <string>
#include <vector>

#include "lucid_core/db/chunk_store.hpp"
#include "lucid_core/db/database_manager.hpp"

namespace lucid_core {

/**
 * @brief Chunk store backed by the pooled SQLite database.
 *
 * Content is kept zstd-compressed and embeddings as raw float blobs. search()
 * decompresses only the chunks that make the cut.
 */
class SqliteChunkStore : public ChunkStore {
 public:
  explicit SqliteChunkStore(DatabaseManager& db_manager);

  std::vector<Chunk> create_batch(const std::vector<Chunk>& chunks) override;
  std::vector<Chunk> get_by_document_id(const std::string& document_id) override;
  void delete_by_document_id(const std::string& document_id) override;
  std::vector<Chunk> search(const std::vector<float>& query_embedding,
                            int top_k,
                            double threshold) override;
  size_t count() override;

 private:
  DatabaseManager& db_manager_;
};

}  // namespace lucid_core
