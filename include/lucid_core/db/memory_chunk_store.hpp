#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "lucid_core/db/chunk_store.hpp"

namespace lucid_core {

// Process-local chunk store. Contents are lost when the object is destroyed.
class InMemoryChunkStore : public ChunkStore {
 public:
  InMemoryChunkStore() = default;

  InMemoryChunkStore(const InMemoryChunkStore&) = delete;
  InMemoryChunkStore& operator=(const InMemoryChunkStore&) = delete;

  std::vector<Chunk> create_batch(const std::vector<Chunk>& chunks) override;
  std::vector<Chunk> get_by_document_id(const std::string& document_id) override;
  void delete_by_document_id(const std::string& document_id) override;
  std::vector<Chunk> search(const std::vector<float>& query_embedding,
                            int top_k,
                            double threshold) override;
  size_t count() override;

 private:
  std::mutex mtx_;
  std::vector<Chunk> chunks_;
};

}  // namespace lucid_core
