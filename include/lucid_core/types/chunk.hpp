#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace lucid_core {

// A slice of a document's text together with its embedding. Chunks are never
// edited in place; a document's chunks are created and deleted as a unit.
struct Chunk {
  std::string id;
  std::string document_id;
  int chunk_index = 0;
  std::string content;
  std::vector<float> embedding;
  std::chrono::system_clock::time_point created_at{};
};

struct ChunkWithPosition {
  std::string content;
  int index = 0;
};

}  // namespace lucid_core
