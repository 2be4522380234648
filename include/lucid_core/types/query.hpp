#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "lucid_core/types/chunk.hpp"

namespace lucid_core {

struct Query {
  std::string text;
  int top_k = 0;
  float threshold = 0.0f;
};

struct Response {
  std::string answer;
  std::vector<Chunk> relevant_chunks;
  float confidence_score = 0.0f;
  int64_t processing_time_ms = 0;
};

}  // namespace lucid_core
