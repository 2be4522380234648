#pragma once

#include <stdexcept>
#include <string>

namespace lucid_core {

/**
 * @brief Base class for every failure raised by the RAG pipeline.
 */
class RagError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Query text was empty. Caller-correctable.
class InvalidQueryError : public RagError {
 public:
  InvalidQueryError() : RagError("invalid query") {}
  explicit InvalidQueryError(const std::string& message) : RagError(message) {}
};

// Embedding or chat provider failed (transport, HTTP status or payload).
class ProviderError : public RagError {
 public:
  using RagError::RagError;
};

// Chunk store failed to insert, load, search or delete.
class ChunkStoreError : public RagError {
 public:
  using RagError::RagError;
};

// The request's deadline passed or the caller cancelled it.
class DeadlineExceededError : public RagError {
 public:
  using RagError::RagError;
};

}  // namespace lucid_core
