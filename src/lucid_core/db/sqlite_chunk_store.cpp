#include "lucid_core/db/sqlite_chunk_store.hpp"

#include <cstring>

#include "lucid_core/db/pooled_connection.hpp"
#include "lucid_core/db/sqlite_error_utils.hpp"
#include "lucid_core/db/transaction.hpp"
#include "lucid_core/errors.hpp"
#include "lucid_core/services/compression_service.hpp"
#include "lucid_core/utils/time_format.hpp"
#include "lucid_core/vector/similarity.hpp"

namespace lucid_core {

namespace {

std::vector<char> embedding_to_blob(const std::vector<float>& embedding) {
  std::vector<char> blob(embedding.size() * sizeof(float));
  std::memcpy(blob.data(), embedding.data(), blob.size());
  return blob;
}

std::vector<float> blob_to_embedding(const std::vector<char>& blob) {
  std::vector<float> embedding(blob.size() / sizeof(float));
  std::memcpy(embedding.data(), blob.data(), embedding.size() * sizeof(float));
  return embedding;
}

// Row as read from disk; content is still compressed.
struct StoredRow {
  std::string id;
  std::string document_id;
  int chunk_index;
  std::vector<char> content;
  std::vector<float> embedding;
  std::string created_at;
};

// Throws ChunkStoreError naming the operation when the row cannot be decoded.
Chunk to_chunk(StoredRow&& row, const std::string& operation) {
  Chunk chunk;
  chunk.id = std::move(row.id);
  chunk.document_id = std::move(row.document_id);
  chunk.chunk_index = row.chunk_index;
  chunk.embedding = std::move(row.embedding);
  try {
    chunk.content = CompressionService::decompress(row.content);
    chunk.created_at = time_format::from_db_string(row.created_at);
  } catch (const std::runtime_error& e) {
    throw ChunkStoreError(operation + " failed: stored chunk " + chunk.id + " is unreadable: " +
                          e.what());
  }
  return chunk;
}

}  // namespace

SqliteChunkStore::SqliteChunkStore(DatabaseManager& db_manager) : db_manager_(db_manager) {}

std::vector<Chunk> SqliteChunkStore::create_batch(const std::vector<Chunk>& chunks) {
  if (chunks.empty()) {
    return {};
  }
  std::vector<Chunk> stamped = stamp_batch(chunks);

  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, "create_batch", true);

    int stored_dimension = 0;
    *conn << "SELECT dimension FROM chunks LIMIT 1" >> [&](int dimension) {
      stored_dimension = dimension;
    };
    check_stored_dimension(static_cast<size_t>(stored_dimension), stamped);

    for (const auto& chunk : stamped) {
      const auto content = CompressionService::compress(chunk.content);
      *conn << "INSERT INTO chunks (id, document_id, chunk_index, content, embedding, dimension, "
               "created_at) VALUES (?, ?, ?, ?, ?, ?, ?)"
            << chunk.id << chunk.document_id << chunk.chunk_index << content
            << embedding_to_blob(chunk.embedding) << static_cast<int>(chunk.embedding.size())
            << time_format::to_db_string(chunk.created_at);
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception& e) {
    if (is_constraint_violation(e)) {
      throw ChunkStoreError("create_batch failed: a chunk of this batch already exists (" +
                            std::string(e.errstr()) + ")");
    }
    throw ChunkStoreError(format_db_error("create_batch", e));
  } catch (const CompressionError& e) {
    throw ChunkStoreError(std::string("create_batch failed: ") + e.what());
  } catch (const DatabaseError& e) {
    throw ChunkStoreError(std::string("create_batch failed: ") + e.what());
  }
  return stamped;
}

std::vector<Chunk> SqliteChunkStore::get_by_document_id(const std::string& document_id) {
  std::vector<Chunk> result;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, document_id, chunk_index, content, embedding, created_at FROM chunks "
             "WHERE document_id = ? ORDER BY chunk_index"
          << document_id >>
        [&](std::string id, std::string doc_id, int chunk_index, std::vector<char> content,
            std::vector<char> embedding, std::string created_at) {
          result.push_back(to_chunk(StoredRow{std::move(id), std::move(doc_id), chunk_index,
                                              std::move(content), blob_to_embedding(embedding),
                                              std::move(created_at)},
                                    "get_by_document_id"));
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("get_by_document_id", e));
  } catch (const DatabaseError& e) {
    throw ChunkStoreError(std::string("get_by_document_id failed: ") + e.what());
  }
  return result;
}

void SqliteChunkStore::delete_by_document_id(const std::string& document_id) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM chunks WHERE document_id = ?" << document_id;
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("delete_by_document_id", e));
  } catch (const DatabaseError& e) {
    throw ChunkStoreError(std::string("delete_by_document_id failed: ") + e.what());
  }
}

std::vector<Chunk> SqliteChunkStore::search(const std::vector<float>& query_embedding,
                                            int top_k,
                                            double threshold) {
  std::vector<StoredRow> rows;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, document_id, chunk_index, content, embedding, created_at FROM chunks" >>
        [&](std::string id, std::string doc_id, int chunk_index, std::vector<char> content,
            std::vector<char> embedding, std::string created_at) {
          rows.push_back(StoredRow{std::move(id), std::move(doc_id), chunk_index,
                                   std::move(content), blob_to_embedding(embedding),
                                   std::move(created_at)});
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("search", e));
  } catch (const DatabaseError& e) {
    throw ChunkStoreError(std::string("search failed: ") + e.what());
  }

  auto ranked = similarity::top_k_by_similarity(
      query_embedding, rows.size(),
      [&rows](size_t i) -> const std::vector<float>& { return rows[i].embedding; }, top_k,
      threshold);

  std::vector<Chunk> result;
  result.reserve(ranked.size());
  for (const auto& hit : ranked) {
    result.push_back(to_chunk(std::move(rows[hit.index]), "search"));
  }
  return result;
}

size_t SqliteChunkStore::count() {
  int total = 0;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT COUNT(*) FROM chunks" >> total;
  } catch (const sqlite::sqlite_exception& e) {
    throw ChunkStoreError(format_db_error("count", e));
  } catch (const DatabaseError& e) {
    throw ChunkStoreError(std::string("count failed: ") + e.what());
  }
  return static_cast<size_t>(total);
}

}  // namespace lucid_core
