#include "lucid_core/db/database_manager.hpp"

#include "lucid_core/db/sqlite_error_utils.hpp"

namespace lucid_core {

DatabaseManager& DatabaseManager::get_instance() {
  static DatabaseManager instance;
  return instance;
}

void DatabaseManager::initialize(const std::filesystem::path& db_path, int pool_size) {
  if (is_initialized_) {
    return;
  }
  if (pool_size <= 0) {
    throw DatabaseError("Database pool size must be greater than 0");
  }

  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path());
  }

  try {
    // 1. One-time schema setup before any pooled connection exists
    setup_schema(db_path);

    // 2. Connections for request handlers
    pool_ = std::make_unique<ConnectionPool>(db_path.string(), pool_size);
  } catch (const sqlite::sqlite_exception& e) {
    throw DatabaseError(format_db_error("initialize", e));
  }

  is_initialized_ = true;
}

void DatabaseManager::shutdown() {
  if (!is_initialized_) {
    return;
  }
  pool_->shutdown();
  pool_.reset();
  is_initialized_ = false;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (!is_initialized_) {
    throw DatabaseError("DatabaseManager has not been initialized.");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (!is_initialized_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema(const std::filesystem::path& db_path) {
  // A temporary, single-use connection keeps table creation out of the pool.
  sqlite::database db(db_path.string());
  db << "PRAGMA journal_mode = WAL;";

  // content is zstd-compressed text, embedding is a packed float array
  db << R"(
      CREATE TABLE IF NOT EXISTS chunks (
          id TEXT PRIMARY KEY,
          document_id TEXT NOT NULL,
          chunk_index INTEGER NOT NULL,
          content BLOB NOT NULL,
          embedding BLOB NOT NULL,
          dimension INTEGER NOT NULL,
          created_at TEXT NOT NULL,
          UNIQUE (document_id, chunk_index)
      )
    )";

  db << R"(
      CREATE INDEX IF NOT EXISTS idx_chunks_document_id
      ON chunks(document_id, chunk_index)
    )";
}

}  // namespace lucid_core
