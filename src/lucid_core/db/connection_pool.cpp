#include "lucid_core/db/connection_pool.hpp"

namespace lucid_core {

namespace {

std::unique_ptr<sqlite::database> open_connection(const std::string& db_path) {
  auto db = std::make_unique<sqlite::database>(db_path);
  *db << "PRAGMA foreign_keys = ON;";
  *db << "PRAGMA journal_mode = WAL;";
  *db << "PRAGMA synchronous = NORMAL;";
  *db << "PRAGMA busy_timeout = 5000;";
  return db;
}

}  // namespace

ConnectionPool::ConnectionPool(const std::string& db_path, int pool_size) : db_path_(db_path) {
  try {
    for (int i = 0; i < pool_size; ++i) {
      pool_.push(open_connection(db_path_));
    }
  } catch (const sqlite::sqlite_exception& e) {
    throw DatabaseError("Failed to open connection to " + db_path_ + ": " + e.errstr());
  }
}

std::unique_ptr<sqlite::database> ConnectionPool::get_connection() {
  std::unique_lock<std::mutex> lock(mtx_);
  cv_.wait(lock, [this] { return shutting_down_ || !pool_.empty(); });

  if (shutting_down_) {
    throw DatabaseError("Connection pool is shut down");
  }

  auto conn = std::move(pool_.front());
  pool_.pop();
  return conn;
}

void ConnectionPool::return_connection(std::unique_ptr<sqlite::database> conn) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (shutting_down_ || !conn) {
      return;
    }
    pool_.push(std::move(conn));
  }
  cv_.notify_one();
}

size_t ConnectionPool::available() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return pool_.size();
}

void ConnectionPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    shutting_down_ = true;
    std::queue<std::unique_ptr<sqlite::database>>().swap(pool_);
  }
  cv_.notify_all();
}

}  // namespace lucid_core
