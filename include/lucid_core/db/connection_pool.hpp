#pragma once

#include <sqlite_modern_cpp.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>

namespace lucid_core {

class DatabaseError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Fixed set of connections to one SQLite file, shared by the chunk store.
class ConnectionPool {
 public:
  // Opens every connection up front. Throws DatabaseError if one cannot be opened.
  ConnectionPool(const std::string& db_path, int pool_size);

  // Blocks until a connection is free. Throws once the pool is shut down.
  std::unique_ptr<sqlite::database> get_connection();

  // Connections handed back after shutdown are closed instead.
  void return_connection(std::unique_ptr<sqlite::database> conn);

  // Idle connections right now.
  size_t available() const;

  void shutdown();

 private:
  bool shutting_down_ = false;
  std::string db_path_;
  std::queue<std::unique_ptr<sqlite::database>> pool_;
  mutable std::mutex mtx_;
  std::condition_variable cv_;
};

}  // namespace lucid_core
