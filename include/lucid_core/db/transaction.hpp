#pragma once

#include <sqlite_modern_cpp.h>

#include <iostream>
#include <string>

namespace lucid_core {

/**
 * @brief Scoped write transaction for one store operation.
 *
 * Rolls back on scope exit unless commit() ran. The operation name labels
 * rollback diagnostics, e.g. "create_batch".
 */
class Transaction {
 public:
  Transaction(sqlite::database& db, std::string operation, bool immediate = false)
      : db_(db), operation_(std::move(operation)) {
    db_ << (immediate ? "BEGIN IMMEDIATE;" : "BEGIN;");
    active_ = true;
  }

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit() {
    if (active_) {
      db_ << "COMMIT;";
      active_ = false;
    }
  }

  bool is_active() const {
    return active_;
  }

  const std::string& operation() const {
    return operation_;
  }

  ~Transaction() noexcept {
    if (!active_) {
      return;
    }
    try {
      db_ << "ROLLBACK;";
      std::cerr << "Warning: " << operation_ << " rolled back" << std::endl;
    } catch (const sqlite::sqlite_exception& e) {
      std::cerr << "Warning: rollback of " << operation_ << " failed: " << e.errstr()
                << std::endl;
    }
  }

 private:
  sqlite::database& db_;
  std::string operation_;
  bool active_ = false;
};

}  // namespace lucid_core
