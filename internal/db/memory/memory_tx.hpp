#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace caretask::db::memory {

/*
  Transaction = writer lock + snapshot working copy
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> writer_;
  MemoryRepository::State      working_;
  bool                         committed_   = false;
  bool                         rolled_back_ = false;
};

} // namespace caretask::db::memory
