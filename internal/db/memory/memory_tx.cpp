#include "memory_tx.hpp"

#include <stdexcept>

namespace snapshot::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_      = repo_.committed_;
  base_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!finished_) Rollback();
}

void MemoryTransaction::Commit() {
  if (finished_) {
    throw std::logic_error("transaction already finished");
  }

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != base_version_) {
    throw std::runtime_error("job table changed by a concurrent transaction");
  }
  repo_.committed_ = std::move(working_);
  ++repo_.committed_version_;
  finished_ = true;
}

void MemoryTransaction::Rollback() {
  working_  = {};
  finished_ = true;
}

} // namespace snapshot::db::memory
