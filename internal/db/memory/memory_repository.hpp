#pragma once

#include <cstdint>
#include <map>
#include <mutex>

#include "internal/db/api/repository.hpp"

namespace snapshot::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertJob(Transaction&, const model::JobRecord&) override;
  std::optional<model::JobRecord> GetJob(Transaction&, uint64_t id) override;
  std::vector<model::JobRecord> ListJobs(Transaction&) override;
  Result UpdateJob(Transaction&, const model::JobRecord&) override;
  Result DeleteJob(Transaction&, uint64_t id) override;
  uint64_t MaxJobId(Transaction&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<uint64_t, model::JobRecord> jobs;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
