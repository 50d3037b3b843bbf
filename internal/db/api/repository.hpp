#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/job_record.hpp"

namespace snapshot::db {

/*
  Repository abstraction.

  - All writes require a Transaction
  - Reads inside a transaction see its writes

  The DB is the source of truth for job history. Snapshot trees live
  in the sandbox folders, not here.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Jobs
  // ---------------------------------------------------------------------

  virtual Result InsertJob(Transaction&, const model::JobRecord&) = 0;

  virtual std::optional<model::JobRecord> GetJob(Transaction&, uint64_t id) = 0;

  // Ordered by id.
  virtual std::vector<model::JobRecord> ListJobs(Transaction&) = 0;

  virtual Result UpdateJob(Transaction&, const model::JobRecord&) = 0;

  virtual Result DeleteJob(Transaction&, uint64_t id) = 0;

  // 0 when no job was ever recorded.
  virtual uint64_t MaxJobId(Transaction&) = 0;
};

} // namespace snapshot::db
