#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/job_record.hpp"

#if SNAPSHOT_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using snapshot::db::ErrorCode;
using snapshot::db::Repository;
using snapshot::db::memory::MemoryRepository;
using snapshot::db::model::JobRecord;
using snapshot::manager::runtime::v1::JOB_STATE_FAILED;
using snapshot::manager::runtime::v1::JOB_STATE_QUEUED;
using snapshot::manager::runtime::v1::JOB_STATE_RUNNING;
using snapshot::manager::runtime::v1::JOB_STATE_SUCCEEDED;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

// How a backend behaves when two transactions overlap.
enum class Overlap {
  // second writer fails at commit
  kOptimistic,
  // second Begin() fails while the first is open
  kExclusive,
};

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  Overlap                                           overlap = Overlap::kOptimistic;
};

JobRecord QueuedJob(uint64_t id, const std::string& sandbox_id) {
  return JobRecord{.id                = id,
                   .state             = JOB_STATE_QUEUED,
                   .project_id        = "p1",
                   .sandbox_id        = sandbox_id,
                   .parent_track      = "[0]",
                   .provider_id       = "binarization",
                   .short_description = "Binarize pages",
                   .user              = "alice",
                   .workflow_json     = R"({"providerId":"binarization","arguments":{"mode":"fast"}})",
                   .created_at_ms     = NowMs()};
}

void VerifyJobLifecycle(Repository& repo) {
  auto tx = repo.Begin();

  auto job = QueuedJob(1, "lifecycle");
  assert(repo.InsertJob(*tx, job));

  auto read = repo.GetJob(*tx, 1);
  assert(read.has_value());
  assert(read->state == JOB_STATE_QUEUED);
  assert(read->parent_track == "[0]");
  assert(read->workflow_json == job.workflow_json);
  assert(read->result_track.empty());
  assert(read->started_at_ms == 0);

  read->state         = JOB_STATE_RUNNING;
  read->started_at_ms = job.created_at_ms + 5;
  assert(repo.UpdateJob(*tx, *read));

  read->state          = JOB_STATE_SUCCEEDED;
  read->result_track   = "[0,3]";
  read->finished_at_ms = job.created_at_ms + 10;
  assert(repo.UpdateJob(*tx, *read));

  const auto done = repo.GetJob(*tx, 1);
  assert(done.has_value());
  assert(done->state == JOB_STATE_SUCCEEDED);
  assert(done->result_track == "[0,3]");
  assert(done->started_at_ms == job.created_at_ms + 5);
  assert(done->finished_at_ms == job.created_at_ms + 10);

  assert(repo.DeleteJob(*tx, 1));
  assert(!repo.GetJob(*tx, 1).has_value());

  tx->Commit();
}

void VerifyErrorCodes(Repository& repo) {
  auto tx = repo.Begin();

  assert(repo.InsertJob(*tx, QueuedJob(10, "errors")));

  const auto duplicate = repo.InsertJob(*tx, QueuedJob(10, "errors"));
  assert(!duplicate);
  assert(duplicate.code == ErrorCode::AlreadyExists);

  const auto missing_update = repo.UpdateJob(*tx, QueuedJob(11, "errors"));
  assert(missing_update.code == ErrorCode::NotFound);

  const auto missing_delete = repo.DeleteJob(*tx, 11);
  assert(missing_delete.code == ErrorCode::NotFound);

  assert(repo.DeleteJob(*tx, 10));
  tx->Commit();
}

void VerifyListOrderAndMaxId(Repository& repo) {
  {
    auto tx = repo.Begin();
    assert(repo.MaxJobId(*tx) == 0);
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    for (uint64_t id : {7u, 3u, 12u}) {
      assert(repo.InsertJob(*tx, QueuedJob(id, "listing")));
    }
    tx->Commit();
  }

  auto       tx   = repo.Begin();
  const auto jobs = repo.ListJobs(*tx);
  assert(jobs.size() == 3);
  assert(jobs[0].id == 3);
  assert(jobs[1].id == 7);
  assert(jobs[2].id == 12);
  assert(repo.MaxJobId(*tx) == 12);

  for (const auto& job : jobs) {
    assert(repo.DeleteJob(*tx, job.id));
  }
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertJob(*tx, QueuedJob(20, "rollback")));
    tx->Rollback();

    bool threw = false;
    try {
      tx->Commit();
    } catch (const std::exception&) {
      threw = true;
    }
    assert(threw);
  }

  {
    // dropped without commit
    auto tx = repo.Begin();
    assert(repo.InsertJob(*tx, QueuedJob(21, "rollback")));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetJob(*check_tx, 20).has_value());
  assert(!repo.GetJob(*check_tx, 21).has_value());
  assert(repo.MaxJobId(*check_tx) == 0);
  check_tx->Commit();
}

void VerifyOverlappingTransactions(Repository& repo, Overlap overlap) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertJob(*tx, QueuedJob(30, "overlap")));
    tx->Commit();
  }

  auto tx1 = repo.Begin();
  if (overlap == Overlap::kExclusive) {
    bool threw = false;
    try {
      auto tx2 = repo.Begin();
      (void)tx2;
    } catch (const std::exception&) {
      threw = true;
    }
    assert(threw);
    tx1->Rollback();
  } else {
    auto tx2 = repo.Begin();

    auto r1 = repo.GetJob(*tx1, 30);
    auto r2 = repo.GetJob(*tx2, 30);
    assert(r1.has_value() && r2.has_value());

    r1->state = JOB_STATE_RUNNING;
    r2->state = JOB_STATE_FAILED;
    assert(repo.UpdateJob(*tx1, *r1));
    assert(repo.UpdateJob(*tx2, *r2));
    tx1->Commit();

    bool threw = false;
    try {
      tx2->Commit();
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);

    auto verify_tx = repo.Begin();
    assert(repo.GetJob(*verify_tx, 30)->state == JOB_STATE_RUNNING);
    verify_tx->Commit();
  }

  auto tx = repo.Begin();
  assert(repo.DeleteJob(*tx, 30));
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();

    auto failed    = QueuedJob(41, "durable");
    failed.state   = JOB_STATE_FAILED;
    failed.message = "interrupted";
    assert(repo->InsertJob(*tx, failed));
    assert(repo->InsertJob(*tx, QueuedJob(42, "durable")));

    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->MaxJobId(*tx) == 42);

  const auto jobs = repo->ListJobs(*tx);
  assert(jobs.size() == 2);
  assert(jobs[0].state == JOB_STATE_FAILED);
  assert(jobs[0].message == "interrupted");
  assert(jobs[1].state == JOB_STATE_QUEUED);
  assert(jobs[1].user == "alice");
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
      .overlap          = Overlap::kOptimistic,
  };
}

#if SNAPSHOT_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("snapshot_manager_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<snapshot::db::sqlite::SqliteDB>(db_path);
    snapshot::db::sqlite::SqliteRepository::BootstrapSchema(*db);
    return std::make_shared<snapshot::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
      .overlap = Overlap::kExclusive,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto repo = backend.make_repository();

    VerifyJobLifecycle(*repo);
    VerifyErrorCodes(*repo);
    VerifyListOrderAndMaxId(*repo);
    VerifyRollbackBehavior(*repo);
    VerifyOverlappingTransactions(*repo, backend.overlap);
  }

  VerifyRestartDurability(backend);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if SNAPSHOT_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "snapshot_manager_integration_repository_parity: pass\n";
  return 0;
}
