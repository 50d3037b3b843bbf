#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/core/snapshot_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "job_queue.hpp"
#include "provider_registry.hpp"
#include "snapshot/manager/v1.hpp"

namespace snapshot::job {

struct ScheduleRequest {
  snapshot::manager::v1::Caller             caller;
  std::string                               project_id;
  std::string                               sandbox_id;
  model::Track                              parent;
  snapshot::manager::v1::WorkflowDefinition workflow;
  std::string                               short_description;
};

/*
  JobManager

  Owns the job table and the queue the workers drain. Every state
  change is written through the repository; the in-memory table is a
  cache of it plus the runtime-only parts (workflow, token, progress).

  Lifecycle:
      QUEUED -> RUNNING -> SUCCEEDED | FAILED | CANCELLED
      QUEUED -> CANCELLED

  A job runs the workflow's steps in order. Each step appends one
  snapshot, the first under the scheduled parent and every later one
  under the snapshot its predecessor created. A step publishes only
  after its provider returned normally and no cancellation was
  requested; steps that already published stay when a later one fails
  or is cancelled.
*/
class JobManager {
 public:
  JobManager(std::shared_ptr<core::SnapshotManager> snapshots, std::shared_ptr<ProviderRegistry> providers, std::shared_ptr<db::Repository> repository,
             const snapshot::runtime::config::SchedulerConfig& config);

  std::shared_ptr<JobQueue> Queue() const { return queue_; }

  // Throws util::NotAvailable, util::TrackNotFound, util::Conflict or util::BadRequest.
  snapshot::manager::v1::JobHandle Schedule(const ScheduleRequest& request);

  // false when the job already finished or is publishing a step's
  // output. Throws util::NotFound.
  bool Cancel(uint64_t job_id);

  snapshot::manager::v1::JobInfo              Get(uint64_t job_id) const;
  std::vector<snapshot::manager::v1::JobInfo> List(snapshot::manager::v1::JobFilter filter) const;

  void Pause();
  void Resume();
  bool IsPaused() const;

  // false unless the job is queued.
  bool Reschedule(uint64_t job_id, JobQueue::Position position, std::size_t index = 0);

  bool        RemoveDone(uint64_t job_id);
  std::size_t ExpungeDone();

  // Runs a dequeued job on the calling thread. Called by JobWorker.
  void Execute(uint64_t job_id);

  // true once the job is in a terminal state.
  bool WaitForJob(uint64_t job_id, std::chrono::milliseconds timeout) const;

 private:
  struct Entry {
    db::model::JobRecord                      record;
    snapshot::manager::v1::WorkflowDefinition workflow;
    // uid of the parent snapshot at schedule time.
    std::string                               parent_uid;
    std::shared_ptr<CancellationToken>        cancellation;
    double                                    progress = 0.0;
  };

  // Fails queued or running jobs left behind by a previous process.
  void Recover();

  void Persist(const db::model::JobRecord& record, bool insert);
  void Finish(uint64_t job_id, snapshot::manager::v1::JobState state, const std::string& message, const std::string& result_track);
  void PublishQueueDepth() const;

  snapshot::manager::v1::JobInfo ToInfo(const Entry& entry) const;

  std::shared_ptr<core::SnapshotManager> snapshots_;
  std::shared_ptr<ProviderRegistry>      providers_;
  std::shared_ptr<db::Repository>        repository_;
  std::shared_ptr<JobQueue>              queue_;

  mutable std::mutex              mutex_;
  mutable std::condition_variable finished_cv_;
  std::map<uint64_t, Entry>       jobs_;
  uint64_t                        next_id_ = 1;
};

} // namespace snapshot::job
