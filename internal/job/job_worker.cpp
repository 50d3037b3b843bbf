#include "job_worker.hpp"

#include "internal/observability/logging.hpp"
#include "job_manager.hpp"

namespace snapshot::job {

JobWorker::JobWorker(std::shared_ptr<JobQueue> queue, std::shared_ptr<JobManager> manager) : queue_(std::move(queue)), manager_(std::move(manager)) {
}

JobWorker::~JobWorker() {
  Stop();
}

void JobWorker::Start() {
  running_ = true;
  thread_  = std::thread(&JobWorker::Run, this);
}

void JobWorker::Stop() {
  queue_->Shutdown();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void JobWorker::Run() {
  while (running_) {
    auto job_id = queue_->Dequeue();
    if (!job_id) break;

    try {
      manager_->Execute(*job_id);
    } catch (const std::exception& e) {
      SNAPSHOT_LOG_ERROR("job.worker_failed", {observability::UIntField("job", *job_id), observability::StringField("error", e.what())});
    }
  }
}

} // namespace snapshot::job
