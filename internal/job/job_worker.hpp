#pragma once

#include <atomic>
#include <memory>
#include <thread>

#include "job_queue.hpp"

namespace snapshot::job {

class JobManager;

/*
  Background worker that runs queued jobs, one at a time.

  The pool is simply several workers sharing one queue.
*/
class JobWorker {
 public:
  JobWorker(std::shared_ptr<JobQueue> queue, std::shared_ptr<JobManager> manager);
  ~JobWorker();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<JobQueue>   queue_;
  std::shared_ptr<JobManager> manager_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace snapshot::job
