#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace snapshot::job {

/*
  Thread-safe blocking queue of job ids for the worker pool.

  A paused queue keeps its entries but hands none out.
*/
class JobQueue {
 public:
  enum class Position { kFront, kBack, kIndex };

  void Enqueue(uint64_t job_id);

  // blocking wait; nullopt after Shutdown
  std::optional<uint64_t> Dequeue();

  // false when the id is not queued
  bool Remove(uint64_t job_id);
  bool Move(uint64_t job_id, Position position, std::size_t index = 0);

  void Pause();
  void Resume();
  bool IsPaused() const;

  std::size_t           Size() const;
  std::vector<uint64_t> Pending() const;

  void Shutdown();

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<uint64_t>    queue_;
  bool                    paused_   = false;
  bool                    shutdown_ = false;
};

} // namespace snapshot::job
