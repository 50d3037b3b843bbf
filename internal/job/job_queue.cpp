#include "job_queue.hpp"

#include <algorithm>

namespace snapshot::job {

void JobQueue::Enqueue(uint64_t job_id) {
  {
    std::lock_guard lock(mutex_);
    queue_.push_back(job_id);
  }
  cv_.notify_one();
}

std::optional<uint64_t> JobQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || (!paused_ && !queue_.empty()); });

  if (shutdown_) return std::nullopt;

  uint64_t job_id = queue_.front();
  queue_.pop_front();
  return job_id;
}

bool JobQueue::Remove(uint64_t job_id) {
  std::lock_guard lock(mutex_);
  auto            it = std::find(queue_.begin(), queue_.end(), job_id);
  if (it == queue_.end()) return false;
  queue_.erase(it);
  return true;
}

bool JobQueue::Move(uint64_t job_id, Position position, std::size_t index) {
  {
    std::lock_guard lock(mutex_);
    auto            it = std::find(queue_.begin(), queue_.end(), job_id);
    if (it == queue_.end()) return false;
    queue_.erase(it);

    switch (position) {
      case Position::kFront:
        queue_.push_front(job_id);
        break;
      case Position::kBack:
        queue_.push_back(job_id);
        break;
      case Position::kIndex:
        queue_.insert(queue_.begin() + static_cast<std::ptrdiff_t>(std::min(index, queue_.size())), job_id);
        break;
    }
  }
  cv_.notify_one();
  return true;
}

void JobQueue::Pause() {
  std::lock_guard lock(mutex_);
  paused_ = true;
}

void JobQueue::Resume() {
  {
    std::lock_guard lock(mutex_);
    paused_ = false;
  }
  cv_.notify_all();
}

bool JobQueue::IsPaused() const {
  std::lock_guard lock(mutex_);
  return paused_;
}

std::size_t JobQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

std::vector<uint64_t> JobQueue::Pending() const {
  std::lock_guard lock(mutex_);
  return {queue_.begin(), queue_.end()};
}

void JobQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace snapshot::job
