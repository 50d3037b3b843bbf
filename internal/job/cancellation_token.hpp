#pragma once

#include <atomic>
#include <stdexcept>
#include <string>

namespace snapshot::job {

// Raised by a provider that observed its cancellation token.
class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Cooperative cancellation flag shared between the scheduler and a
  running provider. Nothing is interrupted; providers poll.

  Publishing a snapshot claims the token first, so a cancel either
  lands before the output is published or is refused:

      ACTIVE -> CANCELLED
      ACTIVE -> PUBLISHING -> ACTIVE
*/
class CancellationToken {
 public:
  // false once the job is publishing its output.
  bool Cancel() noexcept {
    auto expected = State::kActive;
    return state_.compare_exchange_strong(expected, State::kCancelled, std::memory_order_acq_rel) || expected == State::kCancelled;
  }

  bool IsCancelled() const noexcept {
    return state_.load(std::memory_order_acquire) == State::kCancelled;
  }

  void ThrowIfCancelled() const {
    if (IsCancelled()) throw Cancelled("job cancelled");
  }

  // Throws Cancelled when a cancel got in first.
  void BeginPublish() {
    auto expected = State::kActive;
    if (!state_.compare_exchange_strong(expected, State::kPublishing, std::memory_order_acq_rel)) {
      throw Cancelled("job cancelled");
    }
  }

  void EndPublish() noexcept {
    auto expected = State::kPublishing;
    state_.compare_exchange_strong(expected, State::kActive, std::memory_order_acq_rel);
  }

 private:
  enum class State { kActive, kCancelled, kPublishing };

  std::atomic<State> state_{State::kActive};
};

} // namespace snapshot::job
