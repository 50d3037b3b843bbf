#pragma once

#include "snapshot/manager/core/v1/project.pb.h"
#include "snapshot/manager/runtime/v1/job.pb.h"

namespace snapshot::model {

using snapshot::manager::core::v1::SandboxState;
using snapshot::manager::runtime::v1::JobState;

// ------------------------------------------------------------
// Jobs: queued -> running -> {succeeded, failed, cancelled}
// ------------------------------------------------------------

constexpr bool IsTerminal(JobState state) {
  return state == snapshot::manager::runtime::v1::JOB_STATE_SUCCEEDED || state == snapshot::manager::runtime::v1::JOB_STATE_FAILED ||
         state == snapshot::manager::runtime::v1::JOB_STATE_CANCELLED;
}

constexpr bool CanTransition(JobState from, JobState to) {
  using namespace snapshot::manager::runtime::v1;
  if (IsTerminal(from) || from == to) {
    return false;
  }
  switch (from) {
    case JOB_STATE_QUEUED:
      return to == JOB_STATE_RUNNING || to == JOB_STATE_CANCELLED || to == JOB_STATE_FAILED;
    case JOB_STATE_RUNNING:
      return IsTerminal(to);
    default:
      return false;
  }
}

// ------------------------------------------------------------
// Sandboxes
// ------------------------------------------------------------

constexpr bool IsDone(SandboxState state) {
  return state == snapshot::manager::core::v1::SANDBOX_STATE_CLOSED || state == snapshot::manager::core::v1::SANDBOX_STATE_CANCELED;
}

constexpr bool IsSpecialRightRequired(SandboxState state) {
  return state == snapshot::manager::core::v1::SANDBOX_STATE_SECURED || state == snapshot::manager::core::v1::SANDBOX_STATE_CANCELED;
}

constexpr bool CanTransition(SandboxState from, SandboxState to) {
  using namespace snapshot::manager::core::v1;
  if (from == to || to == SANDBOX_STATE_UNSPECIFIED) {
    return false;
  }
  if (to == SANDBOX_STATE_SECURED) {
    return true;
  }
  switch (from) {
    case SANDBOX_STATE_PAUSED:
      return to == SANDBOX_STATE_ACTIVE;
    case SANDBOX_STATE_CLOSED:
      return to == SANDBOX_STATE_CANCELED;
    case SANDBOX_STATE_CANCELED:
      return to == SANDBOX_STATE_CLOSED;
    case SANDBOX_STATE_ACTIVE:
    case SANDBOX_STATE_SECURED:
    default:
      return true;
  }
}

} // namespace snapshot::model
