#pragma once

#include <cstdint>
#include <string>

#include "snapshot/manager/runtime/v1/job.pb.h"

namespace snapshot::db::model {

/*
  Persistent job row.

  Tracks are stored in their wire text form ("[0,2]"), the workflow
  definition as protobuf JSON. result_track stays empty unless the job
  succeeded.
*/

struct JobRecord {
  uint64_t id = 0;

  snapshot::manager::runtime::v1::JobState state = snapshot::manager::runtime::v1::JOB_STATE_UNSPECIFIED;

  std::string project_id;
  std::string sandbox_id;
  std::string parent_track;
  std::string provider_id;
  std::string short_description;
  std::string result_track;
  std::string message;
  std::string user;
  std::string workflow_json;

  uint64_t created_at_ms  = 0;
  uint64_t started_at_ms  = 0;
  uint64_t finished_at_ms = 0;
};

}
