#pragma once

#include "service_context.hpp"
#include "snapshot/manager/v1.hpp"

namespace snapshot::service {

class JobService {
public:
  explicit JobService(ServiceContext ctx);

  snapshot::manager::v1::ScheduleJobResponse Schedule(const snapshot::manager::v1::ScheduleJobRequest& req);
  snapshot::manager::v1::CancelJobResponse Cancel(const snapshot::manager::v1::JobRequest& req);
  snapshot::manager::v1::GetJobResponse Get(const snapshot::manager::v1::JobRequest& req);
  snapshot::manager::v1::ListJobsResponse List(const snapshot::manager::v1::ListJobsRequest& req);

  void Pause();
  void Resume();

  snapshot::manager::v1::RescheduleJobResponse Reschedule(const snapshot::manager::v1::RescheduleJobRequest& req);
  snapshot::manager::v1::RemoveDoneJobResponse RemoveDone(const snapshot::manager::v1::JobRequest& req);
  snapshot::manager::v1::ExpungeDoneJobsResponse ExpungeDone();

private:
  ServiceContext ctx_;
};

}
