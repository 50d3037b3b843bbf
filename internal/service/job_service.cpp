#include "job_service.hpp"

#include "internal/job/job_manager.hpp"
#include "internal/util/errors.hpp"
#include "rpc_observer.hpp"

namespace snapshot::service {

using namespace snapshot::manager::v1;

namespace {

job::JobQueue::Position ToPosition(RescheduleJobRequest::Position position) {
  switch (position) {
    case RescheduleJobRequest::POSITION_FRONT:
      return job::JobQueue::Position::kFront;
    case RescheduleJobRequest::POSITION_BACK:
      return job::JobQueue::Position::kBack;
    case RescheduleJobRequest::POSITION_INDEX:
      return job::JobQueue::Position::kIndex;
    default:
      throw util::BadRequest("unknown reschedule position");
  }
}

} // namespace

JobService::JobService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ScheduleJobResponse JobService::Schedule(const ScheduleJobRequest& req) {
  return ObserveRpc("JobService.ScheduleJob", req.project_id(), req.sandbox_id(), [&] {
    job::ScheduleRequest request;
    request.caller            = req.caller();
    request.project_id        = req.project_id();
    request.sandbox_id        = req.sandbox_id();
    request.parent            = model::Track::FromProto(req.parent_track());
    request.workflow          = req.workflow();
    request.short_description = req.short_description();

    ScheduleJobResponse resp;
    *resp.mutable_job() = ctx_.jobs->Schedule(request);
    return resp;
  });
}

CancelJobResponse JobService::Cancel(const JobRequest& req) {
  return ObserveRpc("JobService.CancelJob", "", "", [&] {
    CancelJobResponse resp;
    resp.set_cancelled(ctx_.jobs->Cancel(req.job_id()));
    return resp;
  });
}

GetJobResponse JobService::Get(const JobRequest& req) {
  return ObserveRpc("JobService.GetJob", "", "", [&] {
    GetJobResponse resp;
    *resp.mutable_job() = ctx_.jobs->Get(req.job_id());
    return resp;
  });
}

ListJobsResponse JobService::List(const ListJobsRequest& req) {
  return ObserveRpc("JobService.ListJobs", "", "", [&] {
    ListJobsResponse resp;
    for (auto& info : ctx_.jobs->List(req.filter())) {
      *resp.add_jobs() = std::move(info);
    }
    resp.set_paused(ctx_.jobs->IsPaused());
    return resp;
  });
}

void JobService::Pause() {
  ObserveRpc("JobService.PauseScheduler", "", "", [&] { ctx_.jobs->Pause(); });
}

void JobService::Resume() {
  ObserveRpc("JobService.ResumeScheduler", "", "", [&] { ctx_.jobs->Resume(); });
}

RescheduleJobResponse JobService::Reschedule(const RescheduleJobRequest& req) {
  return ObserveRpc("JobService.RescheduleJob", "", "", [&] {
    RescheduleJobResponse resp;
    resp.set_rescheduled(ctx_.jobs->Reschedule(req.job_id(), ToPosition(req.position()), req.index()));
    return resp;
  });
}

RemoveDoneJobResponse JobService::RemoveDone(const JobRequest& req) {
  return ObserveRpc("JobService.RemoveDoneJob", "", "", [&] {
    RemoveDoneJobResponse resp;
    resp.set_removed(ctx_.jobs->RemoveDone(req.job_id()));
    return resp;
  });
}

ExpungeDoneJobsResponse JobService::ExpungeDone() {
  return ObserveRpc("JobService.ExpungeDoneJobs", "", "", [&] {
    ExpungeDoneJobsResponse resp;
    resp.set_removed(static_cast<uint32_t>(ctx_.jobs->ExpungeDone()));
    return resp;
  });
}

}
