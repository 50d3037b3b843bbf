#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/job_service.hpp"
#include "snapshot/manager/v1.hpp"

namespace snapshot::grpc {

class JobServer final : public snapshot::manager::v1::JobService::Service {
public:
  explicit JobServer(std::shared_ptr<snapshot::service::JobService> svc);

  ::grpc::Status ScheduleJob(::grpc::ServerContext*, const snapshot::manager::v1::ScheduleJobRequest*, snapshot::manager::v1::ScheduleJobResponse*) override;
  ::grpc::Status CancelJob(::grpc::ServerContext*, const snapshot::manager::v1::JobRequest*, snapshot::manager::v1::CancelJobResponse*) override;
  ::grpc::Status GetJob(::grpc::ServerContext*, const snapshot::manager::v1::JobRequest*, snapshot::manager::v1::GetJobResponse*) override;
  ::grpc::Status ListJobs(::grpc::ServerContext*, const snapshot::manager::v1::ListJobsRequest*, snapshot::manager::v1::ListJobsResponse*) override;
  ::grpc::Status PauseScheduler(::grpc::ServerContext*, const google::protobuf::Empty*, google::protobuf::Empty*) override;
  ::grpc::Status ResumeScheduler(::grpc::ServerContext*, const google::protobuf::Empty*, google::protobuf::Empty*) override;
  ::grpc::Status RescheduleJob(::grpc::ServerContext*, const snapshot::manager::v1::RescheduleJobRequest*, snapshot::manager::v1::RescheduleJobResponse*) override;
  ::grpc::Status RemoveDoneJob(::grpc::ServerContext*, const snapshot::manager::v1::JobRequest*, snapshot::manager::v1::RemoveDoneJobResponse*) override;
  ::grpc::Status ExpungeDoneJobs(::grpc::ServerContext*, const google::protobuf::Empty*, snapshot::manager::v1::ExpungeDoneJobsResponse*) override;

private:
  std::shared_ptr<snapshot::service::JobService> service_;
};

}
