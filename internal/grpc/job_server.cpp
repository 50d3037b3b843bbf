#include "job_server.hpp"
#include "grpc_error.hpp"
#include "snapshot/manager/v1.hpp"

namespace snapshot::grpc {

JobServer::JobServer(std::shared_ptr<snapshot::service::JobService> svc)
    : service_(std::move(svc)) {}

::grpc::Status JobServer::ScheduleJob(::grpc::ServerContext*, const snapshot::manager::v1::ScheduleJobRequest* req, snapshot::manager::v1::ScheduleJobResponse* resp) {
  try {
    *resp = service_->Schedule(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::CancelJob(::grpc::ServerContext*, const snapshot::manager::v1::JobRequest* req, snapshot::manager::v1::CancelJobResponse* resp) {
  try {
    *resp = service_->Cancel(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::GetJob(::grpc::ServerContext*, const snapshot::manager::v1::JobRequest* req, snapshot::manager::v1::GetJobResponse* resp) {
  try {
    *resp = service_->Get(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::ListJobs(::grpc::ServerContext*, const snapshot::manager::v1::ListJobsRequest* req, snapshot::manager::v1::ListJobsResponse* resp) {
  try {
    *resp = service_->List(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::PauseScheduler(::grpc::ServerContext*, const google::protobuf::Empty*, google::protobuf::Empty*) {
  try {
    service_->Pause();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::ResumeScheduler(::grpc::ServerContext*, const google::protobuf::Empty*, google::protobuf::Empty*) {
  try {
    service_->Resume();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::RescheduleJob(::grpc::ServerContext*, const snapshot::manager::v1::RescheduleJobRequest* req, snapshot::manager::v1::RescheduleJobResponse* resp) {
  try {
    *resp = service_->Reschedule(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::RemoveDoneJob(::grpc::ServerContext*, const snapshot::manager::v1::JobRequest* req, snapshot::manager::v1::RemoveDoneJobResponse* resp) {
  try {
    *resp = service_->RemoveDone(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::ExpungeDoneJobs(::grpc::ServerContext*, const google::protobuf::Empty*, snapshot::manager::v1::ExpungeDoneJobsResponse* resp) {
  try {
    *resp = service_->ExpungeDone();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
