#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/job/job_manager.hpp"
#include "internal/job/job_worker.hpp"

namespace snapshot::factory {

/*
  Application

  Owns everything the process keeps alive: the transport adapters
  handed to the server and the background job workers.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  std::shared_ptr<job::JobManager>             jobs;
  std::vector<std::shared_ptr<job::JobWorker>> background_workers;
};

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const snapshot::runtime::config::RuntimeConfig& config);

}
