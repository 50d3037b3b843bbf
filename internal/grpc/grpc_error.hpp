#pragma once

#include <grpcpp/grpcpp.h>
#include "internal/util/errors.hpp"

namespace snapshot::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  Anything that is not one of the typed errors is reported as
  UNAVAILABLE without its message.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace snapshot::grpc
