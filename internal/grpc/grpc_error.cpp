#include "grpc_error.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace snapshot::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace snapshot::util;

  if (dynamic_cast<const TrackNotFound*>(&e) || dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const Conflict*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }
  if (dynamic_cast<const NotAvailable*>(&e) || dynamic_cast<const PreconditionFailed*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const MalformedDocument*>(&e)) {
    return {::grpc::StatusCode::DATA_LOSS, e.what()};
  }
  if (dynamic_cast<const BadRequest*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }

  SNAPSHOT_LOG_ERROR("internal error", {snapshot::observability::StringField("error", e.what())});
  return {::grpc::StatusCode::UNAVAILABLE, "service unavailable"};
}

} // namespace snapshot::grpc
