#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace snapshot::service {

/*
  Runs one RPC body inside a span and records count and latency.
  Exceptions are logged and rethrown; the transport maps them.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view project_id, std::string_view sandbox_id, Fn&& fn) {
  snapshot::observability::SpanScope span(route);
  if (!project_id.empty()) {
    span.SetAttribute("project.id", project_id);
  }
  if (!sandbox_id.empty()) {
    span.SetAttribute("sandbox.id", sandbox_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto record     = [&](bool success) {
    snapshot::observability::Metrics::Instance().RecordRequest(route, success);
    snapshot::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      record(true);
      return;
    } else {
      auto result = fn();
      record(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    SNAPSHOT_LOG_ERROR("RPC failed", {snapshot::observability::StringField("route", route), snapshot::observability::StringField("error", ex.what()),
                                      snapshot::observability::StringField("project_id", project_id),
                                      snapshot::observability::StringField("sandbox_id", sandbox_id)});
    record(false);
    throw;
  }
}

} // namespace snapshot::service
