#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace dispatch::service {

// Span + request metrics around one RPC body. Failures are logged and rethrown.
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view ride_id, Fn&& fn) {
  dispatch::observability::SpanScope span(route);
  if (!ride_id.empty()) {
    span.SetAttribute("ride.id", ride_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] { return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count(); };
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      dispatch::observability::Metrics::Instance().RecordRequest(route, true);
      dispatch::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return;
    } else {
      auto result = fn();
      dispatch::observability::Metrics::Instance().RecordRequest(route, true);
      dispatch::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    DISPATCH_LOG_ERROR("RPC failed", {dispatch::observability::StringField("route", route), dispatch::observability::StringField("error", ex.what()),
                                      dispatch::observability::StringField("ride_id", ride_id)});
    dispatch::observability::Metrics::Instance().RecordRequest(route, false);
    dispatch::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace dispatch::service
