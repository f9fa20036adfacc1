#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace edgestore::service {

namespace detail {

inline double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

// Outcomes the caller is expected to handle are not service faults.
inline bool IsExpectedOutcome(util::ErrorKind kind) {
  switch (kind) {
    case util::ErrorKind::kStaleWrite:
    case util::ErrorKind::kNotFound:
    case util::ErrorKind::kAlreadyExists:
    case util::ErrorKind::kDuplicateVersion:
      return true;
    default:
      return false;
  }
}

} // namespace detail

/*
  Wraps one public operation: span, request metrics and a failure log line.
  Exceptions are rethrown unchanged.
*/
template <typename Fn>
auto ObserveOperation(std::string_view route, std::string_view subject, Fn&& fn) {
  observability::SpanScope span(route);
  span.SetAttribute("edgestore.subject", subject);

  const auto started_at = std::chrono::steady_clock::now();
  auto&      metrics    = observability::Metrics::Instance();
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      metrics.RecordRequest(route, true);
      metrics.ObserveRequestLatencyMs(route, detail::ElapsedMs(started_at));
      return;
    } else {
      auto result = fn();
      metrics.RecordRequest(route, true);
      metrics.ObserveRequestLatencyMs(route, detail::ElapsedMs(started_at));
      return result;
    }
  } catch (const util::Error& ex) {
    span.RecordException(ex.what());
    const auto kind = util::ErrorKindName(ex.Kind());
    if (detail::IsExpectedOutcome(ex.Kind())) {
      EDGESTORE_LOG_WARN("operation rejected", {observability::StringField("route", route), observability::StringField("subject", subject),
                                                observability::StringField("kind", kind), observability::StringField("error", ex.what())});
    } else {
      EDGESTORE_LOG_ERROR("operation failed", {observability::StringField("route", route), observability::StringField("subject", subject),
                                               observability::StringField("kind", kind), observability::StringField("error", ex.what())});
    }
    metrics.RecordRequest(route, false);
    metrics.ObserveRequestLatencyMs(route, detail::ElapsedMs(started_at));
    throw;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    EDGESTORE_LOG_ERROR("operation failed", {observability::StringField("route", route), observability::StringField("subject", subject),
                                             observability::StringField("error", ex.what())});
    metrics.RecordRequest(route, false);
    metrics.ObserveRequestLatencyMs(route, detail::ElapsedMs(started_at));
    throw;
  }
}

} // namespace edgestore::service
