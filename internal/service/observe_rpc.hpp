#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace checkout::service {

/*
  Wraps one RPC body in a span plus request count/latency metrics.
  Failures are logged and rethrown for the transport to map.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  observability::SpanScope span(route);

  const auto started_at = std::chrono::steady_clock::now();
  const auto record     = [&](bool success) {
    auto& metrics = observability::Metrics::Instance();
    metrics.RecordRequest(route, success);
    metrics.ObserveRequestLatencyMs(route,
                                    std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      std::forward<Fn>(fn)();
      record(true);
      return;
    } else {
      auto result = std::forward<Fn>(fn)();
      record(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    CHECKOUT_LOG_WARN("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what())});
    record(false);
    throw;
  }
}

} // namespace checkout::service
