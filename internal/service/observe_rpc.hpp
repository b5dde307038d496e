#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace reservation::service {

// Caller mistakes and booking rules refusing a request; logged at warn, everything else at error.
inline bool IsClientError(const std::exception& ex) {
  return dynamic_cast<const reservation::util::ValidationError*>(&ex) != nullptr ||
         dynamic_cast<const reservation::util::NotFound*>(&ex) != nullptr ||
         dynamic_cast<const reservation::util::CapacityExhausted*>(&ex) != nullptr ||
         dynamic_cast<const reservation::util::PreconditionFailed*>(&ex) != nullptr;
}

// Span + request metrics around one RPC body; failures are logged and rethrown.
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject, Fn&& fn) {
  reservation::observability::SpanScope span(route);
  if (!subject.empty()) {
    span.SetAttribute("reservation.subject", subject);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto record     = [&](bool success) {
    reservation::observability::Metrics::Instance().RecordRequest(route, success);
    reservation::observability::Metrics::Instance().ObserveRequestLatencyMs(
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
    const auto level = IsClientError(ex) ? spdlog::level::warn : spdlog::level::err;
    reservation::observability::Log(level, "RPC failed",
                                    {reservation::observability::StringField("route", route),
                                     reservation::observability::StringField("error", ex.what()),
                                     reservation::observability::StringField("subject", subject)});
    record(false);
    throw;
  }
}

} // namespace reservation::service
