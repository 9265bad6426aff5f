#include "calx/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace calx::observability {

namespace {

void log_line(const std::string &level, const std::string &message) {
  std::cerr << "[" << level << "] " << message << "\n";
}

std::string bool_text(const bool value) { return value ? "true" : "false"; }

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, QuerySubmittedEvent>) {
          log_line("INFO", "query.submit device=" + evt.device_id + " provider=" + evt.provider +
                               " prompt_length=" + std::to_string(evt.prompt_length));
        } else if constexpr (std::is_same_v<T, QueryCompletedEvent>) {
          log_line("INFO", "query.complete device=" + evt.device_id +
                               " fragments=" + std::to_string(evt.fragment_count) +
                               " response_length=" + std::to_string(evt.response_length) +
                               " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, ContinuationServedEvent>) {
          log_line("DEBUG", "query.continue cursor=" + evt.cursor +
                                " has_more=" + bool_text(evt.has_more));
        } else if constexpr (std::is_same_v<T, PolicyBlockedEvent>) {
          log_line("WARN", "policy.blocked device=" + evt.device_id + " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, SessionsSweptEvent>) {
          log_line("INFO", "continuation.sweep removed=" + std::to_string(evt.removed));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RequestLatencyMetric>) {
          log_line("DEBUG", "metric.request_latency_ms=" + std::to_string(m.latency.count()) +
                                " route=" + m.route);
        } else if constexpr (std::is_same_v<T, ActiveSessionsMetric>) {
          log_line("DEBUG", "metric.active_sessions=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, FragmentCountMetric>) {
          log_line("DEBUG", "metric.fragments=" + std::to_string(m.fragments));
        }
      },
      metric);
}

void LogObserver::flush() { std::cerr.flush(); }

} // namespace calx::observability
