#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace calx::observability {

// Prompt text and credentials never appear in events; only their shape does.
struct QuerySubmittedEvent {
  std::string device_id;
  std::string provider;
  std::size_t prompt_length = 0;
};

struct QueryCompletedEvent {
  std::string device_id;
  std::size_t fragment_count = 0;
  std::size_t response_length = 0;
  std::chrono::milliseconds duration{0};
};

struct ContinuationServedEvent {
  std::string cursor;
  bool has_more = false;
};

struct PolicyBlockedEvent {
  std::string device_id;
  std::string reason;
};

struct SessionsSweptEvent {
  std::size_t removed = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<QuerySubmittedEvent, QueryCompletedEvent,
                                   ContinuationServedEvent, PolicyBlockedEvent,
                                   SessionsSweptEvent, ErrorEvent>;

struct RequestLatencyMetric {
  std::string route;
  std::chrono::milliseconds latency{0};
};

struct ActiveSessionsMetric {
  std::uint64_t count = 0;
};

struct FragmentCountMetric {
  std::uint64_t fragments = 0;
};

using ObserverMetric =
    std::variant<RequestLatencyMetric, ActiveSessionsMetric, FragmentCountMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace calx::observability
