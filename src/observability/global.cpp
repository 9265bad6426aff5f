#include "calx/observability/global.hpp"

#include <mutex>

namespace calx::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_query_submitted(const std::string &device_id, const std::string &provider,
                            const std::size_t prompt_length) {
  record_event(QuerySubmittedEvent{
      .device_id = device_id, .provider = provider, .prompt_length = prompt_length});
}

void record_query_completed(const std::string &device_id, const std::size_t fragment_count,
                            const std::size_t response_length,
                            const std::chrono::milliseconds duration) {
  record_event(QueryCompletedEvent{.device_id = device_id,
                                   .fragment_count = fragment_count,
                                   .response_length = response_length,
                                   .duration = duration});
}

void record_continuation_served(const std::string &cursor, const bool has_more) {
  record_event(ContinuationServedEvent{.cursor = cursor, .has_more = has_more});
}

void record_policy_blocked(const std::string &device_id, const std::string &reason) {
  record_event(PolicyBlockedEvent{.device_id = device_id, .reason = reason});
}

void record_sessions_swept(const std::size_t removed) {
  record_event(SessionsSweptEvent{.removed = removed});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace calx::observability
