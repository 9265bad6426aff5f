#pragma once

#include "calx/observability/observer.hpp"

#include <memory>

namespace calx::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_query_submitted(const std::string &device_id, const std::string &provider,
                            std::size_t prompt_length);
void record_query_completed(const std::string &device_id, std::size_t fragment_count,
                            std::size_t response_length, std::chrono::milliseconds duration);
void record_continuation_served(const std::string &cursor, bool has_more);
void record_policy_blocked(const std::string &device_id, const std::string &reason);
void record_sessions_swept(std::size_t removed);
void record_error(const std::string &component, const std::string &message);

} // namespace calx::observability
