#include "calx/continuation/reaper.hpp"

#include "calx/observability/global.hpp"

namespace calx::continuation {

namespace {

constexpr auto kSleepSlice = std::chrono::milliseconds(100);

} // namespace

ContinuationReaper::ContinuationReaper(ContinuationStore &store,
                                       const std::chrono::milliseconds interval)
    : store_(store), interval_(interval < kSleepSlice ? kSleepSlice : interval) {}

ContinuationReaper::~ContinuationReaper() { stop(); }

void ContinuationReaper::start() {
  if (running_) {
    return;
  }
  running_ = true;
  thread_ = std::thread([this]() { sweep_loop(); });
}

void ContinuationReaper::stop() {
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool ContinuationReaper::is_running() const { return running_; }

void ContinuationReaper::sweep_loop() {
  while (running_) {
    for (auto waited = std::chrono::milliseconds(0); waited < interval_ && running_;
         waited += kSleepSlice) {
      std::this_thread::sleep_for(kSleepSlice);
    }
    if (running_) {
      sweep_once();
    }
  }
}

void ContinuationReaper::sweep_once() {
  const std::size_t removed = store_.sweep_expired();
  if (removed == 0) {
    return;
  }
  total_swept_ += removed;
  observability::record_sessions_swept(removed);
  observability::record_metric(
      observability::ActiveSessionsMetric{.count = static_cast<std::uint64_t>(store_.size())});
}

} // namespace calx::continuation
