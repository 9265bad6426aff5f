#pragma once

#include "calx/continuation/store.hpp"

#include <atomic>
#include <chrono>
#include <thread>

namespace calx::continuation {

/// Background thread that sweeps expired sessions every `interval`.
/// stop() returns within one 100 ms slice.
class ContinuationReaper {
public:
  ContinuationReaper(ContinuationStore &store, std::chrono::milliseconds interval);
  ~ContinuationReaper();

  ContinuationReaper(const ContinuationReaper &) = delete;
  ContinuationReaper &operator=(const ContinuationReaper &) = delete;

  void start();
  void stop();
  [[nodiscard]] bool is_running() const;
  [[nodiscard]] std::size_t total_swept() const { return total_swept_; }

private:
  void sweep_loop();
  void sweep_once();

  ContinuationStore &store_;
  std::chrono::milliseconds interval_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::size_t> total_swept_{0};
};

} // namespace calx::continuation
