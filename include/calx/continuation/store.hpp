#pragma once

#include "calx/common/result.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace calx::continuation {

using Clock = std::chrono::steady_clock;
using TimeSource = std::function<Clock::time_point()>;

constexpr std::size_t kDefaultMaxSessions = 10'000;
constexpr auto kDefaultSessionTtl = std::chrono::seconds(3600);
constexpr auto kMaxSessionTtl = std::chrono::seconds(315'360'000);
constexpr const char *kSessionIdPrefix = "query_";

struct Fragment {
  std::string text;
  bool has_more = false;
};

struct Session {
  std::string session_id;
  std::string owner_device_id;
  std::vector<std::string> fragments;
  std::size_t cursor = 0;
  Clock::time_point expires_at{};
  std::chrono::system_clock::time_point created_at{};
};

/// Undelivered fragments of multi-fragment answers, keyed by an opaque cursor.
/// All operations are serialized by one mutex; a fragment is served at most once.
class ContinuationStore {
public:
  explicit ContinuationStore(std::size_t max_sessions = kDefaultMaxSessions, TimeSource now = {});

  ContinuationStore(const ContinuationStore &) = delete;
  ContinuationStore &operator=(const ContinuationStore &) = delete;

  // ttl is capped at kMaxSessionTtl; a non-positive ttl is expired on arrival.
  [[nodiscard]] common::Result<std::string> create(const std::string &owner_device_id,
                                                   std::vector<std::string> fragments,
                                                   std::chrono::seconds ttl = kDefaultSessionTtl);

  /// Serves the fragment under the cursor. The session is deleted once its last
  /// fragment is returned. Unknown or expired ids fail.
  [[nodiscard]] common::Result<Fragment> next(const std::string &session_id);

  std::size_t sweep_expired();

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] bool contains(const std::string &session_id) const;
  [[nodiscard]] std::size_t max_sessions() const { return max_sessions_; }

private:
  [[nodiscard]] Clock::time_point now() const;
  std::size_t sweep_expired_locked(Clock::time_point now);
  [[nodiscard]] common::Result<std::string> make_session_id_locked() const;

  std::size_t max_sessions_;
  TimeSource now_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Session> sessions_;
};

} // namespace calx::continuation
