#include "calx/continuation/store.hpp"

#include "calx/security/tokens.hpp"

#include <algorithm>

namespace calx::continuation {

namespace {

constexpr std::size_t kSessionIdBytes = 12;
constexpr int kMaxIdAttempts = 8;

} // namespace

ContinuationStore::ContinuationStore(const std::size_t max_sessions, TimeSource now)
    : max_sessions_(max_sessions == 0 ? 1 : max_sessions), now_(std::move(now)) {}

Clock::time_point ContinuationStore::now() const { return now_ ? now_() : Clock::now(); }

common::Result<std::string> ContinuationStore::create(const std::string &owner_device_id,
                                                      std::vector<std::string> fragments,
                                                      const std::chrono::seconds ttl) {
  if (fragments.empty()) {
    return common::Result<std::string>::failure("continuation needs at least one fragment");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const auto current = now();
  if (sessions_.size() >= max_sessions_) {
    sweep_expired_locked(current);
    if (sessions_.size() >= max_sessions_) {
      return common::Result<std::string>::failure("continuation store is full (" +
                                                  std::to_string(max_sessions_) + " sessions)");
    }
  }

  auto id = make_session_id_locked();
  if (!id.ok()) {
    return id;
  }

  sessions_.emplace(id.value(), Session{.session_id = id.value(),
                                        .owner_device_id = owner_device_id,
                                        .fragments = std::move(fragments),
                                        .cursor = 0,
                                        .expires_at = current + std::min(ttl, kMaxSessionTtl),
                                        .created_at = std::chrono::system_clock::now()});
  return id;
}

common::Result<Fragment> ContinuationStore::next(const std::string &session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return common::Result<Fragment>::failure("query not found");
  }

  Session &session = it->second;
  if (now() >= session.expires_at) {
    sessions_.erase(it);
    return common::Result<Fragment>::failure("query expired");
  }

  Fragment fragment{.text = std::move(session.fragments[session.cursor])};
  ++session.cursor;
  fragment.has_more = session.cursor < session.fragments.size();
  if (!fragment.has_more) {
    sessions_.erase(it);
  }
  return common::Result<Fragment>::success(std::move(fragment));
}

std::size_t ContinuationStore::sweep_expired() {
  std::lock_guard<std::mutex> lock(mutex_);
  return sweep_expired_locked(now());
}

std::size_t ContinuationStore::sweep_expired_locked(const Clock::time_point now) {
  std::size_t removed = 0;
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    if (now >= it->second.expires_at) {
      it = sessions_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::size_t ContinuationStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

bool ContinuationStore::contains(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.contains(session_id);
}

common::Result<std::string> ContinuationStore::make_session_id_locked() const {
  for (int attempt = 0; attempt < kMaxIdAttempts; ++attempt) {
    auto hex = security::random_hex(kSessionIdBytes);
    if (!hex.ok()) {
      return hex;
    }
    std::string id = std::string(kSessionIdPrefix) + hex.value();
    if (!sessions_.contains(id)) {
      return common::Result<std::string>::success(std::move(id));
    }
  }
  return common::Result<std::string>::failure("could not allocate a unique query id");
}

} // namespace calx::continuation
