#include "test_framework.hpp"

#include "calx/continuation/reaper.hpp"
#include "calx/continuation/store.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace {

namespace c = calx::continuation;

// Manually advanced clock shared with the store (and the reaper thread).
class ManualClock {
public:
  c::TimeSource source() {
    return [this]() { return c::Clock::time_point(std::chrono::seconds(seconds_.load())); };
  }
  void advance(std::chrono::seconds by) { seconds_ += by.count(); }

private:
  std::atomic<long long> seconds_{1'000'000};
};

std::vector<std::string> fragments_of(std::size_t count) {
  std::vector<std::string> out;
  for (std::size_t i = 0; i < count; ++i) {
    out.push_back("fragment-" + std::to_string(i));
  }
  return out;
}

} // namespace

void register_continuation_tests(std::vector<calx::tests::TestCase> &tests) {
  using calx::tests::require;

  tests.push_back({"store_serves_fragments_in_order_then_deletes", [] {
                     ManualClock clock;
                     c::ContinuationStore store(10, clock.source());
                     const auto id = store.create("device-1", {"b", "c"});
                     require(id.ok(), id.error());
                     require(id.value().rfind(c::kSessionIdPrefix, 0) == 0, "cursor prefix");
                     require(id.value().size() == 30, "cursor should carry 24 hex chars");

                     auto first = store.next(id.value());
                     require(first.ok(), first.error());
                     require(first.value().text == "b" && first.value().has_more, "first fragment");

                     auto second = store.next(id.value());
                     require(second.ok(), second.error());
                     require(second.value().text == "c" && !second.value().has_more,
                             "last fragment");
                     require(!store.contains(id.value()), "drained session should be deleted");

                     auto third = store.next(id.value());
                     require(!third.ok(), "drained cursor must not resolve");
                   }});

  tests.push_back({"store_three_fragments_then_not_found", [] {
                     c::ContinuationStore store;
                     const auto id = store.create("device-1", {"one", "two", "three"});
                     require(id.ok(), id.error());
                     const bool expected_more[] = {true, true, false};
                     const char *expected_text[] = {"one", "two", "three"};
                     for (int i = 0; i < 3; ++i) {
                       const auto fragment = store.next(id.value());
                       require(fragment.ok(), fragment.error());
                       require(fragment.value().text == expected_text[i], "fragment order");
                       require(fragment.value().has_more == expected_more[i], "has_more sequence");
                     }
                     require(!store.next(id.value()).ok(), "fourth call should be not found");
                   }});

  tests.push_back({"store_zero_ttl_session_is_immediately_absent", [] {
                     ManualClock clock;
                     c::ContinuationStore store(10, clock.source());
                     const auto live = store.create("device-1", fragments_of(2));
                     const auto dead = store.create("device-2", fragments_of(2), std::chrono::seconds(0));
                     require(live.ok() && dead.ok(), "create failed");
                     require(!store.next(dead.value()).ok(), "zero ttl session must not resolve");

                     const auto again = store.create("device-3", fragments_of(2), std::chrono::seconds(0));
                     require(again.ok(), again.error());
                     require(store.sweep_expired() == 1, "sweep removes the expired session");
                     require(store.contains(live.value()), "live session untouched");
                   }});

  tests.push_back({"store_caps_oversized_ttl", [] {
                     ManualClock clock;
                     c::ContinuationStore store(10, clock.source());
                     const auto id = store.create("device-1", fragments_of(3),
                                                  std::chrono::seconds(20'000'000'000LL));
                     require(id.ok(), id.error());
                     require(store.next(id.value()).ok(), "huge ttl must not be born expired");

                     clock.advance(c::kMaxSessionTtl - std::chrono::seconds(1));
                     require(store.next(id.value()).ok(), "live until the capped deadline");
                     clock.advance(std::chrono::seconds(1));
                     require(!store.next(id.value()).ok(), "expired at the capped deadline");
                   }});

  tests.push_back({"store_rejects_empty_fragment_list", [] {
                     c::ContinuationStore store;
                     require(!store.create("device-1", {}).ok(), "empty list should fail");
                     require(store.size() == 0, "nothing should be stored");
                   }});

  tests.push_back({"store_unknown_cursor_fails", [] {
                     c::ContinuationStore store;
                     const auto missing = store.next("query_doesnotexist");
                     require(!missing.ok(), "unknown cursor should fail");
                     require(missing.error() == "query not found", missing.error());
                   }});

  tests.push_back({"store_expired_session_is_removed_on_next", [] {
                     ManualClock clock;
                     c::ContinuationStore store(10, clock.source());
                     const auto id = store.create("device-1", fragments_of(3), std::chrono::seconds(10));
                     require(id.ok(), id.error());

                     clock.advance(std::chrono::seconds(9));
                     require(store.next(id.value()).ok(), "still live before the deadline");

                     clock.advance(std::chrono::seconds(1));
                     const auto expired = store.next(id.value());
                     require(!expired.ok(), "expired session should fail");
                     require(expired.error() == "query expired", expired.error());
                     require(store.size() == 0, "expired session should be removed");
                   }});

  tests.push_back({"store_sweep_removes_only_expired", [] {
                     ManualClock clock;
                     c::ContinuationStore store(10, clock.source());
                     const auto short_lived =
                         store.create("device-1", fragments_of(2), std::chrono::seconds(5));
                     const auto long_lived =
                         store.create("device-2", fragments_of(2), std::chrono::seconds(60));
                     require(short_lived.ok() && long_lived.ok(), "create failed");

                     clock.advance(std::chrono::seconds(5));
                     require(store.sweep_expired() == 1, "exactly one session expired");
                     require(!store.contains(short_lived.value()), "short-lived session swept");
                     require(store.contains(long_lived.value()), "long-lived session kept");
                   }});

  tests.push_back({"store_capacity_reclaims_expired_sessions", [] {
                     ManualClock clock;
                     c::ContinuationStore store(2, clock.source());
                     require(store.create("a", fragments_of(2), std::chrono::seconds(5)).ok(), "a");
                     require(store.create("b", fragments_of(2), std::chrono::seconds(5)).ok(), "b");

                     const auto full = store.create("c", fragments_of(2), std::chrono::seconds(5));
                     require(!full.ok(), "store at capacity should refuse");

                     clock.advance(std::chrono::seconds(6));
                     const auto reclaimed = store.create("c", fragments_of(2));
                     require(reclaimed.ok(), reclaimed.error());
                     require(store.size() == 1, "expired sessions should have been swept");
                   }});

  tests.push_back({"store_cursors_are_unique", [] {
                     c::ContinuationStore store(500);
                     std::set<std::string> ids;
                     for (int i = 0; i < 200; ++i) {
                       auto id = store.create("device", fragments_of(1));
                       require(id.ok(), id.error());
                       ids.insert(id.value());
                     }
                     require(ids.size() == 200, "cursor collision");
                   }});

  tests.push_back({"store_concurrent_next_serves_each_fragment_once", [] {
                     c::ContinuationStore store;
                     constexpr std::size_t kFragments = 400;
                     const auto id = store.create("device", fragments_of(kFragments));
                     require(id.ok(), id.error());

                     std::mutex collected_mutex;
                     std::vector<std::string> collected;
                     std::vector<std::thread> workers;
                     for (int w = 0; w < 8; ++w) {
                       workers.emplace_back([&]() {
                         while (true) {
                           auto fragment = store.next(id.value());
                           if (!fragment.ok()) {
                             return;
                           }
                           std::lock_guard<std::mutex> lock(collected_mutex);
                           collected.push_back(fragment.value().text);
                         }
                       });
                     }
                     for (auto &worker : workers) {
                       worker.join();
                     }

                     require(collected.size() == kFragments, "every fragment served exactly once");
                     std::set<std::string> unique(collected.begin(), collected.end());
                     require(unique.size() == kFragments, "duplicate fragment served");
                     require(store.size() == 0, "session should be gone");
                   }});

  tests.push_back({"reaper_sweeps_expired_sessions_in_background", [] {
                     ManualClock clock;
                     c::ContinuationStore store(10, clock.source());
                     require(store.create("device", fragments_of(2), std::chrono::seconds(1)).ok(),
                             "create failed");
                     require(store.create("device", fragments_of(2), std::chrono::seconds(600)).ok(),
                             "create failed");
                     clock.advance(std::chrono::seconds(2));

                     c::ContinuationReaper reaper(store, std::chrono::milliseconds(100));
                     reaper.start();
                     require(reaper.is_running(), "reaper should be running");
                     const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
                     while (store.size() != 1 && std::chrono::steady_clock::now() < deadline) {
                       std::this_thread::sleep_for(std::chrono::milliseconds(20));
                     }
                     reaper.stop();

                     require(!reaper.is_running(), "reaper should stop");
                     require(store.size() == 1, "expired session should be swept");
                     require(reaper.total_swept() == 1, "one session swept");
                   }});

  tests.push_back({"reaper_stop_is_prompt", [] {
                     c::ContinuationStore store;
                     c::ContinuationReaper reaper(store, std::chrono::seconds(60));
                     reaper.start();
                     const auto started = std::chrono::steady_clock::now();
                     reaper.stop();
                     const auto elapsed = std::chrono::steady_clock::now() - started;
                     require(elapsed < std::chrono::milliseconds(500),
                             "stop should return within one sleep slice");
                   }});
}
