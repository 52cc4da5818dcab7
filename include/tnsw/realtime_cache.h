#pragma once

#include <chrono>
#include <cinttypes>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "tnsw/realtime_feed.h"

namespace tnsw {

struct metrics_registry;

constexpr auto const kRealtimeBucketSize = std::chrono::seconds{60};

// Fetches each realtime feed at most once per mode and time bucket
// (floor(now / 60s)). Concurrent callers for the same key wait for the one
// fetch in flight, callers for other keys are not blocked by it.
// Failed fetches are not cached.
struct realtime_cache {
  using feed_ptr_t = std::shared_ptr<realtime_feed const>;
  using fetch_fn_t = std::function<realtime_feed(std::string_view)>;
  using clock_fn_t = std::function<std::chrono::system_clock::time_point()>;

  explicit realtime_cache(fetch_fn_t fetch,
                          clock_fn_t clock = &std::chrono::system_clock::now,
                          metrics_registry* metrics = nullptr);

  feed_ptr_t get(std::string_view mode_key);

  std::size_t size() const;

private:
  struct key {
    auto operator<=>(key const&) const = default;
    std::string mode_;
    std::int64_t bucket_;
  };

  struct entry {
    std::uint64_t generation_;
    std::shared_future<feed_ptr_t> feed_;
  };

  std::int64_t current_bucket() const;
  void evict_stale(std::int64_t bucket);

  fetch_fn_t fetch_;
  clock_fn_t clock_;
  metrics_registry* metrics_;

  std::map<key, entry> entries_;
  std::uint64_t next_generation_{0U};
  mutable std::mutex mutex_;
};

}  // namespace tnsw
