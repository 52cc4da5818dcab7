#include "tnsw/realtime_cache.h"

#include <exception>
#include <utility>

#include "utl/logging.h"

#include "tnsw/metrics_registry.h"

namespace tnsw {

realtime_cache::realtime_cache(fetch_fn_t fetch,
                               clock_fn_t clock,
                               metrics_registry* metrics)
    : fetch_{std::move(fetch)}, clock_{std::move(clock)}, metrics_{metrics} {}

std::int64_t realtime_cache::current_bucket() const {
  return std::chrono::floor<std::chrono::minutes>(clock_())
      .time_since_epoch()
      .count();
}

void realtime_cache::evict_stale(std::int64_t const bucket) {
  std::erase_if(entries_,
                [&](auto const& e) { return e.first.bucket_ < bucket - 1; });
}

realtime_cache::feed_ptr_t realtime_cache::get(std::string_view mode_key) {
  auto k = key{std::string{mode_key}, current_bucket()};

  auto lock = std::unique_lock{mutex_};

  // fetch finished or in flight -> share it
  if (auto const it = entries_.find(k); it != end(entries_)) {
    auto f = it->second.feed_;
    lock.unlock();
    utl::log_debug("tnsw.cache", "hit: mode={}, bucket={}", k.mode_,
                   k.bucket_);
    if (metrics_ != nullptr) {
      metrics_->realtime_cache_hits_.Increment();
    }
    return f.get();
  }

  // first caller for this key starts the fetch
  auto promise = std::promise<feed_ptr_t>{};
  auto const generation = next_generation_++;
  entries_.emplace(k, entry{generation, promise.get_future().share()});
  evict_stale(k.bucket_);
  lock.unlock();

  utl::log_debug("tnsw.cache", "miss: mode={}, bucket={}", k.mode_, k.bucket_);
  if (metrics_ != nullptr) {
    metrics_->realtime_cache_misses_.Increment();
  }

  try {
    auto feed = std::make_shared<realtime_feed const>(fetch_(k.mode_));
    promise.set_value(feed);
    return feed;
  } catch (...) {
    // waiters get the error, the next caller retries
    lock.lock();
    if (auto const it = entries_.find(k);
        it != end(entries_) && it->second.generation_ == generation) {
      entries_.erase(it);
    }
    lock.unlock();
    promise.set_exception(std::current_exception());
    throw;
  }
}

std::size_t realtime_cache::size() const {
  auto const lock = std::scoped_lock{mutex_};
  return entries_.size();
}

}  // namespace tnsw
