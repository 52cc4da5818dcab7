#pragma once

#include <string_view>

#include "prometheus/counter.h"
#include "prometheus/family.h"
#include "prometheus/registry.h"

namespace tnsw {

struct metrics_registry {
  metrics_registry();
  ~metrics_registry();

  prometheus::Counter& realtime_fetches(std::string_view mode_key);

  prometheus::Registry registry_;
  prometheus::Counter& trip_requests_;
  prometheus::Counter& trip_request_errors_;
  prometheus::Family<prometheus::Counter>& realtime_fetches_;
  prometheus::Counter& realtime_fetch_errors_;
  prometheus::Counter& realtime_cache_hits_;
  prometheus::Counter& realtime_cache_misses_;
  prometheus::Counter& realtime_matches_;
};

}  // namespace tnsw
