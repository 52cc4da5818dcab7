#include "tnsw/metrics_registry.h"

#include <string>

namespace tnsw {

metrics_registry::metrics_registry()
    : registry_{prometheus::Registry()},
      trip_requests_{prometheus::BuildCounter()
                         .Name("tnsw_trip_requests_total")
                         .Help("Number of trip planner requests")
                         .Register(registry_)
                         .Add({})},
      trip_request_errors_{prometheus::BuildCounter()
                               .Name("tnsw_trip_request_errors_total")
                               .Help("Number of failed trip planner requests")
                               .Register(registry_)
                               .Add({})},
      realtime_fetches_{prometheus::BuildCounter()
                            .Name("tnsw_realtime_fetches_total")
                            .Help("Number of vehicle position feed downloads")
                            .Register(registry_)},
      realtime_fetch_errors_{
          prometheus::BuildCounter()
              .Name("tnsw_realtime_fetch_errors_total")
              .Help("Number of failed vehicle position feed downloads")
              .Register(registry_)
              .Add({})},
      realtime_cache_hits_{
          prometheus::BuildCounter()
              .Name("tnsw_realtime_cache_hits_total")
              .Help("Vehicle position lookups served from the cache")
              .Register(registry_)
              .Add({})},
      realtime_cache_misses_{
          prometheus::BuildCounter()
              .Name("tnsw_realtime_cache_misses_total")
              .Help("Vehicle position lookups that required a download")
              .Register(registry_)
              .Add({})},
      realtime_matches_{
          prometheus::BuildCounter()
              .Name("tnsw_realtime_matches_total")
              .Help("Journeys matched to a live vehicle position")
              .Register(registry_)
              .Add({})} {}

metrics_registry::~metrics_registry() = default;

prometheus::Counter& metrics_registry::realtime_fetches(
    std::string_view mode_key) {
  return realtime_fetches_.Add({{"mode", std::string{mode_key}}});
}

}  // namespace tnsw
