#include "tnsw/retrieve.h"

#include "utl/logging.h"

#include "tnsw/client.h"
#include "tnsw/journey_utils.h"
#include "tnsw/metrics_registry.h"
#include "tnsw/realtime_cache.h"

namespace tnsw {

std::vector<journey_info> retrieve(client const& c,
                                   realtime_cache& cache,
                                   trip_query const& q,
                                   metrics_registry* metrics) {
  auto res = c.query_trip(q);

  auto infos = std::vector<journey_info>{};
  infos.reserve(res.journeys_.size());
  for (auto& j : res.journeys_) {
    auto realtime = std::optional<vehicle_position>{};

    auto const origin_leg = first_non_walking_leg(j.legs_, direction::kForward);
    if (origin_leg != nullptr) {
      auto const& t = *origin_leg->transportation_;
      auto const mode = gtfs_mode_key(t.product_.class_);
      if (t.realtime_trip_id_.has_value() && mode.has_value()) {
        auto const feed = cache.get(*mode);
        if (auto const pos = find_realtime_info(*feed, *t.realtime_trip_id_);
            pos != nullptr) {
          realtime = *pos;
          if (metrics != nullptr) {
            metrics->realtime_matches_.Increment();
          }
        }
        utl::log_debug("tnsw.retrieve", "realtime trip {} ({}): {}",
                       *t.realtime_trip_id_, *mode,
                       realtime.has_value() ? "found" : "not found");
      }
    }

    infos.push_back(journey_info{std::move(j), std::move(realtime)});
  }
  return infos;
}

}  // namespace tnsw
