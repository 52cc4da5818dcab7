#pragma once

#include <optional>
#include <vector>

#include "tnsw/model.h"
#include "tnsw/realtime_feed.h"
#include "tnsw/trip_query.h"

namespace tnsw {

struct client;
struct realtime_cache;
struct metrics_registry;

struct journey_info {
  journey journey_;
  std::optional<vehicle_position> realtime_;
};

// Queries the trip planner and attaches the live vehicle position of the
// first non-walking leg where available. Order matches the response.
std::vector<journey_info> retrieve(client const&,
                                   realtime_cache&,
                                   trip_query const&,
                                   metrics_registry* = nullptr);

}  // namespace tnsw
