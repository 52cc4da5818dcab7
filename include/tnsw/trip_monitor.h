#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include "tnsw/model.h"
#include "tnsw/retrieve.h"
#include "tnsw/trip_query.h"

namespace tnsw {

struct client;
struct realtime_cache;
struct metrics_registry;

// Keeps the result of the last successful retrieval for one trip.
// refresh() is called by the host on its own schedule. A failed refresh
// leaves the previous result in place and marks the data unavailable.
struct trip_monitor {
  using data_t = std::vector<journey_info>;

  trip_monitor(trip_query query,
               client const&,
               realtime_cache&,
               metrics_registry* = nullptr);

  bool refresh();

  bool available() const;
  std::shared_ptr<data_t const> data() const;
  trip_query const& query() const { return query_; }

private:
  trip_query query_;
  client const& client_;
  realtime_cache& cache_;
  metrics_registry* metrics_;

  mutable std::mutex mutex_;
  std::shared_ptr<data_t const> data_;
  bool available_{false};
};

}  // namespace tnsw
