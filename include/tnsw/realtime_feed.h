#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tnsw/model.h"

namespace tnsw {

struct vehicle_position {
  friend bool operator==(vehicle_position const&,
                         vehicle_position const&) = default;

  std::string entity_id_;
  std::string trip_id_;
  std::optional<std::string> route_id_;
  std::optional<std::string> vehicle_id_;
  std::optional<std::string> vehicle_label_;
  double lat_{0.0};
  double lng_{0.0};
  std::optional<float> bearing_;
  std::optional<float> speed_;
  std::optional<unixtime_t> timestamp_;
  std::optional<std::string> occupancy_status_;
};

// Snapshot of one vehicle position feed message. Never modified after
// parsing.
struct realtime_feed {
  std::optional<unixtime_t> timestamp_;
  std::vector<vehicle_position> positions_;
};

// Decodes a GTFS-RT FeedMessage. Entities without a vehicle, trip id or
// position are skipped. Throws malformed_response if the buffer is not a
// valid feed message.
realtime_feed parse_realtime_feed(std::string_view protobuf);

vehicle_position const* find_realtime_info(realtime_feed const&,
                                           std::string_view trip_id);

}  // namespace tnsw
