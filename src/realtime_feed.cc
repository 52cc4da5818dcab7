#include "tnsw/realtime_feed.h"

#include <algorithm>

#include "utl/logging.h"

#include "gtfsrt/gtfs-realtime.pb.h"

#include "tnsw/error.h"

namespace gtfsrt = transit_realtime;

namespace tnsw {

namespace {

template <typename T>
std::optional<T> opt(bool const has, T const& x) {
  return has ? std::optional<T>{x} : std::nullopt;
}

unixtime_t to_unixtime(std::uint64_t const t) {
  return unixtime_t{std::chrono::seconds{static_cast<std::int64_t>(t)}};
}

}  // namespace

realtime_feed parse_realtime_feed(std::string_view protobuf) {
  auto msg = gtfsrt::FeedMessage{};
  auto const success =
      msg.ParseFromArray(reinterpret_cast<void const*>(protobuf.data()),
                         static_cast<int>(protobuf.size()));
  if (!success) {
    throw malformed_response{
        "unable to parse GTFS-RT FeedMessage ({} bytes)", protobuf.size()};
  }

  auto feed = realtime_feed{
      .timestamp_ = opt(msg.header().has_timestamp(),
                        to_unixtime(msg.header().timestamp()))};
  feed.positions_.reserve(static_cast<std::size_t>(msg.entity_size()));

  auto n_skipped = 0U;
  for (auto const& entity : msg.entity()) {
    if (entity.is_deleted() || !entity.has_vehicle() ||
        !entity.vehicle().has_trip() ||
        !entity.vehicle().trip().has_trip_id() ||
        !entity.vehicle().has_position()) {
      ++n_skipped;
      continue;
    }

    auto const& v = entity.vehicle();
    auto const& pos = v.position();
    feed.positions_.push_back(vehicle_position{
        .entity_id_ = entity.id(),
        .trip_id_ = v.trip().trip_id(),
        .route_id_ = opt(v.trip().has_route_id(), v.trip().route_id()),
        .vehicle_id_ = opt(v.has_vehicle() && v.vehicle().has_id(),
                           v.vehicle().id()),
        .vehicle_label_ = opt(v.has_vehicle() && v.vehicle().has_label(),
                              v.vehicle().label()),
        .lat_ = static_cast<double>(pos.latitude()),
        .lng_ = static_cast<double>(pos.longitude()),
        .bearing_ = opt(pos.has_bearing(), pos.bearing()),
        .speed_ = opt(pos.has_speed(), pos.speed()),
        .timestamp_ = opt(v.has_timestamp(), to_unixtime(v.timestamp())),
        .occupancy_status_ =
            opt(v.has_occupancy_status(),
                gtfsrt::VehiclePosition::OccupancyStatus_Name(
                    v.occupancy_status()))});
  }

  utl::log_debug("tnsw.realtime", "feed: {} vehicle positions, {} skipped",
                 feed.positions_.size(), n_skipped);

  return feed;
}

vehicle_position const* find_realtime_info(realtime_feed const& feed,
                                           std::string_view trip_id) {
  auto const it = std::ranges::find_if(
      feed.positions_,
      [&](vehicle_position const& p) { return p.trip_id_ == trip_id; });
  return it == feed.positions_.end() ? nullptr : &*it;
}

}  // namespace tnsw
