#include "./util.h"

#include <algorithm>

#include "fmt/format.h"

namespace tnsw::test {

using namespace date;

transit_realtime::FeedMessage to_feed_msg(std::vector<vehicle> const& vehicles,
                                          date::sys_seconds const msg_time) {
  transit_realtime::FeedMessage msg;

  auto const hdr = msg.mutable_header();
  hdr->set_gtfs_realtime_version("2.0");
  hdr->set_incrementality(
      transit_realtime::FeedHeader_Incrementality_FULL_DATASET);
  hdr->set_timestamp(static_cast<std::uint64_t>(
      msg_time.time_since_epoch().count()));

  auto id = 0U;
  for (auto const& v : vehicles) {
    auto const e = msg.add_entity();
    e->set_id(fmt::format("{}", ++id));
    if (v.deleted_) {
      e->set_is_deleted(true);
    }

    auto const vp = e->mutable_vehicle();
    vp->mutable_trip()->set_trip_id(v.trip_id_);
    if (v.route_id_.has_value()) {
      vp->mutable_trip()->set_route_id(*v.route_id_);
    }
    if (v.label_.has_value()) {
      vp->mutable_vehicle()->set_label(*v.label_);
    }
    if (v.has_position_) {
      vp->mutable_position()->set_latitude(v.lat_);
      vp->mutable_position()->set_longitude(v.lng_);
      if (v.bearing_.has_value()) {
        vp->mutable_position()->set_bearing(*v.bearing_);
      }
    }
  }

  return msg;
}

std::string to_feed_bytes(std::vector<vehicle> const& vehicles,
                          date::sys_seconds const msg_time) {
  return to_feed_msg(vehicles, msg_time).SerializeAsString();
}

client::get_fn_t fake_upstream::get_fn() {
  return [this](boost::urls::url const& url, headers_t const& headers,
                std::chrono::seconds) {
    auto const lock = std::scoped_lock{mutex_};
    requests_.push_back(url);
    headers_.push_back(headers);
    auto const it = responses_.find(std::string_view{url.encoded_path()});
    return it == end(responses_) ? http_result{.status_ = 404U, .body_ = {}}
                                 : it->second;
  };
}

void fake_upstream::set(std::string_view path,
                        unsigned const status,
                        std::string body) {
  auto const lock = std::scoped_lock{mutex_};
  responses_.insert_or_assign(
      std::string{path}, http_result{.status_ = status, .body_ = std::move(body)});
}

std::size_t fake_upstream::count(std::string_view path) const {
  auto const lock = std::scoped_lock{mutex_};
  return static_cast<std::size_t>(
      std::ranges::count_if(requests_, [&](boost::urls::url const& u) {
        return std::string_view{u.encoded_path()} == path;
      }));
}

void serve_default(fake_upstream& upstream) {
  upstream.set(kTripPath, 200U, std::string{kTripJson});
  upstream.set(
      kBusesPath, 200U,
      to_feed_bytes({{.trip_id_ = "T0", .lat_ = -33.9F, .lng_ = 151.1F},
                     {.trip_id_ = "T1",
                      .lat_ = -33.8F,
                      .lng_ = 151.2F,
                      .route_id_ = "2431_431",
                      .label_ = "Bus 431",
                      .bearing_ = 90.0F}},
                    sys_days{2024_y / May / 1} + 8h));
}

client make_client(fake_upstream& upstream, metrics_registry* metrics) {
  auto c = client{std::string{kApiKey}, client::settings{}, upstream.get_fn(),
                  metrics};
  c.now_ = []() { return unixtime_t{sys_days{2024_y / May / 1}}; };
  return c;
}

journey_leg walking_leg(route_product_class const c) {
  return journey_leg{
      .duration_ = 60,
      .transportation_ = transportation{.product_ = {.name_ = "walk",
                                                     .class_ = c,
                                                     .icon_id_ = 100}}};
}

journey_leg transit_leg(route_product_class const c,
                        std::optional<std::string> realtime_trip_id) {
  return journey_leg{
      .duration_ = 600,
      .transportation_ =
          transportation{.product_ = {.name_ = "product", .class_ = c},
                         .realtime_trip_id_ = std::move(realtime_trip_id)}};
}

}  // namespace tnsw::test
