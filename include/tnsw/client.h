#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <string_view>

#include "boost/url/url.hpp"

#include "date/tz.h"

#include "tnsw/http_req.h"
#include "tnsw/model.h"
#include "tnsw/realtime_feed.h"
#include "tnsw/trip_query.h"
#include "tnsw/types.h"

namespace tnsw {

struct metrics_registry;

constexpr auto const kTripUrl =
    std::string_view{"https://api.transport.nsw.gov.au/v1/tp/trip"};
constexpr auto const kVehiclePosUrl =
    std::string_view{"https://api.transport.nsw.gov.au/v1/gtfs/vehiclepos/"};

struct client_settings {
  std::string trip_url_{kTripUrl};
  std::string vehicle_pos_url_{kVehiclePosUrl};
  std::chrono::seconds timeout_{std::chrono::seconds{30}};
  std::string timezone_{"Australia/Sydney"};
};

// Journey planner + realtime vehicle position API client.
// Stateless apart from its settings: safe to use from multiple threads.
struct client {
  using get_fn_t = std::function<http_result(boost::urls::url const&,
                                             headers_t const&,
                                             std::chrono::seconds)>;
  using now_fn_t = std::function<unixtime_t()>;
  using settings = client_settings;

  explicit client(std::string api_key,
                  settings s = {},
                  get_fn_t get = &http_GET_sync,
                  metrics_registry* metrics = nullptr);

  // Throws configuration_error (before any request is made),
  // upstream_error or malformed_response.
  trip_response query_trip(trip_query const&) const;

  // Throws upstream_error or malformed_response.
  realtime_feed fetch_realtime_feed(std::string_view mode_key) const;

  boost::urls::url vehicle_pos_url(std::string_view mode_key) const;

  now_fn_t now_{[]() {
    return std::chrono::time_point_cast<std::chrono::seconds>(
        std::chrono::system_clock::now());
  }};

private:
  http_result get(boost::urls::url const&) const;

  std::string api_key_;
  settings settings_;
  date::time_zone const* tz_;
  get_fn_t get_;
  metrics_registry* metrics_;
};

}  // namespace tnsw
