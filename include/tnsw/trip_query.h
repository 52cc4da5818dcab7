#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "boost/url/url.hpp"

#include "date/tz.h"

#include "tnsw/mode_of_transport.h"
#include "tnsw/model.h"

namespace tnsw {

constexpr auto const kTripApiVersion = std::string_view{"10.2.1.42"};

struct trip_query {
  std::string origin_;
  std::string destination_;
  unsigned num_journeys_{1U};

  // At most one of both. Neither: depart now.
  std::optional<unixtime_t> depart_at_;
  std::optional<unixtime_t> arrive_by_;

  // At most one of both.
  std::optional<std::vector<mode_of_transport>> include_modes_;
  std::optional<std::vector<mode_of_transport>> exclude_modes_;
};

// Throws configuration_error.
void verify(trip_query const&);

// Modes to exclude: the complement of include_modes_ if given (and not
// empty), otherwise exclude_modes_. Ordered like kModesOfTransport.
std::vector<mode_of_transport> excluded_modes(trip_query const&);

// Trip request URL with all query parameters. Times are formatted in the
// given time zone.
boost::urls::url trip_request_url(std::string_view base_url,
                                  trip_query const&,
                                  date::time_zone const*,
                                  unixtime_t now);

}  // namespace tnsw
