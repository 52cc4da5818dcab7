#pragma once

#include <array>
#include <iosfwd>
#include <optional>
#include <string>
#include <utility>

#include "tnsw/model.h"

namespace tnsw {

struct journey_info;

constexpr auto const kPriceFractionDigits = 2U;

std::string format_price(decimal const&);

// Minutes until departure, rounded down, never negative.
std::int64_t due_minutes(unixtime_t departure, unixtime_t now);

// Normalized fields of one journey as exposed to the user.
struct journey_summary {
  std::optional<std::string> origin_stop_id_;
  std::optional<std::string> origin_name_;
  std::optional<std::string> destination_stop_id_;
  std::optional<std::string> destination_name_;
  std::optional<unixtime_t> departure_time_estimated_;
  std::optional<unixtime_t> departure_time_planned_;
  std::optional<unixtime_t> arrival_time_estimated_;
  std::optional<unixtime_t> arrival_time_planned_;
  std::optional<std::int64_t> due_;
  std::optional<route_product_class> origin_transport_type_;
  std::optional<std::string> origin_line_name_;
  std::optional<std::string> origin_line_name_short_;
  int changes_{-1};
  std::optional<std::string> occupancy_;
  std::optional<std::string> realtime_trip_id_;
  person fare_type_{person::kAdult};
  std::optional<std::string> fare_price_;
  std::optional<double> lat_;
  std::optional<double> lng_;
  std::string icon_;
};

journey_summary summarize(journey_info const&, person fare_type, unixtime_t now);

// Price per rider category, absent where the journey has no such ticket.
std::array<std::pair<person, std::optional<std::string>>, 4U> fare_prices(
    journey const&);

std::ostream& operator<<(std::ostream&, journey_summary const&);

}  // namespace tnsw
