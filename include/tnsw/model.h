#pragma once

#include <chrono>
#include <cinttypes>
#include <optional>
#include <string>
#include <vector>

#include "tnsw/decimal.h"

namespace tnsw {

using unixtime_t = std::chrono::sys_seconds;

// Trip planner product classes ("class" attribute of a route product).
enum class route_product_class : std::uint8_t {
  kTrain = 1U,
  kLightRail = 4U,
  kBus = 5U,
  kCoach = 7U,
  kFerry = 9U,
  kSchoolBus = 11U,
  kWalking = 99U,
  kWalkingFootpath = 100U,
  kBicycle = 101U,
  kTakeBicycleOnPublicTransport = 102U,
  kKissAndRide = 103U,
  kParkAndRide = 104U,
  kTaxi = 105U,
  kCar = 106U
};

enum class person : std::uint8_t { kAdult, kChild, kScholar, kSenior };

enum class info_priority : std::uint8_t {
  kVeryLow,
  kLow,
  kNormal,
  kHigh,
  kVeryHigh
};

struct stop_info {
  struct timestamps {
    unixtime_t creation_;
    unixtime_t last_modification_;
  };

  std::optional<timestamps> timestamps_;
  info_priority priority_{info_priority::kNormal};
  std::string id_;
  std::int64_t version_{0};
  std::optional<std::string> url_text_;
  std::optional<std::string> url_;
  std::optional<std::string> content_;
  std::optional<std::string> subtitle_;
};

struct leg_stop {
  std::string id_;
  std::string name_;
  std::optional<std::string> disassembled_name_;
  std::string type_;
  std::optional<unixtime_t> departure_time_estimated_;
  std::optional<unixtime_t> departure_time_planned_;
  std::optional<unixtime_t> arrival_time_estimated_;
  std::optional<unixtime_t> arrival_time_planned_;
  std::optional<std::string> occupancy_;
};

struct route_product {
  std::string name_;
  route_product_class class_{route_product_class::kWalking};
  std::int64_t icon_id_{0};
};

struct transportation {
  std::optional<std::string> id_;
  std::optional<std::string> name_;
  std::optional<std::string> disassembled_name_;
  std::optional<std::string> number_;
  std::optional<std::int64_t> icon_id_;
  std::optional<std::string> description_;
  route_product product_;

  // join key into the realtime vehicle position feed
  std::optional<std::string> realtime_trip_id_;
};

struct journey_leg {
  std::int64_t duration_{0};  // seconds
  std::optional<std::int64_t> distance_;
  std::optional<bool> is_realtime_controlled_;
  leg_stop origin_;
  leg_stop destination_;
  std::optional<transportation> transportation_;
  std::vector<stop_info> infos_;
};

struct fare_ticket {
  std::string id_;
  std::string name_;
  std::string comment_;
  person person_{person::kAdult};
  std::optional<std::string> price_level_;
  decimal price_brutto_;
};

struct fare {
  std::vector<fare_ticket> tickets_;
  std::optional<std::size_t> n_zones_;
};

struct journey {
  std::optional<std::int64_t> rating_;
  std::int64_t is_additional_{0};
  std::vector<journey_leg> legs_;
  fare fare_;
};

struct trip_response {
  std::string version_;
  std::vector<journey> journeys_;
};

}  // namespace tnsw
