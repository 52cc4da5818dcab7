#pragma once

#include <array>
#include <cinttypes>
#include <optional>
#include <string_view>

#include "tnsw/model.h"

namespace tnsw {

constexpr auto const kRouteProductClasses = std::array{
    route_product_class::kTrain,
    route_product_class::kLightRail,
    route_product_class::kBus,
    route_product_class::kCoach,
    route_product_class::kFerry,
    route_product_class::kSchoolBus,
    route_product_class::kWalking,
    route_product_class::kWalkingFootpath,
    route_product_class::kBicycle,
    route_product_class::kTakeBicycleOnPublicTransport,
    route_product_class::kKissAndRide,
    route_product_class::kParkAndRide,
    route_product_class::kTaxi,
    route_product_class::kCar};

constexpr auto const kPersons = std::array{person::kAdult, person::kChild,
                                           person::kScholar, person::kSenior};

constexpr auto const kDefaultIcon = std::string_view{"mdi:clock"};

// Every table indexed by route_product_class has one row per class in the
// order of kRouteProductClasses.
template <typename Table>
consteval bool covers_all_classes(Table const& table) {
  if (table.size() != kRouteProductClasses.size()) {
    return false;
  }
  for (auto i = 0U; i != table.size(); ++i) {
    if (table[i].first != kRouteProductClasses[i]) {
      return false;
    }
  }
  return true;
}

std::optional<route_product_class> to_route_product_class(std::int64_t code);

std::string_view to_str(route_product_class);

std::string_view icon(route_product_class);

bool is_walking(route_product_class);

std::optional<person> to_person(std::string_view);

std::string_view to_str(person);

std::optional<info_priority> to_info_priority(std::string_view);

}  // namespace tnsw
