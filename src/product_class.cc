#include "tnsw/product_class.h"

#include <utility>

#include "utl/helpers/algorithm.h"
#include "utl/verify.h"

namespace tnsw {

namespace {

using rpc = route_product_class;

constexpr auto const kClassNames = std::array<std::pair<rpc, std::string_view>,
                                              kRouteProductClasses.size()>{{
    {rpc::kTrain, "TRAIN"},
    {rpc::kLightRail, "LIGHT_RAIL"},
    {rpc::kBus, "BUS"},
    {rpc::kCoach, "COACH"},
    {rpc::kFerry, "FERRY"},
    {rpc::kSchoolBus, "SCHOOL_BUS"},
    {rpc::kWalking, "WALKING"},
    {rpc::kWalkingFootpath, "WALKING_FOOTPATH"},
    {rpc::kBicycle, "BICYCLE"},
    {rpc::kTakeBicycleOnPublicTransport, "TAKE_BICYCLE_ON_PUBLIC_TRANSPORT"},
    {rpc::kKissAndRide, "KISS_AND_RIDE"},
    {rpc::kParkAndRide, "PARK_AND_RIDE"},
    {rpc::kTaxi, "TAXI"},
    {rpc::kCar, "CAR"},
}};
static_assert(covers_all_classes(kClassNames));

constexpr auto const kIcons = std::array<std::pair<rpc, std::string_view>,
                                         kRouteProductClasses.size()>{{
    {rpc::kTrain, "mdi:train"},
    {rpc::kLightRail, "mdi:tram"},
    {rpc::kBus, "mdi:bus"},
    {rpc::kCoach, "mdi:bus"},
    {rpc::kFerry, "mdi:ferry"},
    {rpc::kSchoolBus, "mdi:bus"},
    {rpc::kWalking, kDefaultIcon},
    {rpc::kWalkingFootpath, kDefaultIcon},
    {rpc::kBicycle, kDefaultIcon},
    {rpc::kTakeBicycleOnPublicTransport, kDefaultIcon},
    {rpc::kKissAndRide, kDefaultIcon},
    {rpc::kParkAndRide, kDefaultIcon},
    {rpc::kTaxi, kDefaultIcon},
    {rpc::kCar, kDefaultIcon},
}};
static_assert(covers_all_classes(kIcons));

constexpr auto const kWalking =
    std::array<std::pair<rpc, bool>, kRouteProductClasses.size()>{{
        {rpc::kTrain, false},
        {rpc::kLightRail, false},
        {rpc::kBus, false},
        {rpc::kCoach, false},
        {rpc::kFerry, false},
        {rpc::kSchoolBus, false},
        {rpc::kWalking, true},
        {rpc::kWalkingFootpath, true},
        {rpc::kBicycle, false},
        {rpc::kTakeBicycleOnPublicTransport, false},
        {rpc::kKissAndRide, false},
        {rpc::kParkAndRide, false},
        {rpc::kTaxi, false},
        {rpc::kCar, false},
    }};
static_assert(covers_all_classes(kWalking));

template <typename Table>
auto const& lookup(Table const& table, rpc const c) {
  auto const it = utl::find_if(table, [&](auto&& x) { return x.first == c; });
  utl::verify(it != end(table), "unknown route product class {}",
              static_cast<int>(c));
  return it->second;
}

}  // namespace

std::optional<route_product_class> to_route_product_class(
    std::int64_t const code) {
  auto const it = utl::find_if(kRouteProductClasses, [&](rpc const c) {
    return static_cast<std::int64_t>(c) == code;
  });
  return it == end(kRouteProductClasses) ? std::nullopt
                                         : std::optional{*it};
}

std::string_view to_str(route_product_class const c) {
  return lookup(kClassNames, c);
}

std::string_view icon(route_product_class const c) { return lookup(kIcons, c); }

bool is_walking(route_product_class const c) { return lookup(kWalking, c); }

std::optional<person> to_person(std::string_view s) {
  if (s == "ADULT") {
    return person::kAdult;
  } else if (s == "CHILD") {
    return person::kChild;
  } else if (s == "SCHOLAR") {
    return person::kScholar;
  } else if (s == "SENIOR") {
    return person::kSenior;
  }
  return std::nullopt;
}

std::string_view to_str(person const p) {
  switch (p) {
    case person::kAdult: return "ADULT";
    case person::kChild: return "CHILD";
    case person::kScholar: return "SCHOLAR";
    case person::kSenior: return "SENIOR";
  }
  std::unreachable();
}

std::optional<info_priority> to_info_priority(std::string_view s) {
  if (s == "veryLow") {
    return info_priority::kVeryLow;
  } else if (s == "low") {
    return info_priority::kLow;
  } else if (s == "normal") {
    return info_priority::kNormal;
  } else if (s == "high") {
    return info_priority::kHigh;
  } else if (s == "veryHigh") {
    return info_priority::kVeryHigh;
  }
  return std::nullopt;
}

}  // namespace tnsw
