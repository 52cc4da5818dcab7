#include "tnsw/journey_utils.h"

#include <algorithm>
#include <array>
#include <ranges>
#include <utility>

#include "utl/helpers/algorithm.h"

#include "tnsw/product_class.h"

namespace tnsw {

namespace {

using rpc = route_product_class;
using mode_key_t = std::optional<std::string_view>;

// Product class -> realtime vehicle position feed ("vehiclepos/{mode}").
constexpr auto const kGtfsModeKeys =
    std::array<std::pair<rpc, mode_key_t>, kRouteProductClasses.size()>{{
        {rpc::kTrain, "sydneytrains"},
        {rpc::kLightRail, "lightrail"},
        {rpc::kBus, "buses"},
        {rpc::kCoach, std::nullopt},
        {rpc::kFerry, "ferries"},
        {rpc::kSchoolBus, std::nullopt},
        {rpc::kWalking, std::nullopt},
        {rpc::kWalkingFootpath, std::nullopt},
        {rpc::kBicycle, std::nullopt},
        {rpc::kTakeBicycleOnPublicTransport, std::nullopt},
        {rpc::kKissAndRide, std::nullopt},
        {rpc::kParkAndRide, std::nullopt},
        {rpc::kTaxi, std::nullopt},
        {rpc::kCar, std::nullopt},
    }};
static_assert(covers_all_classes(kGtfsModeKeys));

}  // namespace

bool is_walking(journey_leg const& l) {
  return !l.transportation_.has_value() ||
         is_walking(l.transportation_->product_.class_);
}

journey_leg const* first_non_walking_leg(std::span<journey_leg const> legs,
                                         direction const dir) {
  auto const non_walking = [](journey_leg const& l) { return !is_walking(l); };
  if (dir == direction::kForward) {
    auto const it = std::ranges::find_if(legs, non_walking);
    return it == legs.end() ? nullptr : &*it;
  } else {
    auto const reversed = legs | std::views::reverse;
    auto const it = std::ranges::find_if(reversed, non_walking);
    return it == reversed.end() ? nullptr : &*it;
  }
}

int count_transfers(std::span<journey_leg const> legs) {
  return static_cast<int>(std::ranges::count_if(
             legs, [](journey_leg const& l) { return !is_walking(l); })) -
         1;
}

fare_ticket const* select_ticket(std::span<fare_ticket const> tickets,
                                 person const p) {
  auto const it = utl::find_if(
      tickets, [&](fare_ticket const& t) { return t.person_ == p; });
  return it == tickets.end() ? nullptr : &*it;
}

std::optional<std::string_view> gtfs_mode_key(route_product_class const c) {
  auto const it = utl::find_if(kGtfsModeKeys,
                               [&](auto const& x) { return x.first == c; });
  return it == end(kGtfsModeKeys) ? std::nullopt : it->second;
}

}  // namespace tnsw
