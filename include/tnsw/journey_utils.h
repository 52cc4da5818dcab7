#pragma once

#include <optional>
#include <span>
#include <string_view>

#include "tnsw/model.h"

namespace tnsw {

enum class direction { kForward, kBackward };

// A leg is walking if it has no transportation or its product class is one
// of the pedestrian classes.
bool is_walking(journey_leg const&);

// First leg (in the given scan direction) that is not a walking leg.
// nullptr for pure walking itineraries.
journey_leg const* first_non_walking_leg(std::span<journey_leg const>,
                                         direction = direction::kForward);

// Number of non-walking legs minus one.
// -1 signals an itinerary without any non-walking leg.
int count_transfers(std::span<journey_leg const>);

fare_ticket const* select_ticket(std::span<fare_ticket const>, person);

// Realtime vehicle position feed endpoint for the product class:
// buses, ferries, lightrail, sydneytrains - or nothing.
std::optional<std::string_view> gtfs_mode_key(route_product_class);

}  // namespace tnsw
