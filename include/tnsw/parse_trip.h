#pragma once

#include <optional>
#include <string_view>

#include "tnsw/model.h"

namespace tnsw {

// Parses a trip planner rapidJSON response.
// Throws malformed_response on any schema deviation.
trip_response parse_trip_response(std::string_view json);

// ISO 8601 date time with "Z" or numeric UTC offset suffix.
std::optional<unixtime_t> parse_timestamp(std::string_view);

}  // namespace tnsw
