#include "tnsw/trip_query.h"

#include "boost/url/parse.hpp"
#include "boost/url/url.hpp"

#include "utl/helpers/algorithm.h"

#include "tnsw/error.h"

namespace tnsw {

void verify(trip_query const& q) {
  if (q.depart_at_.has_value() && q.arrive_by_.has_value()) {
    throw configuration_error{"unable to specify both depart_at and arrive_by"};
  }
  if (q.include_modes_.has_value() && q.exclude_modes_.has_value()) {
    throw configuration_error{
        "unable to specify both included and excluded modes of transport"};
  }
  if (q.num_journeys_ < 1U) {
    throw configuration_error{"number of journeys must be at least 1"};
  }
  if (q.origin_.empty() || q.destination_.empty()) {
    throw configuration_error{"origin and destination are required"};
  }
}

std::vector<mode_of_transport> excluded_modes(trip_query const& q) {
  auto excluded = std::vector<mode_of_transport>{};
  if (q.include_modes_.has_value() && !q.include_modes_->empty()) {
    for (auto const m : kModesOfTransport) {
      if (utl::find(*q.include_modes_, m) == end(*q.include_modes_)) {
        excluded.push_back(m);
      }
    }
  } else if (q.exclude_modes_.has_value()) {
    for (auto const m : kModesOfTransport) {
      if (utl::find(*q.exclude_modes_, m) != end(*q.exclude_modes_)) {
        excluded.push_back(m);
      }
    }
  }
  return excluded;
}

boost::urls::url trip_request_url(std::string_view base_url,
                                  trip_query const& q,
                                  date::time_zone const* tz,
                                  unixtime_t const now) {
  verify(q);

  auto const itd = date::make_zoned(
      tz, q.depart_at_.value_or(q.arrive_by_.value_or(now)));

  auto const parsed = boost::urls::parse_uri(base_url);
  if (!parsed) {
    throw configuration_error{"trip url \"{}\" is not a valid url: {}",
                              base_url, parsed.error().message()};
  }
  auto url = boost::urls::url{*parsed};
  auto params = url.params();
  params.append({"outputFormat", "rapidJSON"});
  params.append({"depArrMacro", q.arrive_by_.has_value() ? "arr" : "dep"});
  params.append({"itdDate", date::format("%Y%m%d", itd)});
  params.append({"itdTime", date::format("%H%M", itd)});
  params.append({"type_origin", "any"});
  params.append({"type_destination", "any"});
  params.append({"name_origin", q.origin_});
  params.append({"name_destination", q.destination_});
  params.append({"calcNumberOfTrips", std::to_string(q.num_journeys_)});
  params.append({"version", kTripApiVersion});
  params.append({"TfNSWTR", "true"});

  auto const excluded = excluded_modes(q);
  if (q.exclude_modes_.has_value() ||
      (q.include_modes_.has_value() && !q.include_modes_->empty())) {
    params.append({"excludedMeans", "checkbox"});
  }
  for (auto const m : excluded) {
    params.append({exclusion_param(m), "1"});
  }

  return url;
}

}  // namespace tnsw
