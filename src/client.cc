#include "tnsw/client.h"

#include <utility>

#include "boost/url/parse.hpp"

#include "utl/logging.h"

#include "tnsw/error.h"
#include "tnsw/metrics_registry.h"
#include "tnsw/parse_trip.h"

namespace tnsw {

namespace {

date::time_zone const* locate_zone(std::string const& name) {
  try {
    return date::locate_zone(name);
  } catch (std::exception const& e) {
    throw configuration_error{"unknown time zone \"{}\": {}", name, e.what()};
  }
}

void verify_url(std::string_view name, std::string const& url) {
  if (auto const parsed = boost::urls::parse_uri(url); !parsed) {
    throw configuration_error{"{} \"{}\" is not a valid url: {}", name, url,
                              parsed.error().message()};
  }
}

}  // namespace

client::client(std::string api_key,
               settings s,
               get_fn_t get,
               metrics_registry* metrics)
    : api_key_{std::move(api_key)},
      settings_{std::move(s)},
      tz_{locate_zone(settings_.timezone_)},
      get_{std::move(get)},
      metrics_{metrics} {
  verify_url("trip url", settings_.trip_url_);
  verify_url("vehicle position url", settings_.vehicle_pos_url_);
}

http_result client::get(boost::urls::url const& url) const {
  auto res = get_(url, headers_t{{"Authorization", "apikey " + api_key_}},
                  settings_.timeout_);
  if (res.status_ < 200U || res.status_ >= 300U) {
    throw upstream_error{res.status_, "GET {}{}: HTTP status {}",
                         std::string_view{url.encoded_host()},
                         std::string_view{url.encoded_path()}, res.status_};
  }
  return res;
}

trip_response client::query_trip(trip_query const& q) const {
  auto const url = trip_request_url(settings_.trip_url_, q, tz_, now_());

  utl::log_info("tnsw.client", "trip request {} -> {} (journeys={})",
                q.origin_, q.destination_, q.num_journeys_);
  if (metrics_ != nullptr) {
    metrics_->trip_requests_.Increment();
  }

  try {
    return parse_trip_response(get(url).body_);
  } catch (error const&) {
    if (metrics_ != nullptr) {
      metrics_->trip_request_errors_.Increment();
    }
    throw;
  }
}

boost::urls::url client::vehicle_pos_url(std::string_view mode_key) const {
  auto base = std::string_view{settings_.vehicle_pos_url_};
  return boost::urls::url{base.ends_with('/')
                              ? fmt::format("{}{}", base, mode_key)
                              : fmt::format("{}/{}", base, mode_key)};
}

realtime_feed client::fetch_realtime_feed(std::string_view mode_key) const {
  utl::log_info("tnsw.client", "fetching realtime feed {}", mode_key);
  if (metrics_ != nullptr) {
    metrics_->realtime_fetches(mode_key).Increment();
  }

  try {
    auto feed = parse_realtime_feed(get(vehicle_pos_url(mode_key)).body_);
    utl::log_info("tnsw.client", "realtime feed {}: {} vehicle positions",
                  mode_key, feed.positions_.size());
    return feed;
  } catch (error const&) {
    if (metrics_ != nullptr) {
      metrics_->realtime_fetch_errors_.Increment();
    }
    throw;
  }
}

}  // namespace tnsw
