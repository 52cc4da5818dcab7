#include <cstdlib>
#include <iostream>
#include <optional>

#include "fmt/ostream.h"

#include "utl/enumerate.h"
#include "utl/to_vec.h"

#include "tnsw/client.h"
#include "tnsw/config.h"
#include "tnsw/error.h"
#include "tnsw/journey_summary.h"
#include "tnsw/logging.h"
#include "tnsw/parse_trip.h"
#include "tnsw/product_class.h"
#include "tnsw/realtime_cache.h"
#include "tnsw/retrieve.h"
#include "tnsw/trip_monitor.h"

#include "./flags.h"

namespace fs = std::filesystem;
namespace po = boost::program_options;

namespace tnsw {

namespace {

std::optional<unixtime_t> read_time(po::variables_map const& vm,
                                    char const* name) {
  if (vm.count(name) == 0U) {
    return std::nullopt;
  }
  auto const& s = vm[name].as<std::string>();
  auto const t = parse_timestamp(s);
  if (!t.has_value()) {
    throw configuration_error{"--{}: invalid date time \"{}\"", name, s};
  }
  return t;
}

void print(std::vector<journey_info> const& infos,
           person const fare_type,
           unixtime_t const now) {
  if (infos.empty()) {
    fmt::println("no journeys found");
  }
  for (auto const [i, info] : utl::enumerate(infos)) {
    fmt::println("journey {}:", i);
    std::cout << summarize(info, fare_type, now);
    for (auto const& [p, price] : fare_prices(info.journey_)) {
      fmt::println("  fare {}: {}", to_str(p), price.value_or("-"));
    }
  }
}

int run_configured_trips(config const& c, std::string&& log_lvl) {
  if (set_log_level(c) != 0 ||
      (!log_lvl.empty() && set_log_level(std::move(log_lvl)) != 0)) {
    return 1;
  }

  auto const cl = client{c.api_key_, c.client_settings()};
  auto cache = realtime_cache{
      [&](std::string_view mode) { return cl.fetch_realtime_feed(mode); }};

  auto return_value = 0;
  for (auto const& t : c.trips_) {
    auto monitor = trip_monitor{t.to_query(), cl, cache};
    fmt::println("{} ({} -> {})", t.name_, t.stop_id_, t.destination_stop_id_);
    if (!monitor.refresh()) {
      fmt::println("  unavailable");
      return_value = 1;
      continue;
    }
    print(*monitor.data(), t.get_fare_type(), cl.now_());
  }
  return return_value;
}

}  // namespace

int trip(int ac, char** av) {
  auto config_path = fs::path{};
  auto api_key = std::string{};
  auto log_lvl = std::string{};
  auto q = trip_query{};
  auto fare_type = std::string{"ADULT"};

  auto desc = po::options_description{"Trip Options"};
  add_help_opt(desc);
  add_config_path_opt(desc, config_path);
  add_api_key_opt(desc, api_key);
  add_log_level_opt(desc, log_lvl);
  desc.add_options()  //
      ("origin,o", po::value(&q.origin_), "origin stop id")  //
      ("destination,d", po::value(&q.destination_),
       "destination stop id")  //
      ("num-journeys,n", po::value(&q.num_journeys_)->default_value(1U),
       "number of journeys to request")  //
      ("mode,m", po::value<std::vector<std::string>>()->composing(),
       "only use this mode of transport (repeatable):\n"
       "train, light_rail, bus, coach, ferry, school_bus")  //
      ("exclude-mode,x", po::value<std::vector<std::string>>()->composing(),
       "do not use this mode of transport (repeatable)")  //
      ("depart-at", po::value<std::string>(),
       "ISO 8601 departure time, e.g. 2024-05-01T08:00:00+10:00")  //
      ("arrive-by", po::value<std::string>(), "ISO 8601 arrival time")  //
      ("fare-type,f", po::value(&fare_type)->default_value(fare_type),
       "ADULT, CHILD, SCHOLAR or SENIOR");

  try {
    auto vm = parse_opt(ac, av, desc);
    if (vm.count("help")) {
      std::cout << desc << "\n";
      return 0;
    }

    if (vm.count("config")) {
      return run_configured_trips(config::read(config_path),
                                  std::move(log_lvl));
    }

    if (!log_lvl.empty() && set_log_level(std::move(log_lvl)) != 0) {
      return 1;
    }

    if (api_key.empty()) {
      if (auto const env = std::getenv("TNSW_API_KEY"); env != nullptr) {
        api_key = env;
      }
    }
    if (api_key.empty()) {
      fmt::println(std::cerr, "missing --api-key");
      return 1;
    }

    auto const to_modes = [&](char const* name) {
      return utl::to_vec(
          vm[name].as<std::vector<std::string>>(), [&](std::string const& m) {
            auto const mode = to_mode_of_transport(m);
            if (!mode.has_value()) {
              throw configuration_error{"--{}: unknown mode of transport {}",
                                        name, m};
            }
            return *mode;
          });
    };
    if (vm.count("mode")) {
      q.include_modes_ = to_modes("mode");
    }
    if (vm.count("exclude-mode")) {
      q.exclude_modes_ = to_modes("exclude-mode");
    }
    q.depart_at_ = read_time(vm, "depart-at");
    q.arrive_by_ = read_time(vm, "arrive-by");

    auto const rider = to_person(fare_type);
    if (!rider.has_value()) {
      throw configuration_error{"--fare-type: unknown fare type {}", fare_type};
    }

    auto const cl = client{api_key};
    auto cache = realtime_cache{
        [&](std::string_view mode) { return cl.fetch_realtime_feed(mode); }};
    print(retrieve(cl, cache, q), *rider, cl.now_());
    return 0;
  } catch (upstream_error const& e) {
    fmt::println(std::cerr, "upstream error (status {}): {}", e.status(),
                 e.what());
    return 1;
  } catch (std::exception const& e) {
    fmt::println(std::cerr, "error: {}", e.what());
    return 1;
  }
}

}  // namespace tnsw
