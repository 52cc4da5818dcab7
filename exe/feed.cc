#include <cstdlib>
#include <iostream>

#include "date/date.h"

#include "fmt/ostream.h"

#include "tnsw/client.h"
#include "tnsw/error.h"
#include "tnsw/logging.h"
#include "tnsw/realtime_feed.h"

#include "./flags.h"

namespace po = boost::program_options;

namespace tnsw {

int feed(int ac, char** av) {
  auto api_key = std::string{};
  auto log_lvl = std::string{};
  auto mode = std::string{"buses"};
  auto trip_id = std::string{};

  auto desc = po::options_description{"Feed Options"};
  add_help_opt(desc);
  add_api_key_opt(desc, api_key);
  add_log_level_opt(desc, log_lvl);
  desc.add_options()  //
      ("mode,m", po::value(&mode)->default_value(mode),
       "feed: buses, ferries, lightrail or sydneytrains")  //
      ("trip-id,t", po::value(&trip_id),
       "only print the vehicle serving this realtime trip id");

  try {
    auto vm = parse_opt(ac, av, desc);
    if (vm.count("help")) {
      std::cout << desc << "\n";
      return 0;
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

    auto const cl = client{api_key};
    auto const f = cl.fetch_realtime_feed(mode);

    auto const print = [](vehicle_position const& p) {
      fmt::println("{} trip={} route={} vehicle={} pos=({}, {}) bearing={}",
                   p.entity_id_, p.trip_id_, p.route_id_.value_or("-"),
                   p.vehicle_label_.or_else([&]() { return p.vehicle_id_; })
                       .value_or("-"),
                   p.lat_, p.lng_,
                   p.bearing_.has_value() ? fmt::format("{}", *p.bearing_)
                                          : std::string{"-"});
    };

    if (!trip_id.empty()) {
      auto const p = find_realtime_info(f, trip_id);
      if (p == nullptr) {
        fmt::println("trip {} not found in feed {}", trip_id, mode);
        return 1;
      }
      print(*p);
      return 0;
    }

    if (f.timestamp_.has_value()) {
      fmt::println("feed {} at {}", mode, date::format("%FT%TZ", *f.timestamp_));
    }
    for (auto const& p : f.positions_) {
      print(p);
    }
    fmt::println("{} vehicle positions", f.positions_.size());
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
