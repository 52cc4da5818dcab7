#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "tnsw/client.h"
#include "tnsw/model.h"
#include "tnsw/trip_query.h"

namespace tnsw {

struct config {
  friend std::ostream& operator<<(std::ostream&, config const&);
  static config read(std::filesystem::path const&);
  static config read(std::string const&);

  void verify() const;

  client::settings client_settings() const;

  bool operator==(config const&) const = default;

  struct logging {
    bool operator==(logging const&) const = default;
    std::optional<std::string> log_level_{};
  };
  std::optional<logging> logging_{};

  struct trip {
    bool operator==(trip const&) const = default;

    person get_fare_type() const;
    trip_query to_query() const;

    std::string name_;
    std::string stop_id_;
    std::string destination_stop_id_;
    unsigned num_journeys_{1U};
    std::string fare_type_{"ADULT"};
    std::optional<std::vector<std::string>> modes_of_transport_{};
  };

  std::string api_key_;
  std::string timezone_{"Australia/Sydney"};
  unsigned http_timeout_{30U};
  std::string trip_url_{kTripUrl};
  std::string vehicle_pos_url_{kVehiclePosUrl};
  std::vector<trip> trips_{};
};

}  // namespace tnsw
