#include "tnsw/config.h"

#include <iostream>

#include "boost/url.hpp"

#include "date/tz.h"

#include "utl/read_file.h"
#include "utl/to_vec.h"

#include "rfl.hpp"
#include "rfl/yaml.hpp"

#include "tnsw/error.h"
#include "tnsw/mode_of_transport.h"
#include "tnsw/product_class.h"

namespace tnsw {

template <rfl::internal::StringLiteral Name>
consteval auto drop_last() {
  return []<size_t... Is>(std::index_sequence<Is...>) {
    return rfl::internal::StringLiteral<Name.arr_.size() - 1>(Name.arr_[Is]...);
  }(std::make_index_sequence<Name.arr_.size() - 2>{});
}

// struct members end with '_', YAML keys don't
struct drop_trailing {
public:
  template <typename StructType>
  static auto process(auto&& named_tuple) {
    auto const handle_one = []<typename FieldType>(FieldType&& f) {
      if constexpr (!rfl::internal::is_rename_v<typename FieldType::Type>) {
        return handle_one_field(std::move(f));
      } else {
        return std::move(f);
      }
    };
    return named_tuple.transform(handle_one);
  }

private:
  template <typename FieldType>
  static auto handle_one_field(FieldType&& _f) {
    using NewFieldType =
        rfl::Field<drop_last<FieldType::name_>(), typename FieldType::Type>;
    return NewFieldType(_f.value());
  }
};

std::ostream& operator<<(std::ostream& out, config const& c) {
  return out << rfl::yaml::write<drop_trailing>(c);
}

config config::read(std::filesystem::path const& p) {
  auto const file_content = utl::read_file(p.generic_string().c_str());
  if (!file_content.has_value()) {
    throw configuration_error{"could not read config file at {}",
                              p.generic_string()};
  }
  return read(*file_content);
}

config config::read(std::string const& s) {
  auto result =
      rfl::yaml::read<config, drop_trailing, rfl::DefaultIfMissing>(s);
  if (!result) {
    throw configuration_error{"invalid config: {}", result.error()->what()};
  }
  auto c = std::move(*result);
  c.verify();
  return c;
}

void config::verify() const {
  if (api_key_.empty()) {
    throw configuration_error{"api_key is required"};
  }
  if (trips_.empty()) {
    throw configuration_error{"at least one trip is required"};
  }
  if (http_timeout_ == 0U) {
    throw configuration_error{"http_timeout must be positive"};
  }

  try {
    date::locate_zone(timezone_);
  } catch (std::exception const& e) {
    throw configuration_error{"unknown time zone \"{}\": {}", timezone_,
                              e.what()};
  }

  for (auto const& url : {trip_url_, vehicle_pos_url_}) {
    if (auto const parsed = boost::urls::parse_uri(url); !parsed) {
      throw configuration_error{"{} is not a valid url: {}", url,
                                parsed.error().message()};
    }
  }

  for (auto const& t : trips_) {
    if (t.name_.empty() || t.stop_id_.empty() ||
        t.destination_stop_id_.empty()) {
      throw configuration_error{
          "trip requires name, stop_id and destination_stop_id"};
    }
    if (t.num_journeys_ < 1U) {
      throw configuration_error{"trip {}: num_journeys must be at least 1",
                                t.name_};
    }
    if (!to_person(t.fare_type_).has_value()) {
      throw configuration_error{"trip {}: unknown fare_type \"{}\"", t.name_,
                                t.fare_type_};
    }
    if (t.modes_of_transport_.has_value()) {
      for (auto const& m : *t.modes_of_transport_) {
        if (!to_mode_of_transport(m).has_value()) {
          throw configuration_error{"trip {}: unknown mode of transport \"{}\"",
                                    t.name_, m};
        }
      }
    }
  }
}

client::settings config::client_settings() const {
  return client::settings{.trip_url_ = trip_url_,
                          .vehicle_pos_url_ = vehicle_pos_url_,
                          .timeout_ = std::chrono::seconds{http_timeout_},
                          .timezone_ = timezone_};
}

person config::trip::get_fare_type() const {
  auto const p = to_person(fare_type_);
  if (!p.has_value()) {
    throw configuration_error{"unknown fare_type \"{}\"", fare_type_};
  }
  return *p;
}

trip_query config::trip::to_query() const {
  auto q = trip_query{.origin_ = stop_id_,
                      .destination_ = destination_stop_id_,
                      .num_journeys_ = num_journeys_};
  if (modes_of_transport_.has_value()) {
    q.include_modes_ =
        utl::to_vec(*modes_of_transport_, [&](std::string const& m) {
          auto const mode = to_mode_of_transport(m);
          if (!mode.has_value()) {
            throw configuration_error{"trip {}: unknown mode of transport \"{}\"",
                                      name_, m};
          }
          return *mode;
        });
  }
  return q;
}

}  // namespace tnsw
