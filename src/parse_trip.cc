#include "tnsw/parse_trip.h"

#include <limits>
#include <sstream>
#include <string>

#include "boost/json.hpp"

#include "date/date.h"

#include "utl/enumerate.h"

#include "tnsw/error.h"
#include "tnsw/product_class.h"

namespace json = boost::json;

namespace tnsw {

namespace {

// Location in the response document, for error messages.
struct path {
  path field(std::string_view key) const {
    return {str_.empty() ? std::string{key} : fmt::format("{}.{}", str_, key)};
  }
  path index(std::size_t const i) const {
    return {fmt::format("{}[{}]", str_, i)};
  }
  std::string str_;
};

json::value const* find(json::object const& o, std::string_view key) {
  auto const it = o.find(key);
  return it == o.end() || it->value().is_null() ? nullptr : &it->value();
}

json::value const& get(json::object const& o,
                       std::string_view key,
                       path const& p) {
  auto const v = find(o, key);
  if (v == nullptr) {
    throw malformed_response{"{}: required field missing",
                             p.field(key).str_};
  }
  return *v;
}

json::object const& as_object(json::value const& v, path const& p) {
  if (!v.is_object()) {
    throw malformed_response{"{}: expected object, got {}", p.str_,
                             json::serialize(v)};
  }
  return v.get_object();
}

json::array const& as_array(json::value const& v, path const& p) {
  if (!v.is_array()) {
    throw malformed_response{"{}: expected array, got {}", p.str_,
                             json::serialize(v)};
  }
  return v.get_array();
}

std::string as_string(json::value const& v, path const& p) {
  if (!v.is_string()) {
    throw malformed_response{"{}: expected string, got {}", p.str_,
                             json::serialize(v)};
  }
  return std::string{v.get_string()};
}

std::int64_t as_int(json::value const& v, path const& p) {
  auto ec = boost::system::error_code{};
  auto const x = v.to_number<std::int64_t>(ec);
  if (ec) {
    throw malformed_response{"{}: expected integer, got {}", p.str_,
                             json::serialize(v)};
  }
  return x;
}

unixtime_t as_time(json::value const& v, path const& p) {
  auto const s = as_string(v, p);
  auto const t = parse_timestamp(s);
  if (!t.has_value()) {
    throw malformed_response{"{}: invalid date time \"{}\"", p.str_, s};
  }
  return *t;
}

decimal as_decimal(json::value const& v, path const& p) {
  auto d = std::optional<decimal>{};
  if (v.is_string()) {
    d = decimal::parse(v.get_string());
  } else if (v.is_int64()) {
    d = decimal{.units_ = v.get_int64()};
  } else if (v.is_uint64() &&
             v.get_uint64() <= static_cast<std::uint64_t>(
                                   std::numeric_limits<std::int64_t>::max())) {
    d = decimal{.units_ = static_cast<std::int64_t>(v.get_uint64())};
  } else if (v.is_double()) {
    d = decimal::from_double(v.get_double());
  }
  if (!d.has_value()) {
    throw malformed_response{"{}: expected decimal number, got {}", p.str_,
                             json::serialize(v)};
  }
  return *d;
}

template <typename T, typename Fn>
std::optional<T> optional_field(json::object const& o,
                                std::string_view key,
                                path const& p,
                                Fn&& fn) {
  auto const v = find(o, key);
  return v == nullptr ? std::nullopt : std::optional<T>{fn(*v, p.field(key))};
}

std::optional<std::string> optional_string(json::object const& o,
                                           std::string_view key,
                                           path const& p) {
  return optional_field<std::string>(o, key, p, as_string);
}

std::optional<std::int64_t> optional_int(json::object const& o,
                                         std::string_view key,
                                         path const& p) {
  return optional_field<std::int64_t>(o, key, p, as_int);
}

std::optional<unixtime_t> optional_time(json::object const& o,
                                        std::string_view key,
                                        path const& p) {
  return optional_field<unixtime_t>(o, key, p, as_time);
}

std::string required_string(json::object const& o,
                            std::string_view key,
                            path const& p) {
  return as_string(get(o, key, p), p.field(key));
}

template <typename T, typename Fn>
std::vector<T> read_array(json::value const& v, path const& p, Fn&& fn) {
  auto ret = std::vector<T>{};
  for (auto const [i, x] : utl::enumerate(as_array(v, p))) {
    ret.emplace_back(fn(x, p.index(i)));
  }
  return ret;
}

stop_info read_info(json::value const& v, path const& p) {
  auto const& o = as_object(v, p);

  auto const priority_str = required_string(o, "priority", p);
  auto const priority = to_info_priority(priority_str);
  if (!priority.has_value()) {
    throw malformed_response{"{}: unknown priority \"{}\"",
                             p.field("priority").str_, priority_str};
  }

  return stop_info{
      .timestamps_ = optional_field<stop_info::timestamps>(
          o, "timestamps", p,
          [](json::value const& ts, path const& ts_path) {
            auto const& ts_obj = as_object(ts, ts_path);
            return stop_info::timestamps{
                .creation_ = as_time(get(ts_obj, "creation", ts_path),
                                     ts_path.field("creation")),
                .last_modification_ =
                    as_time(get(ts_obj, "lastModification", ts_path),
                            ts_path.field("lastModification"))};
          }),
      .priority_ = *priority,
      .id_ = required_string(o, "id", p),
      .version_ = as_int(get(o, "version", p), p.field("version")),
      .url_text_ = optional_string(o, "urlText", p),
      .url_ = optional_string(o, "url", p),
      .content_ = optional_string(o, "content", p),
      .subtitle_ = optional_string(o, "subtitle", p)};
}

leg_stop read_stop(json::value const& v, path const& p) {
  auto const& o = as_object(v, p);
  auto s = leg_stop{
      .id_ = required_string(o, "id", p),
      .name_ = required_string(o, "name", p),
      .disassembled_name_ = optional_string(o, "disassembledName", p),
      .type_ = required_string(o, "type", p),
      .departure_time_estimated_ =
          optional_time(o, "departureTimeEstimated", p),
      .departure_time_planned_ = optional_time(o, "departureTimePlanned", p),
      .arrival_time_estimated_ = optional_time(o, "arrivalTimeEstimated", p),
      .arrival_time_planned_ = optional_time(o, "arrivalTimePlanned", p)};
  if (auto const props = find(o, "properties"); props != nullptr) {
    s.occupancy_ = optional_string(as_object(*props, p.field("properties")),
                                   "occupancy", p.field("properties"));
  }
  return s;
}

route_product read_product(json::value const& v, path const& p) {
  auto const& o = as_object(v, p);
  auto const code = as_int(get(o, "class", p), p.field("class"));
  auto const clasz = to_route_product_class(code);
  if (!clasz.has_value()) {
    throw malformed_response{"{}: unknown product class {}",
                             p.field("class").str_, code};
  }
  return route_product{
      .name_ = required_string(o, "name", p),
      .class_ = *clasz,
      .icon_id_ = as_int(get(o, "iconId", p), p.field("iconId"))};
}

transportation read_transportation(json::value const& v, path const& p) {
  auto const& o = as_object(v, p);
  auto t = transportation{
      .id_ = optional_string(o, "id", p),
      .name_ = optional_string(o, "name", p),
      .disassembled_name_ = optional_string(o, "disassembledName", p),
      .number_ = optional_string(o, "number", p),
      .icon_id_ = optional_int(o, "iconId", p),
      .description_ = optional_string(o, "description", p),
      .product_ = read_product(get(o, "product", p), p.field("product"))};
  if (auto const props = find(o, "properties"); props != nullptr) {
    t.realtime_trip_id_ =
        optional_string(as_object(*props, p.field("properties")),
                        "RealtimeTripId", p.field("properties"));
  }
  return t;
}

journey_leg read_leg(json::value const& v, path const& p) {
  auto const& o = as_object(v, p);
  return journey_leg{
      .duration_ = as_int(get(o, "duration", p), p.field("duration")),
      .distance_ = optional_int(o, "distance", p),
      .is_realtime_controlled_ = optional_field<bool>(
          o, "isRealtimeControlled", p,
          [](json::value const& b, path const& b_path) {
            if (!b.is_bool()) {
              throw malformed_response{"{}: expected bool, got {}",
                                       b_path.str_, json::serialize(b)};
            }
            return b.get_bool();
          }),
      .origin_ = read_stop(get(o, "origin", p), p.field("origin")),
      .destination_ =
          read_stop(get(o, "destination", p), p.field("destination")),
      .transportation_ = optional_field<transportation>(
          o, "transportation", p, read_transportation),
      .infos_ = read_array<stop_info>(get(o, "infos", p), p.field("infos"),
                                      read_info)};
}

fare_ticket read_ticket(json::value const& v, path const& p) {
  auto const& o = as_object(v, p);
  auto const person_str = required_string(o, "person", p);
  auto const rider = to_person(person_str);
  if (!rider.has_value()) {
    throw malformed_response{"{}: unknown person \"{}\"",
                             p.field("person").str_, person_str};
  }
  return fare_ticket{
      .id_ = required_string(o, "id", p),
      .name_ = required_string(o, "name", p),
      .comment_ = required_string(o, "comment", p),
      .person_ = *rider,
      .price_level_ = optional_string(o, "priceLevel", p),
      .price_brutto_ =
          as_decimal(get(o, "priceBrutto", p), p.field("priceBrutto"))};
}

fare read_fare(json::value const& v, path const& p) {
  auto const& o = as_object(v, p);
  return fare{.tickets_ = read_array<fare_ticket>(
                  get(o, "tickets", p), p.field("tickets"), read_ticket),
              .n_zones_ = optional_field<std::size_t>(
                  o, "zones", p, [](json::value const& z, path const& z_path) {
                    return as_array(z, z_path).size();
                  })};
}

journey read_journey(json::value const& v, path const& p) {
  auto const& o = as_object(v, p);
  auto j = journey{
      .rating_ = optional_int(o, "rating", p),
      .is_additional_ = 0,
      .legs_ = read_array<journey_leg>(get(o, "legs", p), p.field("legs"),
                                       read_leg),
      .fare_ = read_fare(get(o, "fare", p), p.field("fare"))};

  auto const& is_additional = get(o, "isAdditional", p);
  j.is_additional_ = is_additional.is_bool()
                         ? (is_additional.get_bool() ? 1 : 0)
                         : as_int(is_additional, p.field("isAdditional"));

  if (j.legs_.empty()) {
    throw malformed_response{"{}: journey without legs", p.field("legs").str_};
  }
  return j;
}

}  // namespace

std::optional<unixtime_t> parse_timestamp(std::string_view s) {
  for (auto const format : {"%FT%T%Ez", "%FT%TZ", "%FT%T%z"}) {
    auto t = unixtime_t{};
    auto ss = std::istringstream{std::string{s}};
    ss >> date::parse(format, t);
    if (!ss.fail() && ss.peek() == std::char_traits<char>::eof()) {
      return t;
    }
  }
  return std::nullopt;
}

trip_response parse_trip_response(std::string_view s) {
  auto ec = boost::system::error_code{};
  auto const doc = json::parse(s, ec);
  if (ec) {
    throw malformed_response{"invalid json: {}", ec.message()};
  }

  auto const root = path{};
  auto const& o = as_object(doc, path{"<root>"});
  return trip_response{
      .version_ = required_string(o, "version", root),
      .journeys_ = read_array<journey>(get(o, "journeys", root),
                                       root.field("journeys"), read_journey)};
}

}  // namespace tnsw
