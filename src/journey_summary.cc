#include "tnsw/journey_summary.h"

#include <ostream>

#include "date/date.h"

#include "tnsw/journey_utils.h"
#include "tnsw/product_class.h"
#include "tnsw/retrieve.h"

namespace tnsw {

std::string format_price(decimal const& d) {
  return d.to_string(kPriceFractionDigits);
}

std::int64_t due_minutes(unixtime_t const departure, unixtime_t const now) {
  if (departure <= now) {
    return 0;
  }
  return std::chrono::floor<std::chrono::minutes>(departure - now).count();
}

journey_summary summarize(journey_info const& info,
                          person const fare_type,
                          unixtime_t const now) {
  auto const& j = info.journey_;
  auto s = journey_summary{.changes_ = count_transfers(j.legs_),
                           .fare_type_ = fare_type,
                           .icon_ = std::string{kDefaultIcon}};

  if (auto const ticket = select_ticket(j.fare_.tickets_, fare_type);
      ticket != nullptr) {
    s.fare_price_ = format_price(ticket->price_brutto_);
  }

  if (info.realtime_.has_value()) {
    s.lat_ = info.realtime_->lat_;
    s.lng_ = info.realtime_->lng_;
  }

  auto const origin_leg = first_non_walking_leg(j.legs_, direction::kForward);
  auto const dest_leg = first_non_walking_leg(j.legs_, direction::kBackward);
  if (origin_leg == nullptr || dest_leg == nullptr) {
    return s;
  }

  auto const& origin = origin_leg->origin_;
  auto const& dest = dest_leg->destination_;
  auto const& t = *origin_leg->transportation_;

  s.origin_stop_id_ = origin.id_;
  s.origin_name_ = origin.name_;
  s.destination_stop_id_ = dest.id_;
  s.destination_name_ = dest.name_;
  s.departure_time_estimated_ = origin.departure_time_estimated_;
  s.departure_time_planned_ = origin.departure_time_planned_;
  s.arrival_time_estimated_ = dest.arrival_time_estimated_;
  s.arrival_time_planned_ = dest.arrival_time_planned_;
  if (auto const dep = origin.departure_time_estimated_.has_value()
                           ? origin.departure_time_estimated_
                           : origin.departure_time_planned_;
      dep.has_value()) {
    s.due_ = due_minutes(*dep, now);
  }
  s.origin_transport_type_ = t.product_.class_;
  s.origin_line_name_ = t.number_;
  s.origin_line_name_short_ = t.disassembled_name_;
  s.occupancy_ = origin_leg->destination_.occupancy_;
  s.realtime_trip_id_ = t.realtime_trip_id_;
  s.icon_ = std::string{icon(t.product_.class_)};

  return s;
}

std::array<std::pair<person, std::optional<std::string>>, 4U> fare_prices(
    journey const& j) {
  auto prices = std::array<std::pair<person, std::optional<std::string>>, 4U>{};
  for (auto i = 0U; i != kPersons.size(); ++i) {
    auto const ticket = select_ticket(j.fare_.tickets_, kPersons[i]);
    prices[i] = {kPersons[i],
                 ticket == nullptr
                     ? std::nullopt
                     : std::optional{format_price(ticket->price_brutto_)}};
  }
  return prices;
}

std::ostream& operator<<(std::ostream& out, journey_summary const& s) {
  auto const print = [&](std::string_view label, auto const& x) {
    out << "  " << label << ": ";
    if (x.has_value()) {
      out << *x;
    } else {
      out << "-";
    }
    out << "\n";
  };
  auto const print_time = [&](std::string_view label,
                              std::optional<unixtime_t> const& t) {
    out << "  " << label << ": ";
    if (t.has_value()) {
      out << date::format("%FT%TZ", *t);
    } else {
      out << "-";
    }
    out << "\n";
  };

  print("origin stop", s.origin_stop_id_);
  print("origin", s.origin_name_);
  print("destination stop", s.destination_stop_id_);
  print("destination", s.destination_name_);
  print_time("departure (estimated)", s.departure_time_estimated_);
  print_time("departure (planned)", s.departure_time_planned_);
  print_time("arrival (estimated)", s.arrival_time_estimated_);
  print_time("arrival (planned)", s.arrival_time_planned_);
  print("due [min]", s.due_);
  print("transport type",
        s.origin_transport_type_.has_value()
            ? std::optional{to_str(*s.origin_transport_type_)}
            : std::nullopt);
  print("line", s.origin_line_name_);
  print("line (short)", s.origin_line_name_short_);
  out << "  changes: " << s.changes_ << "\n";
  print("occupancy", s.occupancy_);
  print("realtime trip", s.realtime_trip_id_);
  out << "  fare type: " << to_str(s.fare_type_) << "\n";
  print("fare price", s.fare_price_);
  print("latitude", s.lat_);
  print("longitude", s.lng_);
  out << "  icon: " << s.icon_ << "\n";
  return out;
}

}  // namespace tnsw
