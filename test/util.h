#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "date/date.h"

#include "gtfsrt/gtfs-realtime.pb.h"

#include "tnsw/client.h"
#include "tnsw/model.h"

namespace tnsw::test {

using namespace std::string_view_literals;
using namespace std::chrono_literals;

constexpr auto const kApiKey = "secret"sv;
constexpr auto const kTripPath = "/v1/tp/trip"sv;
constexpr auto const kBusesPath = "/v1/gtfs/vehiclepos/buses"sv;

// Two journeys: [footpath, bus 431 (RealtimeTripId T1), walk]
// and a walking-only one.
constexpr auto const kTripJson = R"__(
{
  "version": "10.2.1.42",
  "systemMessages": [],
  "journeys": [
    {
      "rating": 0,
      "isAdditional": false,
      "legs": [
        {
          "duration": 120,
          "distance": 150,
          "isRealtimeControlled": false,
          "origin": {
            "id": "200060",
            "name": "Central Station",
            "type": "stop",
            "departureTimePlanned": "2024-05-01T08:00:00Z"
          },
          "destination": {
            "id": "2000421",
            "name": "Central Station, Stand A",
            "type": "platform",
            "arrivalTimePlanned": "2024-05-01T08:02:00Z"
          },
          "transportation": {
            "product": { "name": "footpath", "class": 100, "iconId": 100 }
          },
          "infos": []
        },
        {
          "duration": 900,
          "isRealtimeControlled": true,
          "origin": {
            "id": "2000421",
            "name": "Central Station, Stand A",
            "disassembledName": "Stand A",
            "type": "platform",
            "departureTimePlanned": "2024-05-01T08:05:00Z",
            "departureTimeEstimated": "2024-05-01T08:07:00Z"
          },
          "destination": {
            "id": "2037161",
            "name": "Glebe Point Rd",
            "type": "platform",
            "arrivalTimePlanned": "2024-05-01T08:20:00Z",
            "arrivalTimeEstimated": "2024-05-01T08:22:00Z",
            "properties": { "occupancy": "MANY_SEATS" }
          },
          "transportation": {
            "id": "nsw:2431: :R:sj2",
            "name": "Sydney Buses Network 431",
            "disassembledName": "431",
            "number": "431",
            "iconId": 1,
            "description": "Central to Glebe Point",
            "product": { "name": "Sydney Buses Network", "class": 5, "iconId": 1 },
            "properties": { "RealtimeTripId": "T1" }
          },
          "infos": [
            {
              "priority": "high",
              "id": "ems-4711",
              "version": 3,
              "urlText": "Stop moved",
              "url": "https://transportnsw.info/alerts/4711",
              "content": "Stop moved 50m north",
              "subtitle": "Stop moved",
              "timestamps": {
                "creation": "2024-04-30T10:00:00Z",
                "lastModification": "2024-04-30T21:00:00+10:00"
              }
            }
          ]
        },
        {
          "duration": 60,
          "origin": {
            "id": "2037161",
            "name": "Glebe Point Rd",
            "type": "platform",
            "departureTimePlanned": "2024-05-01T08:22:00Z"
          },
          "destination": {
            "id": "2037",
            "name": "Glebe",
            "type": "locality",
            "arrivalTimePlanned": "2024-05-01T08:23:00Z"
          },
          "transportation": {
            "product": { "name": "walk", "class": 99, "iconId": 100 }
          },
          "infos": []
        }
      ],
      "fare": {
        "tickets": [
          {
            "id": "ADULT-BUS",
            "name": "Adult",
            "comment": "",
            "person": "ADULT",
            "priceLevel": "2",
            "priceBrutto": 4.5
          },
          {
            "id": "CHILD-BUS",
            "name": "Child/Youth",
            "comment": "",
            "person": "CHILD",
            "priceBrutto": "2.25"
          }
        ],
        "zones": [ { "net": "nsw" } ]
      }
    },
    {
      "isAdditional": 0,
      "legs": [
        {
          "duration": 1800,
          "origin": {
            "id": "200060",
            "name": "Central Station",
            "type": "stop",
            "departureTimePlanned": "2024-05-01T08:00:00Z"
          },
          "destination": {
            "id": "2037",
            "name": "Glebe",
            "type": "locality",
            "arrivalTimePlanned": "2024-05-01T08:30:00Z"
          },
          "infos": []
        }
      ],
      "fare": { "tickets": [] }
    }
  ]
}
)__"sv;

struct vehicle {
  std::string trip_id_;
  float lat_;
  float lng_;
  std::optional<std::string> route_id_{};
  std::optional<std::string> label_{};
  std::optional<float> bearing_{};
  bool deleted_{false};
  bool has_position_{true};
};

transit_realtime::FeedMessage to_feed_msg(std::vector<vehicle> const&,
                                          date::sys_seconds msg_time);

std::string to_feed_bytes(std::vector<vehicle> const&,
                          date::sys_seconds msg_time);

// Serves canned responses by URL path, records every request.
// Unknown paths answer 404.
struct fake_upstream {
  client::get_fn_t get_fn();

  void set(std::string_view path, unsigned status, std::string body);
  std::size_t count(std::string_view path) const;

  std::map<std::string, http_result, std::less<>> responses_;
  std::vector<boost::urls::url> requests_;
  std::vector<headers_t> headers_;
  mutable std::mutex mutex_;
};

// Upstream answering the trip request with kTripJson and the bus feed
// with trip T1 at (-33.8, 151.2).
void serve_default(fake_upstream&);

client make_client(fake_upstream&, metrics_registry* = nullptr);

journey_leg walking_leg(route_product_class = route_product_class::kWalking);

journey_leg transit_leg(route_product_class,
                        std::optional<std::string> realtime_trip_id = {});

}  // namespace tnsw::test
