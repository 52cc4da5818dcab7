#include "gtest/gtest.h"

#include "date/date.h"

#include "tnsw/client.h"
#include "tnsw/error.h"
#include "tnsw/metrics_registry.h"

#include "./util.h"

using namespace date;
using namespace std::chrono_literals;
using namespace tnsw;
using namespace tnsw::test;

namespace {

trip_query query() {
  return trip_query{.origin_ = "200060", .destination_ = "2037"};
}

}  // namespace

TEST(tnsw, client_query_trip) {
  auto upstream = fake_upstream{};
  serve_default(upstream);
  auto metrics = metrics_registry{};
  auto const c = make_client(upstream, &metrics);

  auto const res = c.query_trip(query());
  EXPECT_EQ(2U, res.journeys_.size());

  ASSERT_EQ(1U, upstream.requests_.size());
  auto const& url = upstream.requests_[0];
  EXPECT_EQ("https", url.scheme());
  EXPECT_EQ("api.transport.nsw.gov.au", url.host());
  EXPECT_EQ(kTripPath, std::string_view{url.encoded_path()});
  EXPECT_TRUE(url.params().contains("name_origin"));

  ASSERT_EQ(1U, upstream.headers_.size());
  EXPECT_EQ((headers_t{{"Authorization", "apikey secret"}}),
            upstream.headers_[0]);

  EXPECT_EQ(1.0, metrics.trip_requests_.Value());
  EXPECT_EQ(0.0, metrics.trip_request_errors_.Value());
}

TEST(tnsw, client_rejects_invalid_query_offline) {
  auto upstream = fake_upstream{};
  serve_default(upstream);
  auto const c = make_client(upstream);

  auto q = query();
  q.depart_at_ = sys_days{2024_y / May / 1};
  q.arrive_by_ = sys_days{2024_y / May / 1} + 1h;
  EXPECT_THROW(c.query_trip(q), configuration_error);

  q = query();
  q.include_modes_ = {mode_of_transport::kTrain};
  q.exclude_modes_ = {mode_of_transport::kBus};
  EXPECT_THROW(c.query_trip(q), configuration_error);

  EXPECT_TRUE(upstream.requests_.empty());
}

TEST(tnsw, client_upstream_status) {
  auto upstream = fake_upstream{};
  upstream.set(kTripPath, 503U, "Service Unavailable");
  auto metrics = metrics_registry{};
  auto const c = make_client(upstream, &metrics);

  try {
    c.query_trip(query());
    FAIL() << "expected upstream_error";
  } catch (upstream_error const& e) {
    EXPECT_EQ(503U, e.status());
  }
  EXPECT_EQ(1.0, metrics.trip_request_errors_.Value());

  upstream.set(kTripPath, 401U, R"({"ErrorDetails": {"Message": "bad key"}})");
  try {
    c.query_trip(query());
    FAIL() << "expected upstream_error";
  } catch (upstream_error const& e) {
    EXPECT_EQ(401U, e.status());
  }

  // no feed configured -> 404
  try {
    c.fetch_realtime_feed("ferries");
    FAIL() << "expected upstream_error";
  } catch (upstream_error const& e) {
    EXPECT_EQ(404U, e.status());
  }
  EXPECT_EQ(1.0, metrics.realtime_fetch_errors_.Value());
}

TEST(tnsw, client_transport_failure) {
  auto const c =
      client{std::string{kApiKey}, client::settings{},
             [](boost::urls::url const&, headers_t const&,
                std::chrono::seconds) -> http_result {
               throw upstream_error{0U, "connection refused"};
             }};
  try {
    c.query_trip(query());
    FAIL() << "expected upstream_error";
  } catch (upstream_error const& e) {
    EXPECT_EQ(0U, e.status());
  }
}

TEST(tnsw, client_malformed_body) {
  auto upstream = fake_upstream{};
  upstream.set(kTripPath, 200U, R"({"version": "10.2.1.42"})");
  upstream.set(kBusesPath, 200U, "<html></html>");
  auto const c = make_client(upstream);

  EXPECT_THROW(c.query_trip(query()), malformed_response);
  EXPECT_THROW(c.fetch_realtime_feed("buses"), malformed_response);
}

TEST(tnsw, client_fetch_realtime_feed) {
  auto upstream = fake_upstream{};
  serve_default(upstream);
  auto metrics = metrics_registry{};
  auto const c = make_client(upstream, &metrics);

  auto const feed = c.fetch_realtime_feed("buses");
  EXPECT_EQ(2U, feed.positions_.size());
  EXPECT_NE(nullptr, find_realtime_info(feed, "T1"));
  EXPECT_EQ(1U, upstream.count(kBusesPath));
  EXPECT_EQ("apikey secret", upstream.headers_.at(0).at("Authorization"));
  EXPECT_EQ(1.0, metrics.realtime_fetches("buses").Value());
  EXPECT_EQ(0.0, metrics.realtime_fetches("ferries").Value());
}

TEST(tnsw, client_vehicle_pos_url) {
  auto upstream = fake_upstream{};
  auto const with_slash = make_client(upstream);
  EXPECT_EQ(
      "https://api.transport.nsw.gov.au/v1/gtfs/vehiclepos/sydneytrains",
      std::string_view{with_slash.vehicle_pos_url("sydneytrains").buffer()});

  auto const without_slash =
      client{"key", client::settings{.vehicle_pos_url_ = "http://localhost/vp"},
             upstream.get_fn()};
  EXPECT_EQ("http://localhost/vp/lightrail",
            std::string_view{without_slash.vehicle_pos_url("lightrail").buffer()});
}

TEST(tnsw, client_unknown_time_zone) {
  EXPECT_THROW(client("key", client::settings{.timezone_ = "Mars/Olympus"}),
               configuration_error);
}

TEST(tnsw, client_invalid_urls) {
  EXPECT_THROW(client("key", client::settings{.trip_url_ = "::not a url"}),
               configuration_error);
  EXPECT_THROW(
      client("key", client::settings{.vehicle_pos_url_ = "https://a b/"}),
      configuration_error);
  EXPECT_NO_THROW(client("key", client::settings{}));
}
