#include "gtest/gtest.h"

#include "tnsw/journey_utils.h"

#include "./util.h"

using namespace tnsw;
using namespace tnsw::test;
using rpc = route_product_class;

TEST(tnsw, gtfs_mode_key) {
  EXPECT_EQ("sydneytrains", gtfs_mode_key(rpc::kTrain));
  EXPECT_EQ("lightrail", gtfs_mode_key(rpc::kLightRail));
  EXPECT_EQ("buses", gtfs_mode_key(rpc::kBus));
  EXPECT_EQ("ferries", gtfs_mode_key(rpc::kFerry));
  EXPECT_FALSE(gtfs_mode_key(rpc::kCoach).has_value());
  EXPECT_FALSE(gtfs_mode_key(rpc::kSchoolBus).has_value());
  EXPECT_FALSE(gtfs_mode_key(rpc::kWalking).has_value());
  EXPECT_FALSE(gtfs_mode_key(rpc::kWalkingFootpath).has_value());
  EXPECT_FALSE(gtfs_mode_key(rpc::kBicycle).has_value());
  EXPECT_FALSE(gtfs_mode_key(rpc::kTakeBicycleOnPublicTransport).has_value());
  EXPECT_FALSE(gtfs_mode_key(rpc::kKissAndRide).has_value());
  EXPECT_FALSE(gtfs_mode_key(rpc::kParkAndRide).has_value());
  EXPECT_FALSE(gtfs_mode_key(rpc::kTaxi).has_value());
  EXPECT_FALSE(gtfs_mode_key(rpc::kCar).has_value());
}

TEST(tnsw, leg_is_walking) {
  EXPECT_TRUE(is_walking(journey_leg{}));
  EXPECT_TRUE(is_walking(walking_leg(rpc::kWalking)));
  EXPECT_TRUE(is_walking(walking_leg(rpc::kWalkingFootpath)));
  EXPECT_FALSE(is_walking(transit_leg(rpc::kBus)));
  EXPECT_FALSE(is_walking(transit_leg(rpc::kBicycle)));
}

TEST(tnsw, first_non_walking_leg) {
  auto const legs = std::vector{walking_leg(), transit_leg(rpc::kBus, "T1"),
                                walking_leg(rpc::kWalkingFootpath),
                                transit_leg(rpc::kTrain, "T2"), walking_leg()};

  auto const fwd = first_non_walking_leg(legs, direction::kForward);
  ASSERT_NE(nullptr, fwd);
  EXPECT_EQ(&legs[1], fwd);

  auto const bwd = first_non_walking_leg(legs, direction::kBackward);
  ASSERT_NE(nullptr, bwd);
  EXPECT_EQ(&legs[3], bwd);

  EXPECT_EQ(1, count_transfers(legs));
}

TEST(tnsw, first_non_walking_leg_single) {
  auto const legs = std::vector{walking_leg(), transit_leg(rpc::kFerry)};
  EXPECT_EQ(&legs[1], first_non_walking_leg(legs, direction::kForward));
  EXPECT_EQ(&legs[1], first_non_walking_leg(legs, direction::kBackward));
  EXPECT_EQ(0, count_transfers(legs));
}

TEST(tnsw, walking_only_itinerary) {
  auto const legs = std::vector{walking_leg(), journey_leg{},
                                walking_leg(rpc::kWalkingFootpath)};
  EXPECT_EQ(nullptr, first_non_walking_leg(legs, direction::kForward));
  EXPECT_EQ(nullptr, first_non_walking_leg(legs, direction::kBackward));
  EXPECT_EQ(-1, count_transfers(legs));
  EXPECT_EQ(-1, count_transfers({}));
}

TEST(tnsw, count_transfers) {
  auto const legs =
      std::vector{transit_leg(rpc::kTrain), walking_leg(),
                  transit_leg(rpc::kLightRail), transit_leg(rpc::kBus),
                  walking_leg()};
  EXPECT_EQ(2, count_transfers(legs));
}

TEST(tnsw, select_ticket) {
  auto const tickets = std::vector<fare_ticket>{
      {.id_ = "a", .person_ = person::kAdult,
       .price_brutto_ = *decimal::parse("4.50")},
      {.id_ = "c1", .person_ = person::kChild,
       .price_brutto_ = *decimal::parse("2.25")},
      {.id_ = "c2", .person_ = person::kChild,
       .price_brutto_ = *decimal::parse("9.99")}};

  auto const adult = select_ticket(tickets, person::kAdult);
  ASSERT_NE(nullptr, adult);
  EXPECT_EQ("a", adult->id_);

  auto const child = select_ticket(tickets, person::kChild);
  ASSERT_NE(nullptr, child);
  EXPECT_EQ("c1", child->id_);

  EXPECT_EQ(nullptr, select_ticket(tickets, person::kSenior));
  EXPECT_EQ(nullptr, select_ticket({}, person::kAdult));
}
