#include "routing/osrm_client.h"

#include <gtest/gtest.h>

#include "util/retry.h"

namespace walkplan {
namespace {

nlohmann::json TwoStepResponse() {
  return nlohmann::json::parse(R"({
    "code": "Ok",
    "routes": [{
      "distance": 260.5,
      "duration": 210.0,
      "legs": [{
        "distance": 260.5,
        "duration": 210.0,
        "steps": [
          {
            "distance": 180.0, "duration": 150.0, "name": "Bolshaya Pokrovskaya",
            "geometry": {"coordinates": [[44.0020, 56.3287], [44.0030, 56.3280], [44.0035, 56.3275]]},
            "maneuver": {"type": "depart", "location": [44.0020, 56.3287]}
          },
          {
            "distance": 80.5, "duration": 60.0, "name": "",
            "geometry": {"coordinates": [[44.0035, 56.3275], [44.0042, 56.3269]]},
            "maneuver": {"type": "turn", "modifier": "left", "location": [44.0035, 56.3275]}
          }
        ]
      }]
    }]
  })");
}

TEST(OsrmRoutePathTest, FormatsLonLatPairs) {
  EXPECT_EQ(
      OsrmRoutePath("foot", {{56.3287, 44.002}, {56.3269, 44.0042}}),
      "/route/v1/foot/44.002000,56.328700;44.004200,56.326900"
      "?steps=true&geometries=geojson&overview=false"
  );
}

TEST(ParseOsrmRouteResponseTest, ConvertsUnitsAndGeometry) {
  std::vector<Leg> legs = ParseOsrmRouteResponse(TwoStepResponse(), 1);

  ASSERT_EQ(legs.size(), 1);
  const Leg& leg = legs[0];
  EXPECT_DOUBLE_EQ(leg.distance_km, 0.2605);
  EXPECT_DOUBLE_EQ(leg.duration_minutes, 3.5);
  EXPECT_EQ(leg.source, LegSource::kRouted);
  // The shared boundary point appears once.
  ASSERT_EQ(leg.geometry.size(), 4);
  EXPECT_EQ(leg.geometry.front(), (Coordinates{56.3287, 44.0020}));
  EXPECT_EQ(leg.geometry.back(), (Coordinates{56.3269, 44.0042}));
  ASSERT_EQ(leg.maneuvers.size(), 2);
  EXPECT_EQ(leg.maneuvers[0].type, "depart");
  EXPECT_EQ(leg.maneuvers[0].street_name, "Bolshaya Pokrovskaya");
  EXPECT_EQ(leg.maneuvers[1].modifier, "left");
  EXPECT_DOUBLE_EQ(leg.maneuvers[1].distance_m, 80.5);
}

TEST(ParseOsrmRouteResponseTest, NoRouteIsPermanent) {
  nlohmann::json response = {{"code", "NoRoute"}, {"message", "Impossible route"}};
  EXPECT_THROW(ParseOsrmRouteResponse(response, 1), PermanentFailure);
}

TEST(ParseOsrmRouteResponseTest, OtherErrorCodesAreTransient) {
  nlohmann::json response = {{"code", "TooBusy"}};
  try {
    ParseOsrmRouteResponse(response, 1);
    FAIL() << "expected an exception";
  } catch (const PermanentFailure&) {
    FAIL() << "TooBusy should be retryable";
  } catch (const std::runtime_error& e) {
    EXPECT_NE(std::string(e.what()).find("TooBusy"), std::string::npos);
  }
}

TEST(ParseOsrmRouteResponseTest, RejectsWrongLegCount) {
  EXPECT_THROW(ParseOsrmRouteResponse(TwoStepResponse(), 2), PermanentFailure);
}

}  // namespace
}  // namespace walkplan
