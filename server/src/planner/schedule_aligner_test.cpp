#include "planner/schedule_aligner.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include "planner/test_util/poi_gen.h"

namespace walkplan {
namespace {

// 2025-06-02 is a Monday.
LocalTime Monday(int hour, int minute = 0) {
  return LocalTime::FromCivil(2025, 6, 2, hour, minute);
}

const Coordinates kStart{56.3287, 44.0020};

class ScheduleAlignerTest : public ::testing::Test {
 protected:
  ScheduleAlignerTest()
      : config_(DefaultPlannerConfig()),
        resolver_(config_),
        aligner_(resolver_, distances_, config_.Profile(Intensity::kMedium)) {}

  static Poi Museum() {
    Poi poi;
    poi.id = PoiId{1};
    poi.name = "Art Museum";
    poi.category = "museum";
    poi.location = kStart;
    poi.opening_hours = "Mo-Fr 10:00-18:00";
    return poi;
  }

  PlannerConfig config_;
  OpeningHoursResolver resolver_;
  HaversineDistanceProvider distances_;
  ScheduleAligner aligner_;
};

TEST_F(ScheduleAlignerTest, WaitsForOpening) {
  PlannedStop stop = aligner_.ScheduleVisit(Museum(), 42, Monday(9, 30));
  EXPECT_TRUE(stop.is_open);
  EXPECT_EQ(stop.arrival_time, Monday(10, 0));
  EXPECT_DOUBLE_EQ(stop.wait_minutes, 30);
  EXPECT_DOUBLE_EQ(stop.visit_minutes, 42);
  // Visit plus 6 minutes of medium padding.
  EXPECT_EQ(stop.leave_time, Monday(10, 48));
  EXPECT_EQ(stop.availability_note, "waiting for opening until 10:00");
  EXPECT_EQ(stop.opening_label, "10:00–18:00 (exact)");
}

TEST_F(ScheduleAlignerTest, CutsVisitAtClosing) {
  PlannedStop stop = aligner_.ScheduleVisit(Museum(), 42, Monday(17, 40));
  EXPECT_TRUE(stop.is_open);
  EXPECT_EQ(stop.arrival_time, Monday(17, 40));
  EXPECT_DOUBLE_EQ(stop.visit_minutes, 20);
  EXPECT_EQ(stop.leave_time, Monday(18, 6));
  EXPECT_EQ(stop.availability_note, "closes at 18:00, plan faster");
}

TEST_F(ScheduleAlignerTest, KeepsClosedStopWithNote) {
  PlannedStop stop = aligner_.ScheduleVisit(Museum(), 42, Monday(19, 0));
  EXPECT_FALSE(stop.is_open);
  EXPECT_EQ(stop.arrival_time, Monday(19, 0));
  EXPECT_DOUBLE_EQ(stop.visit_minutes, 42);
  EXPECT_EQ(stop.availability_note, "closed on arrival, opens at 10:00");

  Poi sunday_closed = Museum();
  PlannedStop sunday =
      aligner_.ScheduleVisit(sunday_closed, 42, LocalTime::FromCivil(2025, 6, 8, 12, 0));
  EXPECT_FALSE(sunday.is_open);
  EXPECT_EQ(sunday.availability_note, "closed on this day");
}

TEST_F(ScheduleAlignerTest, OpenAllDayHasNoNote) {
  Poi park;
  park.id = PoiId{2};
  park.name = "Park";
  park.category = "park";
  park.location = kStart;
  PlannedStop stop = aligner_.ScheduleVisit(park, 30, Monday(23, 50));
  EXPECT_TRUE(stop.is_open);
  EXPECT_FALSE(stop.availability_note.has_value());
  EXPECT_DOUBLE_EQ(stop.visit_minutes, 30);
}

TEST_F(ScheduleAlignerTest, AlignsLegsAndOrders) {
  std::vector<Poi> pois(2);
  pois[0].id = PoiId{1};
  pois[0].name = "near";
  pois[0].category = "park";
  pois[0].location = {56.3269, 44.0042};
  pois[1].id = PoiId{2};
  pois[1].name = "far";
  pois[1].category = "park";
  pois[1].location = {56.3255, 43.9895};
  std::vector<SelectedStop> ordered = {{&pois[0], 30}, {&pois[1], 30}};

  TimelineState state = aligner_.Align(kStart, Monday(12, 0), ordered, Deadline::Never());
  ASSERT_EQ(state.stops.size(), 2);
  ASSERT_TRUE(state.approach_leg.has_value());
  ASSERT_EQ(state.legs.size(), 1);
  EXPECT_EQ(state.stops[0].order, 1);
  EXPECT_EQ(state.stops[1].order, 2);
  EXPECT_NEAR(
      state.approach_leg->distance_km, HaversineKm(kStart, pois[0].location), 1e-9
  );
  EXPECT_NEAR(
      state.legs[0].distance_km, HaversineKm(pois[0].location, pois[1].location), 1e-9
  );
  EXPECT_DOUBLE_EQ(state.stops[1].distance_from_previous_km, state.legs[0].distance_km);
  EXPECT_EQ(
      state.stops[0].arrival_time,
      Monday(12, 0).PlusMinutes(state.approach_leg->duration_minutes)
  );
  EXPECT_EQ(state.cursor, state.stops[1].leave_time);
}

TEST_F(ScheduleAlignerTest, LegAfterHookStartsFromNewPosition) {
  std::vector<Poi> pois(2);
  pois[0].id = PoiId{1};
  pois[0].category = "park";
  pois[0].location = {56.3269, 44.0042};
  pois[1].id = PoiId{2};
  pois[1].category = "park";
  pois[1].location = {56.3255, 43.9895};
  std::vector<SelectedStop> ordered = {{&pois[0], 30}, {&pois[1], 30}};
  Coordinates detour{56.3300, 44.0100};

  int calls = 0;
  AfterStopHook hook = [&](TimelineState& state, const Deadline&) {
    if (++calls > 1) {
      return false;
    }
    PlannedStop extra{
        .order = 0,
        .poi_id = PoiId{99},
        .name = "detour",
        .location = detour,
        .category = "coffee_break",
        .address = "",
        .arrival_time = state.cursor,
        .leave_time = state.cursor.PlusMinutes(20),
        .is_break = true,
    };
    state.Append(extra, EstimateLeg(state.position, detour));
    return true;
  };
  TimelineState state =
      aligner_.Align(kStart, Monday(12, 0), ordered, Deadline::Never(), hook);
  ASSERT_EQ(state.stops.size(), 3);
  EXPECT_TRUE(state.stops[1].is_break);
  ASSERT_EQ(state.legs.size(), 2);
  EXPECT_NEAR(state.legs[1].distance_km, HaversineKm(detour, pois[1].location), 1e-9);
}

TEST(PrefetchLegsTest, ChainsFromOrigin) {
  HaversineDistanceProvider distances;
  std::vector<Poi> pois(3);
  pois[0].location = {56.3269, 44.0042};
  pois[1].location = {56.3255, 43.9895};
  pois[2].location = {56.3300, 44.0100};
  std::vector<SelectedStop> ordered = {{&pois[0], 30}, {&pois[1], 30}, {&pois[2], 30}};
  std::vector<Leg> legs = PrefetchLegs(distances, kStart, ordered, Deadline::Never());
  ASSERT_EQ(legs.size(), 3);
  EXPECT_EQ(legs[0].geometry.front(), kStart);
  EXPECT_EQ(legs[1].geometry.front(), pois[0].location);
  EXPECT_EQ(legs[2].geometry.back(), pois[2].location);
}

RC_GTEST_PROP(ScheduleAlignerTest, TimelineNeverGoesBackwards, ()) {
  PlannerConfig config = DefaultPlannerConfig();
  OpeningHoursResolver resolver(config);
  HaversineDistanceProvider distances;
  Intensity intensity = *rc::gen::element(
      Intensity::kRelaxed, Intensity::kMedium, Intensity::kIntense
  );
  ScheduleAligner aligner(resolver, distances, config.Profile(intensity));

  auto pois = *GenPois(*rc::gen::inRange(1, 12));
  std::vector<SelectedStop> ordered;
  for (const Poi& poi : pois) {
    ordered.push_back(SelectedStop{&poi, static_cast<double>(*rc::gen::inRange(20, 90))});
  }
  LocalTime start = Monday(*rc::gen::inRange(0, 24), *rc::gen::inRange(0, 60));

  TimelineState state = aligner.Align(kStart, start, ordered, Deadline::Never());
  RC_ASSERT(state.stops.size() == ordered.size());
  RC_ASSERT(state.legs.size() == ordered.size() - 1);
  LocalTime previous_leave = start;
  for (size_t i = 0; i < state.stops.size(); ++i) {
    const PlannedStop& stop = state.stops[i];
    RC_ASSERT(stop.order == static_cast<int>(i) + 1);
    RC_ASSERT(stop.leave_time >= stop.arrival_time);
    RC_ASSERT(stop.arrival_time >= previous_leave);
    RC_ASSERT(stop.wait_minutes >= 0.0);
    RC_ASSERT(stop.wait_minutes <= config.max_wait_minutes);
    previous_leave = stop.leave_time;
  }
  RC_ASSERT(state.cursor == previous_leave);
}

}  // namespace
}  // namespace walkplan
