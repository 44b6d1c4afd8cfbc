#include "planner/breaks.h"

#include <gtest/gtest.h>

#include "errors.h"

namespace walkplan {
namespace {

const Coordinates kHere{56.3269, 44.0042};

LocalTime Monday(int hour, int minute = 0) {
  return LocalTime::FromCivil(2025, 6, 2, hour, minute);
}

class FakeBreakFinder : public BreakCandidateFinder {
 public:
  std::vector<Poi> FindNear(Coordinates, double radius_km, const Deadline&) override {
    ++calls;
    last_radius_km = radius_km;
    if (fail) {
      throw ExternalServiceUnavailable("cafés", "timeout");
    }
    return cafes;
  }

  std::vector<Poi> cafes;
  bool fail = false;
  int calls = 0;
  double last_radius_km = 0.0;
};

Poi Cafe(int id, std::string name, Coordinates location, std::set<std::string> tags = {}) {
  Poi poi;
  poi.id = PoiId{id};
  poi.name = std::move(name);
  poi.category = "cafe";
  poi.location = location;
  poi.tags = std::move(tags);
  return poi;
}

class BreakInserterTest : public ::testing::Test {
 protected:
  BreakInserterTest()
      : config_(DefaultPlannerConfig()),
        resolver_(config_),
        medium_(config_.Profile(Intensity::kMedium)) {}

  // One stop visited from 10:00, leaving at `leave`.
  TimelineState StateLeavingAt(LocalTime leave) {
    TimelineState state{
        .start_time = Monday(10, 0),
        .cursor = Monday(10, 0),
        .position = kHere,
        .last_break = Monday(10, 0),
    };
    PlannedStop stop{
        .order = 0,
        .poi_id = PoiId{1},
        .name = "Museum",
        .location = kHere,
        .category = "museum",
        .address = "",
        .arrival_time = Monday(10, 0),
        .leave_time = leave,
    };
    state.Append(stop, EstimateLeg(kHere, kHere));
    return state;
  }

  BreakInserter Inserter(BreakPreferences preferences = {}, LocalTime end = Monday(14, 0)) {
    return BreakInserter(
        &finder_, distances_, resolver_, medium_, std::move(preferences), end,
        CollectingLogger(log_)
    );
  }

  PlannerConfig config_;
  OpeningHoursResolver resolver_;
  IntensityProfile medium_;
  HaversineDistanceProvider distances_;
  FakeBreakFinder finder_;
  std::vector<std::string> log_;
};

TEST_F(BreakInserterTest, RecommendedInterval) {
  const IntensityProfile& intense = config_.Profile(Intensity::kIntense);
  EXPECT_EQ(RecommendedBreakInterval(medium_, std::nullopt), 90);
  EXPECT_EQ(RecommendedBreakInterval(intense, std::nullopt), 100);
  EXPECT_EQ(RecommendedBreakInterval(medium_, BreakPreferences{.interval_minutes = 60}), 90);
  EXPECT_EQ(RecommendedBreakInterval(medium_, BreakPreferences{.interval_minutes = 120}), 120);
  EXPECT_EQ(RecommendedBreakInterval(medium_, BreakPreferences{.interval_minutes = 10}), 90);
  BreakPreferences off{.enabled = false, .interval_minutes = 150};
  EXPECT_EQ(RecommendedBreakInterval(medium_, off), 90);
}

TEST_F(BreakInserterTest, EstimateBreakMinutes) {
  BreakPreferences on;
  EXPECT_DOUBLE_EQ(EstimateBreakMinutes(240, medium_, std::nullopt), 0.0);
  EXPECT_DOUBLE_EQ(EstimateBreakMinutes(240, medium_, BreakPreferences{.enabled = false}), 0.0);
  // Shorter than three quarters of the interval.
  EXPECT_DOUBLE_EQ(EstimateBreakMinutes(60, medium_, on), 0.0);
  // 90 min: one break of max(18, min(35, 28.1)) = 28, raised to the medium
  // minimum visit of 30.
  EXPECT_DOUBLE_EQ(EstimateBreakMinutes(90, medium_, on), 30.0);
  // 240 min: 2 full intervals plus a 60 min remainder, capped at 240/105+1.
  EXPECT_DOUBLE_EQ(EstimateBreakMinutes(240, medium_, on), 90.0);
}

TEST_F(BreakInserterTest, InsertsBreakAfterInterval) {
  finder_.cafes = {Cafe(10, "Coffee Point", {56.3272, 44.0050})};
  TimelineState state = StateLeavingAt(Monday(11, 35));
  BreakInserter inserter = Inserter();
  ASSERT_EQ(inserter.interval_minutes(), 90);

  EXPECT_TRUE(inserter.MaybeInsert(state, Deadline::Never()));
  ASSERT_EQ(state.stops.size(), 2);
  const PlannedStop& coffee = state.stops.back();
  EXPECT_TRUE(coffee.is_break);
  EXPECT_EQ(coffee.category, "coffee_break");
  EXPECT_EQ(coffee.order, 2);
  EXPECT_GE(coffee.arrival_time, Monday(11, 35));
  EXPECT_EQ(coffee.leave_time, coffee.arrival_time.PlusMinutes(30 + 6));
  EXPECT_EQ(state.last_break, coffee.leave_time);
  EXPECT_DOUBLE_EQ(state.cursor.MinutesSince(state.last_break), 0.0);
  EXPECT_EQ(state.position, coffee.location);
  EXPECT_EQ(state.legs.size(), 1);
  EXPECT_EQ(inserter.inserted_count(), 1);
  EXPECT_DOUBLE_EQ(finder_.last_radius_km, 0.5);
}

TEST_F(BreakInserterTest, WaitsForTheInterval) {
  finder_.cafes = {Cafe(10, "Coffee Point", {56.3272, 44.0050})};
  TimelineState state = StateLeavingAt(Monday(11, 20));
  BreakInserter inserter = Inserter();
  EXPECT_FALSE(inserter.MaybeInsert(state, Deadline::Never()));
  EXPECT_EQ(state.stops.size(), 1);
  EXPECT_EQ(finder_.calls, 0);
}

TEST_F(BreakInserterTest, LookupFailureIsSkipped) {
  finder_.fail = true;
  TimelineState state = StateLeavingAt(Monday(11, 35));
  BreakInserter inserter = Inserter();
  EXPECT_FALSE(inserter.MaybeInsert(state, Deadline::Never()));
  EXPECT_EQ(state.stops.size(), 1);
  ASSERT_EQ(log_.size(), 1);
  EXPECT_NE(log_[0].find("timeout"), std::string::npos);
}

TEST_F(BreakInserterTest, NoCafeNearby) {
  TimelineState state = StateLeavingAt(Monday(11, 35));
  BreakInserter inserter = Inserter();
  EXPECT_FALSE(inserter.MaybeInsert(state, Deadline::Never()));
  EXPECT_EQ(state.last_break, Monday(10, 0));
}

TEST_F(BreakInserterTest, SkipsBreakPastTheBudget) {
  finder_.cafes = {Cafe(10, "Coffee Point", {56.3272, 44.0050})};
  TimelineState state = StateLeavingAt(Monday(11, 35));
  BreakInserter inserter = Inserter({}, Monday(12, 0));
  EXPECT_FALSE(inserter.MaybeInsert(state, Deadline::Never()));
  EXPECT_EQ(state.stops.size(), 1);
}

TEST_F(BreakInserterTest, PrefersCuisineAndSkipsVisited) {
  finder_.cafes = {
      Cafe(1, "Already visited", kHere),
      Cafe(10, "Coffee Point", {56.3272, 44.0050}),
      Cafe(11, "Tea House", {56.3275, 44.0052}, {"tea"}),
  };
  TimelineState state = StateLeavingAt(Monday(11, 35));
  BreakInserter inserter = Inserter(BreakPreferences{.cuisine = "Tea"});
  ASSERT_TRUE(inserter.MaybeInsert(state, Deadline::Never()));
  EXPECT_EQ(state.stops.back().name, "Tea House");
}

TEST_F(BreakInserterTest, DisabledPreferences) {
  finder_.cafes = {Cafe(10, "Coffee Point", {56.3272, 44.0050})};
  TimelineState state = StateLeavingAt(Monday(12, 0));
  BreakInserter inserter = Inserter(BreakPreferences{.enabled = false});
  EXPECT_FALSE(inserter.MaybeInsert(state, Deadline::Never()));
}

}  // namespace
}  // namespace walkplan
