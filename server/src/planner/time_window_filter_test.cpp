#include "planner/time_window_filter.h"

#include <gtest/gtest.h>

#include <deque>

namespace walkplan {
namespace {

// 2025-06-02 is a Monday.
LocalTime Monday(int hour, int minute = 0) {
  return LocalTime::FromCivil(2025, 6, 2, hour, minute);
}

class TimeWindowFilterTest : public ::testing::Test {
 protected:
  TimeWindowFilterTest() : config_(DefaultPlannerConfig()), resolver_(config_) {}

  Poi& Add(int id, std::string name, std::string category) {
    Poi poi;
    poi.id = PoiId{id};
    poi.name = std::move(name);
    poi.category = std::move(category);
    poi.location = {56.3269, 44.0042};
    pois_.push_back(std::move(poi));
    return pois_.back();
  }

  std::vector<CandidateScore> Ranked(LocalTime arrival) {
    std::vector<CandidateScore> ranked;
    double score = 100.0;
    for (const Poi& poi : pois_) {
      ranked.push_back(CandidateScore{
          .poi = &poi,
          .embedding = 55.0,
          .contextual = 0.0,
          .popularity = 0.0,
          .base = score,
          .diversity_penalty = 0.0,
          .final_score = score,
          .distance_km = 0.2,
          .projected_arrival = arrival,
      });
      score -= 1.0;
    }
    return ranked;
  }

  static std::vector<int> Ids(const std::vector<CandidateScore>& ranked) {
    std::vector<int> ids;
    for (const CandidateScore& c : ranked) {
      ids.push_back(c.poi->id.v);
    }
    return ids;
  }

  PlannerConfig config_;
  OpeningHoursResolver resolver_;
  // Deque keeps pointers stable as POIs are added.
  std::deque<Poi> pois_;
};

TEST_F(TimeWindowFilterTest, CafesAreSkippedBeforeMorningCutoff) {
  Add(1, "Coffee Point", "cafe");
  Add(2, "Kremlin", "architecture");
  EXPECT_TRUE(ExcludedAtStart(pois_[0], Monday(8, 30), config_));
  EXPECT_FALSE(ExcludedAtStart(pois_[0], Monday(9, 0), config_));

  auto filtered = ApplyTimeWindowFilter(Ranked(Monday(8, 30)), Monday(8, 30), resolver_, config_);
  EXPECT_EQ(Ids(filtered), (std::vector<int>{2}));
}

TEST_F(TimeWindowFilterTest, SecludedPlacesAreSkippedAtNight) {
  Add(1, "Quiet alley", "architecture");
  Add(2, "Monument to Minin", "monument");
  EXPECT_TRUE(ExcludedAtStart(pois_[0], Monday(21, 30), config_));
  EXPECT_FALSE(ExcludedAtStart(pois_[1], Monday(21, 30), config_));
  EXPECT_FALSE(ExcludedAtStart(pois_[0], Monday(20, 59), config_));
}

TEST_F(TimeWindowFilterTest, KeepsEverythingWhenAllWouldBeExcluded) {
  Add(1, "Coffee Point", "cafe");
  Add(2, "Brunch Bar", "bar");
  auto filtered = ApplyTimeWindowFilter(Ranked(Monday(7, 0)), Monday(7, 0), resolver_, config_);
  EXPECT_EQ(filtered.size(), 2);
}

TEST_F(TimeWindowFilterTest, ClosedCandidatesMoveToTheBack) {
  Poi& museum = Add(1, "Art Museum", "museum");
  museum.opening_hours = "Mo-Fr 10:00-18:00";
  Add(2, "Embankment", "embankment");
  Poi& gallery = Add(3, "Gallery", "gallery");
  gallery.opening_hours = "Mo-Fr 10:00-18:00";
  Add(4, "Monument", "monument");

  auto filtered = ApplyTimeWindowFilter(Ranked(Monday(19, 0)), Monday(19, 0), resolver_, config_);
  EXPECT_EQ(Ids(filtered), (std::vector<int>{2, 4, 1, 3}));
}

TEST_F(TimeWindowFilterTest, KeywordTextIsLowerCased) {
  Poi& poi = Add(1, "Old PARK", "Green_Space");
  poi.tags = {"Trees"};
  EXPECT_EQ(PoiKeywordText(poi), "old park green_space trees");
}

}  // namespace
}  // namespace walkplan
