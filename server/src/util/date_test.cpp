#include "util/date.h"

#include <gtest/gtest.h>

namespace walkplan {
namespace {

TEST(TimeOfDayTest, ParsesHoursAndMinutes) {
  EXPECT_EQ(TimeOfDay::Parse("10:30"), TimeOfDay{630});
  EXPECT_EQ(TimeOfDay::Parse("9:05"), TimeOfDay{545});
  EXPECT_EQ(TimeOfDay::Parse("18:00:00"), TimeOfDay{1080});
}

TEST(TimeOfDayTest, AcceptsMidnightAsClosingTime) {
  EXPECT_EQ(TimeOfDay::Parse("24:00"), TimeOfDay{kMinutesPerDay});
  EXPECT_EQ(TimeOfDay{kMinutesPerDay}.ToString(), "24:00");
}

TEST(TimeOfDayTest, RejectsMalformedInput) {
  EXPECT_EQ(TimeOfDay::Parse(""), std::nullopt);
  EXPECT_EQ(TimeOfDay::Parse("1030"), std::nullopt);
  EXPECT_EQ(TimeOfDay::Parse("10:60"), std::nullopt);
  EXPECT_EQ(TimeOfDay::Parse("25:00"), std::nullopt);
  EXPECT_EQ(TimeOfDay::Parse("24:30"), std::nullopt);
  EXPECT_EQ(TimeOfDay::Parse("10:00x"), std::nullopt);
}

TEST(TimeOfDayTest, ToStringWrapsPastMidnight) {
  EXPECT_EQ(TimeOfDay{26 * 60 + 15}.ToString(), "02:15");
}

TEST(LocalTimeTest, WeekdayOfKnownDates) {
  // 2024-01-01 was a Monday.
  EXPECT_EQ(LocalTime::FromCivil(2024, 1, 1, 9, 30).Weekday(), 0);
  EXPECT_EQ(LocalTime::FromCivil(2024, 1, 7, 10, 30).Weekday(), 6);
  EXPECT_EQ(LocalTime::FromCivil(2024, 2, 29, 0, 0).Weekday(), 3);
}

TEST(LocalTimeTest, ParseRoundTripsThroughToString) {
  std::optional<LocalTime> t = LocalTime::Parse("2024-03-15T18:45");
  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(t->ToString(), "2024-03-15T18:45");
  EXPECT_EQ(t->ClockString(), "18:45");
  EXPECT_EQ(t->MinuteOfDay(), 18 * 60 + 45);
  EXPECT_EQ(t->Hour(), 18);
}

TEST(LocalTimeTest, ParseAcceptsSpaceSeparatorAndSeconds) {
  std::optional<LocalTime> t = LocalTime::Parse("2024-03-15 18:45:30");
  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(
      t->seconds, LocalTime::FromCivil(2024, 3, 15, 18, 45).seconds + 30
  );
}

TEST(LocalTimeTest, ParseRejectsInvalidDates) {
  EXPECT_EQ(LocalTime::Parse("2025-02-29T10:00"), std::nullopt);
  EXPECT_EQ(LocalTime::Parse("2024-01-01"), std::nullopt);
  EXPECT_EQ(LocalTime::Parse("2024-01-01T24:00"), std::nullopt);
}

TEST(LocalTimeTest, PlusMinutesCrossesMidnight) {
  LocalTime t = LocalTime::FromCivil(2024, 12, 31, 23, 30);
  LocalTime later = t.PlusMinutes(45);
  EXPECT_EQ(later.ToString(), "2025-01-01T00:15");
  EXPECT_EQ(later.Weekday(), 2);
  EXPECT_DOUBLE_EQ(later.MinutesSince(t), 45.0);
}

TEST(LocalTimeTest, PlusMinutesRoundsToSeconds) {
  LocalTime t = LocalTime::FromCivil(2024, 1, 1, 10, 0);
  EXPECT_EQ(t.PlusMinutes(0.5).seconds, t.seconds + 30);
  EXPECT_EQ(t.PlusMinutes(1.0 / 120.0).seconds, t.seconds + 1);
}

TEST(LocalTimeTest, StartOfDay) {
  LocalTime t = LocalTime::FromCivil(2024, 6, 10, 13, 7);
  EXPECT_EQ(t.StartOfDay(), LocalTime::FromCivil(2024, 6, 10, 0, 0));
}

}  // namespace
}  // namespace walkplan
