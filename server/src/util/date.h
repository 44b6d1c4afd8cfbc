#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace walkplan {

constexpr int kMinutesPerDay = 24 * 60;

// A time of day in minutes after local midnight. 1440 ("24:00") is allowed so
// that a window can close exactly at midnight.
struct TimeOfDay {
  int minutes;

  // Parses "HH:MM" or "HH:MM:SS". Returns nullopt on malformed input.
  static std::optional<TimeOfDay> Parse(std::string_view text);

  // "HH:MM". Values past midnight are wrapped, except 1440 which prints as
  // "24:00".
  std::string ToString() const;

  bool operator==(const TimeOfDay& other) const {
    return minutes == other.minutes;
  }
  bool operator<(const TimeOfDay& other) const {
    return minutes < other.minutes;
  }
};

// A local wall-clock instant in seconds since 1970-01-01T00:00. There is no
// time zone attached; every instant in a request lives in the city's local
// time.
struct LocalTime {
  int64_t seconds;

  static LocalTime FromCivil(
      int year, unsigned month, unsigned day, int hour, int minute
  );

  // Parses "YYYY-MM-DDTHH:MM" or "YYYY-MM-DDTHH:MM:SS". A space is accepted
  // in place of the 'T'.
  static std::optional<LocalTime> Parse(std::string_view text);

  // Current wall-clock time in the process's local time zone.
  static LocalTime Now();

  // 0 = Monday ... 6 = Sunday.
  int Weekday() const;
  int MinuteOfDay() const;
  int Hour() const { return MinuteOfDay() / 60; }

  LocalTime StartOfDay() const;
  LocalTime PlusMinutes(double minutes) const;
  double MinutesSince(LocalTime earlier) const {
    return static_cast<double>(seconds - earlier.seconds) / 60.0;
  }

  // "YYYY-MM-DDTHH:MM".
  std::string ToString() const;
  // "HH:MM".
  std::string ClockString() const;

  bool operator==(const LocalTime& other) const {
    return seconds == other.seconds;
  }
  bool operator!=(const LocalTime& other) const {
    return seconds != other.seconds;
  }
  bool operator<(const LocalTime& other) const {
    return seconds < other.seconds;
  }
  bool operator<=(const LocalTime& other) const {
    return seconds <= other.seconds;
  }
  bool operator>(const LocalTime& other) const {
    return seconds > other.seconds;
  }
  bool operator>=(const LocalTime& other) const {
    return seconds >= other.seconds;
  }
};

inline LocalTime Later(LocalTime a, LocalTime b) { return a < b ? b : a; }

inline std::ostream& operator<<(std::ostream& os, const TimeOfDay& value) {
  return os << "TimeOfDay{" << value.ToString() << "}";
}

inline std::ostream& operator<<(std::ostream& os, const LocalTime& value) {
  return os << "LocalTime{" << value.ToString() << "}";
}

}  // namespace walkplan
