#include "util/date.h"

#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace walkplan {

namespace {

using std::chrono::days;
using std::chrono::sys_days;
using std::chrono::sys_seconds;

bool ParseDigits(std::string_view text, size_t pos, size_t len, int& out) {
  if (pos + len > text.size()) {
    return false;
  }
  int value = 0;
  for (size_t i = pos; i < pos + len; ++i) {
    if (text[i] < '0' || text[i] > '9') {
      return false;
    }
    value = value * 10 + (text[i] - '0');
  }
  out = value;
  return true;
}

std::string TwoDigits(int value) {
  return (value < 10 ? "0" : "") + std::to_string(value);
}

sys_days DayOf(int64_t seconds) {
  return std::chrono::floor<days>(sys_seconds{std::chrono::seconds{seconds}});
}

}  // namespace

std::optional<TimeOfDay> TimeOfDay::Parse(std::string_view text) {
  int hours = 0;
  int minutes = 0;
  int secs = 0;
  // Single-digit hours ("9:30") show up in hand-written catalogs.
  size_t colon = text.find(':');
  if (colon == std::string_view::npos || colon == 0 || colon > 2) {
    return std::nullopt;
  }
  if (!ParseDigits(text, 0, colon, hours) ||
      !ParseDigits(text, colon + 1, 2, minutes)) {
    return std::nullopt;
  }
  size_t rest = colon + 3;
  if (rest < text.size()) {
    if (text[rest] != ':' || !ParseDigits(text, rest + 1, 2, secs) ||
        rest + 3 != text.size()) {
      return std::nullopt;
    }
  }
  if (minutes > 59 || secs > 59 || hours > 24 ||
      (hours == 24 && (minutes != 0 || secs != 0))) {
    return std::nullopt;
  }
  return TimeOfDay{hours * 60 + minutes};
}

std::string TimeOfDay::ToString() const {
  int m = minutes == kMinutesPerDay ? minutes : minutes % kMinutesPerDay;
  return TwoDigits(m / 60) + ":" + TwoDigits(m % 60);
}

LocalTime LocalTime::FromCivil(
    int year, unsigned month, unsigned day, int hour, int minute
) {
  std::chrono::year_month_day ymd{
      std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}
  };
  auto base = sys_days{ymd}.time_since_epoch();
  int64_t secs = std::chrono::duration_cast<std::chrono::seconds>(base).count();
  return LocalTime{secs + hour * 3600 + minute * 60};
}

std::optional<LocalTime> LocalTime::Parse(std::string_view text) {
  int year = 0;
  int month = 0;
  int day = 0;
  if (text.size() < 16 || !ParseDigits(text, 0, 4, year) || text[4] != '-' ||
      !ParseDigits(text, 5, 2, month) || text[7] != '-' ||
      !ParseDigits(text, 8, 2, day) || (text[10] != 'T' && text[10] != ' ')) {
    return std::nullopt;
  }
  std::optional<TimeOfDay> time = TimeOfDay::Parse(text.substr(11));
  if (!time || time->minutes >= kMinutesPerDay) {
    return std::nullopt;
  }
  std::chrono::year_month_day ymd{
      std::chrono::year{year},
      std::chrono::month{static_cast<unsigned>(month)},
      std::chrono::day{static_cast<unsigned>(day)}
  };
  if (!ymd.ok()) {
    return std::nullopt;
  }
  LocalTime result = FromCivil(year, month, day, 0, 0);
  result.seconds += time->minutes * 60;
  // Keep the seconds component when present.
  if (text.size() == 19) {
    int secs = 0;
    ParseDigits(text, 17, 2, secs);
    result.seconds += secs;
  }
  return result;
}

LocalTime LocalTime::Now() {
  std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  LocalTime result = FromCivil(
      local.tm_year + 1900,
      static_cast<unsigned>(local.tm_mon + 1),
      static_cast<unsigned>(local.tm_mday),
      local.tm_hour,
      local.tm_min
  );
  result.seconds += local.tm_sec;
  return result;
}

int LocalTime::Weekday() const {
  std::chrono::weekday wd{DayOf(seconds)};
  return static_cast<int>(wd.iso_encoding()) - 1;
}

int LocalTime::MinuteOfDay() const {
  return static_cast<int>((seconds - StartOfDay().seconds) / 60);
}

LocalTime LocalTime::StartOfDay() const {
  auto day_start = DayOf(seconds).time_since_epoch();
  return LocalTime{
      std::chrono::duration_cast<std::chrono::seconds>(day_start).count()
  };
}

LocalTime LocalTime::PlusMinutes(double minutes) const {
  return LocalTime{seconds + static_cast<int64_t>(std::llround(minutes * 60.0))};
}

std::string LocalTime::ToString() const {
  std::chrono::year_month_day ymd{DayOf(seconds)};
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << int(ymd.year()) << "-"
      << std::setw(2) << unsigned(ymd.month()) << "-" << std::setw(2)
      << unsigned(ymd.day()) << "T" << ClockString();
  return oss.str();
}

std::string LocalTime::ClockString() const {
  int m = MinuteOfDay();
  return TwoDigits(m / 60) + ":" + TwoDigits(m % 60);
}

}  // namespace walkplan
