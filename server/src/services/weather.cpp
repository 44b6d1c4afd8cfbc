#include "services/weather.h"

#include "util/strings.h"

namespace walkplan {

bool IsPrecipitation(const WeatherSnapshot& weather) {
  if (weather.precipitation_mm >= 0.2) {
    return true;
  }
  std::string condition = ToLowerAscii(weather.condition);
  return ContainsAny(condition, {"rain", "snow", "drizzle", "sleet", "дожд", "снег"});
}

bool IsFoggy(const WeatherSnapshot& weather) {
  std::string condition = ToLowerAscii(weather.condition);
  return ContainsAny(condition, {"fog", "mist", "туман"});
}

std::optional<std::string> WeatherAdvice(const WeatherSnapshot& weather) {
  if (IsPrecipitation(weather)) {
    return "Rain or snow is expected: take an umbrella, indoor stops come first.";
  }
  if (weather.temperature_c && *weather.temperature_c <= 2.0) {
    return "It is cold outside: dress warmly and plan a warm-up break.";
  }
  if (weather.temperature_c && *weather.temperature_c >= 24.0) {
    return "It is hot: carry water and look for shade between stops.";
  }
  if (IsFoggy(weather)) {
    return "Fog may hide the views from viewpoints.";
  }
  return std::nullopt;
}

}  // namespace walkplan
