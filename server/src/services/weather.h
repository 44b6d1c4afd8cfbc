#pragma once

#include <optional>
#include <string>

#include "geo/geo.h"
#include "util/deadline.h"

namespace walkplan {

struct WeatherSnapshot {
  // Free-form condition text such as "light rain" or "fog".
  std::string condition;
  std::optional<double> temperature_c;
  double precipitation_mm = 0.0;
  double wind_kmh = 0.0;
};

bool IsPrecipitation(const WeatherSnapshot& weather);
bool IsFoggy(const WeatherSnapshot& weather);

// One short advice line for the itinerary notes, if the weather calls for
// it.
std::optional<std::string> WeatherAdvice(const WeatherSnapshot& weather);

class WeatherService {
 public:
  virtual ~WeatherService() = default;

  // Throws ExternalServiceUnavailable when the provider cannot answer.
  virtual WeatherSnapshot Snapshot(Coordinates location, const Deadline& deadline) = 0;
};

// Returns the same snapshot for every location. For tools and tests.
class StaticWeatherService : public WeatherService {
 public:
  explicit StaticWeatherService(WeatherSnapshot snapshot)
      : snapshot_(std::move(snapshot)) {}

  WeatherSnapshot Snapshot(Coordinates, const Deadline&) override { return snapshot_; }

 private:
  WeatherSnapshot snapshot_;
};

}  // namespace walkplan
