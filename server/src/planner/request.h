#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "geo/geo.h"
#include "planner/breaks.h"
#include "serialization/json.h"

namespace walkplan {

// A request that cannot be planned as given (missing start, bad hours).
class InvalidRequest : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

constexpr double kMaxWalkHours = 12.0;

struct PlanRequest {
  // Either coordinates or an address to geocode.
  std::optional<Coordinates> start_location;
  std::optional<std::string> start_address;
  double hours = 3.0;
  std::string intensity = "medium";
  std::optional<std::string> social_mode;
  // Free text compared against POI embeddings.
  std::string interests;
  // Catalog categories to draw from. Empty means all.
  std::vector<std::string> categories;
  // "HH:MM" or "YYYY-MM-DDTHH:MM". Unset means now.
  std::optional<std::string> start_time;
  // Unset means no breaks.
  std::optional<BreakPreferences> breaks;
};

// Throws InvalidRequest when the request cannot be planned.
inline void ValidatePlanRequest(const PlanRequest& request) {
  if (!request.start_location && (!request.start_address || request.start_address->empty())) {
    throw InvalidRequest("either start_location or start_address is required");
  }
  if (!(request.hours > 0.0) || request.hours > kMaxWalkHours) {
    throw InvalidRequest(
        "hours must be in (0, " + std::to_string(static_cast<int>(kMaxWalkHours)) + "]"
    );
  }
  if (request.breaks && request.breaks->interval_minutes &&
      *request.breaks->interval_minutes <= 0) {
    throw InvalidRequest("breaks.interval_minutes must be positive");
  }
}

inline void from_json(const nlohmann::json& j, BreakPreferences& preferences) {
  preferences.enabled = j.value("enabled", true);
  preferences.interval_minutes = OptionalField<int>(j, "interval_minutes");
  preferences.search_radius_km =
      OptionalField<double>(j, "search_radius_km").value_or(0.5);
  preferences.cuisine = OptionalField<std::string>(j, "cuisine");
}

inline void from_json(const nlohmann::json& j, PlanRequest& request) {
  request.start_location = OptionalField<Coordinates>(j, "start_location");
  request.start_address = OptionalField<std::string>(j, "start_address");
  request.hours = OptionalField<double>(j, "hours").value_or(3.0);
  request.intensity = OptionalField<std::string>(j, "intensity").value_or("medium");
  request.social_mode = OptionalField<std::string>(j, "social_mode");
  request.interests = OptionalField<std::string>(j, "interests").value_or("");
  request.categories =
      OptionalField<std::vector<std::string>>(j, "categories").value_or(std::vector<std::string>{});
  request.start_time = OptionalField<std::string>(j, "start_time");
  request.breaks = OptionalField<BreakPreferences>(j, "breaks");
}

}  // namespace walkplan
