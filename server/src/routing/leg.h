#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "geo/geo.h"
#include "serialization/json.h"

namespace walkplan {

struct Maneuver {
  // OSRM-style type and modifier, e.g. "turn" / "left".
  std::string type;
  std::string modifier;
  std::string street_name;
  double distance_m;
  double duration_s;
  Coordinates location;

  bool operator==(const Maneuver& other) const = default;
};

enum class LegSource { kRouted, kEstimated };

struct Leg {
  double distance_km;
  double duration_minutes;
  std::vector<Coordinates> geometry;
  std::vector<Maneuver> maneuvers;
  LegSource source;
};

inline std::string_view LegSourceName(LegSource source) {
  return source == LegSource::kRouted ? "routed" : "estimated";
}

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(
    Maneuver, type, modifier, street_name, distance_m, duration_s, location
)

inline void to_json(nlohmann::json& j, const Leg& leg) {
  j = nlohmann::json{
      {"distance_km", leg.distance_km},
      {"duration_minutes", leg.duration_minutes},
      {"geometry", leg.geometry},
      {"maneuvers", leg.maneuvers},
      {"source", LegSourceName(leg.source)},
  };
}

}  // namespace walkplan
