#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "catalog/poi.h"
#include "geo/geo.h"
#include "routing/leg.h"
#include "serialization/json.h"
#include "util/date.h"

namespace walkplan {

struct PlannedStop {
  // 1-based, contiguous over the whole itinerary including breaks.
  int order;
  PoiId poi_id;
  std::string name;
  Coordinates location;
  std::string category;
  std::string address;
  // When the visit starts, after any wait for opening.
  LocalTime arrival_time;
  // Visit end plus the transition padding.
  LocalTime leave_time;
  double wait_minutes = 0.0;
  double visit_minutes = 0.0;
  bool is_open = true;
  std::string opening_label;
  std::optional<std::string> availability_note;
  bool is_break = false;
  double distance_from_previous_km = 0.0;
  std::optional<std::string> why;
};

struct Itinerary {
  LocalTime start_time;
  Coordinates start_location;
  std::string start_label;
  std::string intensity;
  std::vector<PlannedStop> stops;
  // Start point to the first stop.
  std::optional<Leg> approach_leg;
  // Between consecutive stops: legs[i] goes from stops[i] to stops[i + 1].
  std::vector<Leg> legs;
  double total_distance_km = 0.0;
  int total_minutes = 0;
  std::string summary;
  std::vector<std::string> warnings;
  std::vector<std::string> notes;
};

inline void to_json(nlohmann::json& j, const PlannedStop& stop) {
  j = nlohmann::json{
      {"order", stop.order},
      {"poi_id", stop.poi_id.v},
      {"name", stop.name},
      {"location", stop.location},
      {"category", stop.category},
      {"address", stop.address},
      {"arrival_time", stop.arrival_time},
      {"leave_time", stop.leave_time},
      {"wait_minutes", stop.wait_minutes},
      {"visit_minutes", stop.visit_minutes},
      {"is_open", stop.is_open},
      {"opening_label", stop.opening_label},
      {"availability_note", stop.availability_note},
      {"is_break", stop.is_break},
      {"distance_from_previous_km", stop.distance_from_previous_km},
      {"why", stop.why},
  };
}

inline void to_json(nlohmann::json& j, const Itinerary& itinerary) {
  j = nlohmann::json{
      {"start_time", itinerary.start_time},
      {"start_location", itinerary.start_location},
      {"start_label", itinerary.start_label},
      {"intensity", itinerary.intensity},
      {"stops", itinerary.stops},
      {"approach_leg", itinerary.approach_leg},
      {"legs", itinerary.legs},
      {"total_distance_km", itinerary.total_distance_km},
      {"total_minutes", itinerary.total_minutes},
      {"summary", itinerary.summary},
      {"warnings", itinerary.warnings},
      {"notes", itinerary.notes},
  };
}

inline std::ostream& operator<<(std::ostream& os, const PlannedStop& value) {
  return os << "PlannedStop{#" << value.order << " " << value.name << ", "
            << value.arrival_time.ClockString() << "-"
            << value.leave_time.ClockString() << (value.is_break ? ", break" : "")
            << (value.is_open ? "" : ", closed") << "}";
}

}  // namespace walkplan
