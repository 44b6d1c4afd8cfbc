#pragma once

#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <vector>

#include "geo/geo.h"
#include "util/date.h"

namespace walkplan {

struct PoiId {
  int v;

  bool operator==(const PoiId& other) const { return v == other.v; }
  bool operator<(const PoiId& other) const { return v < other.v; }
};

// A visitable place. Loaded once per request and read-only afterwards.
struct Poi {
  PoiId id;
  std::string name;
  Coordinates location;
  // Lower-case category key ("museum", "park", "cafe", ...).
  std::string category;
  std::set<std::string> tags;
  // 0-5. 0 means "no rating".
  double rating = 0.0;
  // 0 means "unknown", in which case the intensity default applies.
  double avg_visit_minutes = 0.0;
  std::optional<TimeOfDay> open_time;
  std::optional<TimeOfDay> close_time;
  // Weekly expression such as "Mo-Fr 10:00-18:00; Sa-Su 11:00-16:00".
  std::optional<std::string> opening_hours;
  std::vector<float> embedding;
  std::string address;
  std::string description;

  bool HasTag(const std::string& tag) const { return tags.contains(tag); }
};

// Canonical category key: lower-case, spaces and dashes become underscores.
std::string NormalizeCategory(std::string_view category);

// Applies the catalog-boundary normalization to a freshly parsed POI.
void NormalizePoi(Poi& poi);

void to_json(nlohmann::json& j, const Poi& poi);
void from_json(const nlohmann::json& j, Poi& poi);

inline std::ostream& operator<<(std::ostream& os, const PoiId& value) {
  return os << "PoiId{" << value.v << "}";
}

inline std::ostream& operator<<(std::ostream& os, const Poi& value) {
  return os << "Poi{" << value.id.v << ", " << value.name << ", "
            << value.category << ", " << value.location << "}";
}

}  // namespace walkplan

namespace std {
template <>
struct hash<walkplan::PoiId> {
  size_t operator()(const walkplan::PoiId& id) const {
    return hash<int>()(id.v);
  }
};
}  // namespace std
