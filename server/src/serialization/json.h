#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

#include "geo/geo.h"
#include "util/date.h"

namespace nlohmann {

// Optional fields are written as null and read back from null or absence.
template <typename T>
struct adl_serializer<std::optional<T>> {
  static void to_json(json& j, const std::optional<T>& opt) {
    if (opt)
      j = *opt;
    else
      j = nullptr;
  }
  static void from_json(const json& j, std::optional<T>& opt) {
    if (j.is_null())
      opt = std::nullopt;
    else
      opt = j.get<T>();
  }
};

}  // namespace nlohmann

namespace walkplan {

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Coordinates, lat, lon)

inline void to_json(nlohmann::json& j, const TimeOfDay& t) { j = t.ToString(); }

inline void from_json(const nlohmann::json& j, TimeOfDay& t) {
  std::optional<TimeOfDay> parsed = TimeOfDay::Parse(j.get<std::string>());
  if (!parsed) {
    throw std::runtime_error("Invalid time of day: " + j.dump());
  }
  t = *parsed;
}

inline void to_json(nlohmann::json& j, const LocalTime& t) { j = t.ToString(); }

inline void from_json(const nlohmann::json& j, LocalTime& t) {
  std::optional<LocalTime> parsed = LocalTime::Parse(j.get<std::string>());
  if (!parsed) {
    throw std::runtime_error("Invalid local time: " + j.dump());
  }
  t = *parsed;
}

// Reads an optional key, treating absence and null alike.
template <typename T>
std::optional<T> OptionalField(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<T>();
}

}  // namespace walkplan
