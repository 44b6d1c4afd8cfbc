#include "catalog/poi.h"

#include "serialization/json.h"
#include "util/strings.h"

namespace walkplan {

std::string NormalizeCategory(std::string_view category) {
  std::string result = ToLowerAscii(TrimWhitespace(category));
  for (char& c : result) {
    if (c == ' ' || c == '-') {
      c = '_';
    }
  }
  return result;
}

void NormalizePoi(Poi& poi) {
  poi.category = NormalizeCategory(poi.category);
  std::set<std::string> tags;
  for (const std::string& tag : poi.tags) {
    std::string normalized = ToLowerAscii(TrimWhitespace(tag));
    if (!normalized.empty()) {
      tags.insert(std::move(normalized));
    }
  }
  poi.tags = std::move(tags);
  if (poi.rating < 0) {
    poi.rating = 0;
  }
  if (poi.avg_visit_minutes < 0) {
    poi.avg_visit_minutes = 0;
  }
  if (poi.opening_hours && TrimWhitespace(*poi.opening_hours).empty()) {
    poi.opening_hours = std::nullopt;
  }
}

void to_json(nlohmann::json& j, const Poi& poi) {
  j = nlohmann::json{
      {"id", poi.id.v},
      {"name", poi.name},
      {"lat", poi.location.lat},
      {"lon", poi.location.lon},
      {"category", poi.category},
      {"tags", poi.tags},
      {"rating", poi.rating},
      {"avg_visit_minutes", poi.avg_visit_minutes},
      {"open_time", poi.open_time},
      {"close_time", poi.close_time},
      {"opening_hours", poi.opening_hours},
      {"address", poi.address},
      {"description", poi.description},
  };
  // Embeddings are large and only useful to the scorer.
}

void from_json(const nlohmann::json& j, Poi& poi) {
  poi.id = PoiId{j.at("id").get<int>()};
  poi.name = j.at("name").get<std::string>();
  poi.location = Coordinates{j.at("lat").get<double>(), j.at("lon").get<double>()};
  poi.category = OptionalField<std::string>(j, "category").value_or("");
  poi.tags.clear();
  if (auto it = j.find("tags"); it != j.end() && it->is_array()) {
    for (const auto& tag : *it) {
      poi.tags.insert(tag.get<std::string>());
    }
  }
  poi.rating = OptionalField<double>(j, "rating").value_or(0.0);
  poi.avg_visit_minutes =
      OptionalField<double>(j, "avg_visit_minutes").value_or(0.0);
  poi.open_time = OptionalField<TimeOfDay>(j, "open_time");
  poi.close_time = OptionalField<TimeOfDay>(j, "close_time");
  poi.opening_hours = OptionalField<std::string>(j, "opening_hours");
  poi.embedding =
      OptionalField<std::vector<float>>(j, "embedding").value_or(std::vector<float>{});
  poi.address = OptionalField<std::string>(j, "address").value_or("");
  poi.description =
      OptionalField<std::string>(j, "description").value_or("");
  NormalizePoi(poi);
}

}  // namespace walkplan
