#include "catalog/catalog.h"

#include <algorithm>
#include <csv.hpp>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_set>

#include "util/strings.h"

namespace walkplan {

namespace {

std::unordered_set<std::string> NormalizedCategories(
    const std::vector<std::string>& categories
) {
  std::unordered_set<std::string> result;
  for (const std::string& c : categories) {
    result.insert(NormalizeCategory(c));
  }
  return result;
}

std::vector<float> ParseEmbedding(const std::string& text) {
  std::vector<float> values;
  std::istringstream in(text);
  float v;
  while (in >> v) {
    values.push_back(v);
  }
  if (!in.eof()) {
    throw std::runtime_error("Invalid embedding value in '" + text + "'");
  }
  return values;
}

std::optional<TimeOfDay> ParseOptionalTime(const std::string& text) {
  std::string_view trimmed = TrimWhitespace(text);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  std::optional<TimeOfDay> t = TimeOfDay::Parse(trimmed);
  if (!t) {
    throw std::runtime_error("Invalid time of day: " + text);
  }
  return t;
}

// Rows are 1-based data rows (CSV) or array positions (JSON).
void CheckCoordinates(const Poi& poi, size_t row) {
  if (!IsValidCoordinates(poi.location)) {
    throw std::runtime_error(
        "row " + std::to_string(row) + " (id " + std::to_string(poi.id.v) +
        "): invalid coordinates " + std::to_string(poi.location.lat) + ", " +
        std::to_string(poi.location.lon)
    );
  }
}

}  // namespace

InMemoryPoiCatalog::InMemoryPoiCatalog(std::vector<Poi> pois)
    : pois_(std::move(pois)) {}

std::vector<Poi> InMemoryPoiCatalog::Query(
    const std::vector<std::string>& categories
) const {
  if (categories.empty()) {
    return pois_;
  }
  std::unordered_set<std::string> wanted = NormalizedCategories(categories);
  std::vector<Poi> result;
  for (const Poi& poi : pois_) {
    if (wanted.contains(poi.category)) {
      result.push_back(poi);
    }
  }
  return result;
}

std::vector<Poi> InMemoryPoiCatalog::Near(
    Coordinates center,
    double radius_km,
    const std::vector<std::string>& categories
) const {
  std::vector<std::pair<double, const Poi*>> found;
  std::unordered_set<std::string> wanted = NormalizedCategories(categories);
  for (const Poi& poi : pois_) {
    if (!wanted.empty() && !wanted.contains(poi.category)) {
      continue;
    }
    double d = HaversineKm(center, poi.location);
    if (d <= radius_km) {
      found.emplace_back(d, &poi);
    }
  }
  std::stable_sort(found.begin(), found.end(), [](const auto& a, const auto& b) {
    return a.first < b.first;
  });
  std::vector<Poi> result;
  result.reserve(found.size());
  for (const auto& [d, poi] : found) {
    result.push_back(*poi);
  }
  return result;
}

std::vector<Poi> PoiCatalogLoad(const std::string& path) {
  std::string ext = ToLowerAscii(std::filesystem::path(path).extension().string());
  if (ext == ".csv") {
    return PoiCsvLoad(path);
  }
  if (ext == ".json") {
    return PoiJsonLoad(path);
  }
  throw std::runtime_error("Unsupported catalog format: " + path);
}

std::vector<Poi> PoiCsvLoad(const std::string& path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Catalog file does not exist: " + path);
  }
  std::vector<Poi> pois;
  try {
    csv::CSVReader reader(path);
    std::vector<std::string> column_names = reader.get_col_names();
    std::unordered_set<std::string> columns(column_names.begin(), column_names.end());
    for (const char* required : {"id", "name", "lat", "lon", "category"}) {
      if (!columns.contains(required)) {
        throw std::runtime_error(std::string("missing column '") + required + "'");
      }
    }
    auto text = [&columns](csv::CSVRow& row, const char* column) {
      return columns.contains(column) ? row[column].get<std::string>()
                                      : std::string{};
    };

    for (csv::CSVRow& row : reader) {
      Poi& poi = pois.emplace_back();
      size_t row_number = pois.size();
      poi.id = PoiId{row["id"].get<int>()};
      poi.name = row["name"].get<std::string>();
      poi.location = Coordinates{row["lat"].get<double>(), row["lon"].get<double>()};
      CheckCoordinates(poi, row_number);
      poi.category = row["category"].get<std::string>();
      for (std::string& tag : SplitAndTrim(text(row, "tags"), ';')) {
        poi.tags.insert(std::move(tag));
      }
      std::string rating = text(row, "rating");
      poi.rating = TrimWhitespace(rating).empty() ? 0.0 : std::stod(rating);
      std::string visit = text(row, "avg_visit_minutes");
      poi.avg_visit_minutes = TrimWhitespace(visit).empty() ? 0.0 : std::stod(visit);
      poi.open_time = ParseOptionalTime(text(row, "open_time"));
      poi.close_time = ParseOptionalTime(text(row, "close_time"));
      std::string hours = text(row, "opening_hours");
      if (!TrimWhitespace(hours).empty()) {
        poi.opening_hours = std::string(TrimWhitespace(hours));
      }
      poi.address = text(row, "address");
      poi.description = text(row, "description");
      poi.embedding = ParseEmbedding(text(row, "embedding"));
      NormalizePoi(poi);
    }
  } catch (const std::exception& e) {
    throw std::runtime_error(
        "Could not open or parse file: " + path + " - " + e.what()
    );
  }
  return pois;
}

std::vector<Poi> PoiJsonLoad(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw std::runtime_error("Catalog file does not exist: " + path);
  }
  try {
    nlohmann::json j = nlohmann::json::parse(in);
    std::vector<Poi> pois = j.get<std::vector<Poi>>();
    for (size_t i = 0; i < pois.size(); ++i) {
      CheckCoordinates(pois[i], i + 1);
    }
    return pois;
  } catch (const std::exception& e) {
    throw std::runtime_error(
        "Could not open or parse file: " + path + " - " + e.what()
    );
  }
}

}  // namespace walkplan
