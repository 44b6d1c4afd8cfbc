#pragma once

#include <string>
#include <vector>

#include "catalog/poi.h"
#include "geo/geo.h"

namespace walkplan {

// Source of POIs for a planning request.
class PoiCatalog {
 public:
  virtual ~PoiCatalog() = default;

  // POIs whose category is one of `categories`, or every POI when
  // `categories` is empty.
  virtual std::vector<Poi> Query(const std::vector<std::string>& categories) const = 0;
};

class InMemoryPoiCatalog : public PoiCatalog {
 public:
  explicit InMemoryPoiCatalog(std::vector<Poi> pois);

  std::vector<Poi> Query(const std::vector<std::string>& categories) const override;

  // POIs of the given categories within `radius_km` of `center`, nearest
  // first.
  std::vector<Poi> Near(
      Coordinates center,
      double radius_km,
      const std::vector<std::string>& categories
  ) const;

  const std::vector<Poi>& All() const { return pois_; }

 private:
  std::vector<Poi> pois_;
};

// Loads a catalog from a .csv or .json file, chosen by extension.
std::vector<Poi> PoiCatalogLoad(const std::string& path);

// CSV columns: id, name, lat, lon, category, and optionally tags
// (';'-separated), rating, avg_visit_minutes, open_time, close_time,
// opening_hours, address, description, embedding (space-separated floats).
std::vector<Poi> PoiCsvLoad(const std::string& path);

// A JSON array of POI objects.
std::vector<Poi> PoiJsonLoad(const std::string& path);

}  // namespace walkplan
