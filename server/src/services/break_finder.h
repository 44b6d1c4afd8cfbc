#pragma once

#include <string>
#include <vector>

#include "catalog/catalog.h"
#include "geo/geo.h"
#include "util/deadline.h"

namespace walkplan {

// Looks up places suitable for a break (cafés) around a point.
class BreakCandidateFinder {
 public:
  virtual ~BreakCandidateFinder() = default;

  // Candidates within `radius_km`, nearest first. May throw
  // ExternalServiceUnavailable.
  virtual std::vector<Poi> FindNear(
      Coordinates center, double radius_km, const Deadline& deadline
  ) = 0;
};

// Serves break candidates from an in-memory catalog.
class CatalogBreakFinder : public BreakCandidateFinder {
 public:
  CatalogBreakFinder(const InMemoryPoiCatalog& catalog, std::vector<std::string> categories)
      : catalog_(catalog), categories_(std::move(categories)) {}

  std::vector<Poi> FindNear(
      Coordinates center, double radius_km, const Deadline& /*deadline*/
  ) override {
    return catalog_.Near(center, radius_km, categories_);
  }

 private:
  const InMemoryPoiCatalog& catalog_;
  std::vector<std::string> categories_;
};

}  // namespace walkplan
