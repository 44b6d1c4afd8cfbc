#pragma once

#include <rapidcheck.h>

#include <iostream>
#include <vector>

#include "catalog/poi.h"
#include "geo/geo.h"

namespace walkplan {

// Anywhere on the globe.
rc::Gen<Coordinates> GenCoordinates();

// Within roughly 5 km of Nizhny Novgorod's centre.
rc::Gen<Coordinates> GenCityCoordinates();

// A POI near the city centre with a category from a small fixed set, a
// random rating and visit length, and sometimes explicit hours.
rc::Gen<Poi> GenPoi(int id);

// `count` POIs with ids 1..count.
rc::Gen<std::vector<Poi>> GenPois(int count);

// Small fixed set of catalog categories.
const std::vector<std::string>& TestCategories();

void showValue(const Coordinates& c, std::ostream& os);
void showValue(const Poi& poi, std::ostream& os);

}  // namespace walkplan
