#pragma once

#include <ostream>
#include <string>
#include <string_view>

#include "planner/itinerary.h"

namespace walkplan {

// Writes `itinerary` as a GPX 1.1 document: one waypoint per stop, in stop
// order, and one track through the approach leg and every following leg.
void WriteGpx(const Itinerary& itinerary, std::ostream& os, std::string_view name = "walk");

std::string ItineraryToGpx(const Itinerary& itinerary, std::string_view name = "walk");

// Escapes &, <, >, " and ' for XML text and attributes.
std::string XmlEscape(std::string_view text);

}  // namespace walkplan
