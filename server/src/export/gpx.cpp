#include "export/gpx.h"

#include <format>
#include <optional>
#include <sstream>

namespace walkplan {

namespace {

void WritePoint(std::ostream& os, std::string_view tag, Coordinates at) {
  os << std::format("<{} lat=\"{:.6f}\" lon=\"{:.6f}\"", tag, at.lat, at.lon);
}

// Appends `leg`'s geometry, skipping a first point that repeats the last
// written one.
void AppendGeometry(std::ostream& os, const Leg& leg, std::optional<Coordinates>& last) {
  for (const Coordinates& point : leg.geometry) {
    if (last && *last == point) {
      continue;
    }
    os << "      ";
    WritePoint(os, "trkpt", point);
    os << "/>\n";
    last = point;
  }
}

}  // namespace

std::string XmlEscape(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      case '\'':
        out += "&apos;";
        break;
      default:
        out += c;
    }
  }
  return out;
}

void WriteGpx(const Itinerary& itinerary, std::ostream& os, std::string_view name) {
  os << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
  os << "<gpx version=\"1.1\" creator=\"walkplan\" "
        "xmlns=\"http://www.topografix.com/GPX/1/1\">\n";
  os << "  <metadata><name>" << XmlEscape(name) << "</name><time>"
     << itinerary.start_time.ToString() << ":00</time></metadata>\n";

  for (const PlannedStop& stop : itinerary.stops) {
    os << "  ";
    WritePoint(os, "wpt", stop.location);
    os << ">\n";
    os << "    <time>" << stop.arrival_time.ToString() << ":00</time>\n";
    os << "    <name>" << XmlEscape(std::format("{}. {}", stop.order, stop.name))
       << "</name>\n";
    std::string desc = std::format(
        "{}-{}, {}", stop.arrival_time.ClockString(), stop.leave_time.ClockString(),
        stop.opening_label
    );
    if (stop.availability_note) {
      desc += ". " + *stop.availability_note;
    }
    os << "    <desc>" << XmlEscape(desc) << "</desc>\n";
    os << "    <type>" << XmlEscape(stop.is_break ? "break" : stop.category) << "</type>\n";
    os << "  </wpt>\n";
  }

  os << "  <trk>\n";
  os << "    <name>" << XmlEscape(name) << "</name>\n";
  os << "    <trkseg>\n";
  std::optional<Coordinates> last;
  if (itinerary.approach_leg) {
    AppendGeometry(os, *itinerary.approach_leg, last);
  }
  for (const Leg& leg : itinerary.legs) {
    AppendGeometry(os, leg, last);
  }
  os << "    </trkseg>\n";
  os << "  </trk>\n";
  os << "</gpx>\n";
}

std::string ItineraryToGpx(const Itinerary& itinerary, std::string_view name) {
  std::ostringstream os;
  WriteGpx(itinerary, os, name);
  return os.str();
}

}  // namespace walkplan
