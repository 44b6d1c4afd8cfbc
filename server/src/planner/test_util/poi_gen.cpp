#include "planner/test_util/poi_gen.h"

namespace walkplan {

namespace {

constexpr double kCentreLat = 56.3269;
constexpr double kCentreLon = 44.0059;

// Generates a double in [lo, hi] with 1e-6 resolution.
rc::Gen<double> GenScaled(double lo, double hi) {
  int steps = static_cast<int>((hi - lo) * 1e6);
  return rc::gen::map(rc::gen::inRange(0, steps + 1), [lo](int step) {
    return lo + step * 1e-6;
  });
}

}  // namespace

const std::vector<std::string>& TestCategories() {
  static const std::vector<std::string> kCategories = {
      "museum", "park", "embankment", "architecture", "memorial", "art_object", "cafe"
  };
  return kCategories;
}

rc::Gen<Coordinates> GenCoordinates() {
  return rc::gen::apply(
      [](double lat, double lon) { return Coordinates{lat, lon}; },
      GenScaled(-89.0, 89.0),
      GenScaled(-179.0, 179.0)
  );
}

rc::Gen<Coordinates> GenCityCoordinates() {
  return rc::gen::apply(
      [](double dlat, double dlon) {
        return Coordinates{kCentreLat + dlat, kCentreLon + dlon};
      },
      GenScaled(-0.045, 0.045),
      GenScaled(-0.08, 0.08)
  );
}

rc::Gen<Poi> GenPoi(int id) {
  return rc::gen::apply(
      [id](Coordinates location, std::string category, int rating_tenths,
           int visit, bool explicit_hours) {
        Poi poi;
        poi.id = PoiId{id};
        poi.name = category + " #" + std::to_string(id);
        poi.location = location;
        poi.category = category;
        poi.rating = rating_tenths / 10.0;
        poi.avg_visit_minutes = visit;
        if (explicit_hours) {
          poi.open_time = TimeOfDay{9 * 60};
          poi.close_time = TimeOfDay{20 * 60};
        }
        return poi;
      },
      GenCityCoordinates(),
      rc::gen::elementOf(TestCategories()),
      rc::gen::inRange(0, 51),
      rc::gen::inRange(0, 121),
      rc::gen::arbitrary<bool>()
  );
}

rc::Gen<std::vector<Poi>> GenPois(int count) {
  std::vector<rc::Gen<Poi>> gens;
  for (int i = 1; i <= count; ++i) {
    gens.push_back(GenPoi(i));
  }
  return rc::gen::exec([gens]() {
    std::vector<Poi> pois;
    for (const rc::Gen<Poi>& gen : gens) {
      pois.push_back(*gen);
    }
    return pois;
  });
}

void showValue(const Coordinates& c, std::ostream& os) { os << c; }

void showValue(const Poi& poi, std::ostream& os) { os << poi; }

}  // namespace walkplan
