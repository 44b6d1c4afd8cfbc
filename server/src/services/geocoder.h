#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "geo/geo.h"
#include "util/deadline.h"

namespace walkplan {

struct GeocodeResult {
  Coordinates location;
  std::string label;
};

class Geocoder {
 public:
  virtual ~Geocoder() = default;

  // Nullopt when the address is unknown. Throws ExternalServiceUnavailable
  // when the service cannot answer.
  virtual std::optional<GeocodeResult> Resolve(
      std::string_view address, const Deadline& deadline
  ) = 0;

  virtual bool Validate(Coordinates location) const { return IsValidCoordinates(location); }
};

}  // namespace walkplan
