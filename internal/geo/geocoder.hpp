#pragma once

#include <cmath>
#include <string>

namespace framecache::geo {

// Decimal places kept for stored coordinates; ~11 m at the equator.
inline constexpr int kCoordinatePrecision = 4;

// Rounds half away from zero, so 51.50125 and 51.50125000001 collapse together.
inline double RoundCoordinate(double value) {
  const double scale = std::pow(10.0, kCoordinatePrecision);
  return std::round(value * scale) / scale;
}

/*
  Reverse geocoding capability.

  Resolve returns a human readable place description, or an empty
  string when the provider has no answer (or could not be reached).
*/
class Geocoder {
 public:
  virtual ~Geocoder() = default;

  virtual std::string Resolve(double latitude, double longitude) = 0;
};

} // namespace framecache::geo
