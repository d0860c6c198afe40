#pragma once

#include <cstdint>
#include <string>

#include "internal/geo/geocoder.hpp"

namespace framecache::geo {

struct NominatimOptions {
  std::string endpoint = "https://nominatim.openstreetmap.org/reverse";
  std::string user_agent = "framecache";
  std::string language; // Accept-Language, empty = provider default
  uint32_t    timeout_ms = 5000;
};

/*
  Geocoder talking to a Nominatim /reverse endpoint over libcurl.

  Any transport or parse failure is logged and reported as an empty
  answer; the caller does not cache empty answers.
*/
class NominatimGeocoder final : public Geocoder {
 public:
  explicit NominatimGeocoder(NominatimOptions options);
  ~NominatimGeocoder() override;

  NominatimGeocoder(const NominatimGeocoder&)            = delete;
  NominatimGeocoder& operator=(const NominatimGeocoder&) = delete;

  std::string Resolve(double latitude, double longitude) override;

  // Pulls display_name out of a Nominatim JSON reply; empty on error replies.
  static std::string ParseDisplayName(const std::string& json);

 private:
  std::string BuildUrl(double latitude, double longitude) const;

  NominatimOptions options_;
};

} // namespace framecache::geo
