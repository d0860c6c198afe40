#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace framecache::db::model {

/*
  Per-file image metadata, 1:1 with FileRecord.

  width/height are already corrected for the EXIF orientation;
  latitude/longitude are rounded to 4 decimal places.
*/
struct MetaRecord {
  int64_t file_id = 0;

  int    orientation  = 1;
  double capture_time = 0.0; // seconds since epoch
  double f_number     = 0.0;
  double iso          = 0.0;
  int    width        = 0;
  int    height       = 0;

  std::optional<std::string> exposure_time;
  std::optional<std::string> focal_length;
  std::optional<std::string> make;
  std::optional<std::string> model;
  std::optional<std::string> lens;
  std::optional<int>         rating;
  std::optional<double>      latitude;
  std::optional<double>      longitude;
};

} // namespace framecache::db::model
