#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace framecache::extract {

/*
  Raw values read from one image file.

  Nothing here is normalised yet: width/height are as stored in the
  file (not orientation-corrected), GPS is unrounded and the capture
  time is the EXIF DateTimeOriginal string if present.
*/
struct ExtractedMetadata {
  int orientation = 1;
  int width       = 0;
  int height      = 0;

  std::optional<double>      f_number;
  std::optional<std::string> make;
  std::optional<std::string> model;
  std::optional<std::string> exposure_time;
  std::optional<double>      iso;
  std::optional<std::string> focal_length;
  std::optional<int>         rating;
  std::optional<std::string> lens;
  std::optional<std::string> date_time_original;

  std::optional<double> latitude;
  std::optional<double> longitude;
};

/*
  Metadata extraction capability.

  Implementations should report unreadable fields as absent rather
  than fail; an exception is still tolerated and isolated to the one
  file by the metadata updater.
*/
class MetadataExtractor {
 public:
  virtual ~MetadataExtractor() = default;

  virtual ExtractedMetadata Extract(const std::filesystem::path& path) = 0;
};

} // namespace framecache::extract
