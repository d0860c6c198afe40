#pragma once

#include "internal/extract/metadata_extractor.hpp"

namespace framecache::extract {

/*
  MetadataExtractor backed by Exiv2.

  Reads the EXIF block only; pixel size comes from the container
  (Exiv2::Image::pixelWidth/pixelHeight) with the EXIF pixel
  dimension tags as fallback.
*/
class Exiv2Extractor final : public MetadataExtractor {
 public:
  Exiv2Extractor();

  ExtractedMetadata Extract(const std::filesystem::path& path) override;
};

} // namespace framecache::extract
