#include "internal/extract/exiv2_extractor.hpp"

#include <exiv2/exiv2.hpp>

#include <cmath>
#include <mutex>

#include "internal/observability/logging.hpp"

namespace framecache::extract {

namespace {

std::optional<std::string> FindString(const Exiv2::ExifData& exif, const char* key) {
  auto it = exif.findKey(Exiv2::ExifKey(key));
  if (it == exif.end()) return std::nullopt;
  auto value = it->toString();
  // cameras pad ASCII tags with trailing NULs and spaces
  while (!value.empty() && (value.back() == '\0' || value.back() == ' ')) value.pop_back();
  if (value.empty()) return std::nullopt;
  return value;
}

std::optional<double> FindRational(const Exiv2::ExifData& exif, const char* key) {
  auto it = exif.findKey(Exiv2::ExifKey(key));
  if (it == exif.end() || it->count() == 0) return std::nullopt;
  auto r = it->toRational();
  if (r.second == 0) return std::nullopt;
  return static_cast<double>(r.first) / r.second;
}

std::optional<int64_t> FindInt(const Exiv2::ExifData& exif, const char* key) {
  auto it = exif.findKey(Exiv2::ExifKey(key));
  if (it == exif.end() || it->count() == 0) return std::nullopt;
  return it->toInt64();
}

// degrees/minutes/seconds rationals plus N/S or E/W reference
std::optional<double> FindCoordinate(const Exiv2::ExifData& exif, const char* key, const char* ref_key, char negative_ref) {
  auto it = exif.findKey(Exiv2::ExifKey(key));
  if (it == exif.end() || it->count() < 3) return std::nullopt;

  double value   = 0.0;
  double divisor = 1.0;
  for (size_t i = 0; i < 3; ++i) {
    auto r = it->toRational(i);
    if (r.second == 0) return std::nullopt;
    value += static_cast<double>(r.first) / r.second / divisor;
    divisor *= 60.0;
  }

  auto ref = FindString(exif, ref_key);
  if (ref && !ref->empty() && (*ref)[0] == negative_ref) value = -value;
  if (!std::isfinite(value)) return std::nullopt;
  return value;
}

} // namespace

Exiv2Extractor::Exiv2Extractor() {
  static std::once_flag once;
  std::call_once(once, [] {
    Exiv2::XmpParser::initialize();
    // Exiv2 prints its own warnings to stderr otherwise
    Exiv2::LogMsg::setLevel(Exiv2::LogMsg::mute);
  });
}

ExtractedMetadata Exiv2Extractor::Extract(const std::filesystem::path& path) {
  ExtractedMetadata out;

  Exiv2::Image::UniquePtr image;
  try {
    image = Exiv2::ImageFactory::open(path.string());
    image->readMetadata();
  } catch (const Exiv2::Error& e) {
    FRAMECACHE_LOG_WARN("cannot read image metadata",
                        {observability::StringField("path", path.string()), observability::StringField("error", e.what())});
    return out;
  }

  out.width  = image->pixelWidth();
  out.height = image->pixelHeight();

  const auto& exif = image->exifData();
  if (exif.empty()) {
    return out;
  }

  if (auto orientation = FindInt(exif, "Exif.Image.Orientation")) {
    out.orientation = static_cast<int>(*orientation);
  }
  if (out.width == 0 || out.height == 0) {
    if (auto w = FindInt(exif, "Exif.Photo.PixelXDimension")) out.width = static_cast<int>(*w);
    if (auto h = FindInt(exif, "Exif.Photo.PixelYDimension")) out.height = static_cast<int>(*h);
  }

  out.f_number           = FindRational(exif, "Exif.Photo.FNumber");
  out.make               = FindString(exif, "Exif.Image.Make");
  out.model              = FindString(exif, "Exif.Image.Model");
  out.exposure_time      = FindString(exif, "Exif.Photo.ExposureTime");
  out.focal_length       = FindString(exif, "Exif.Photo.FocalLength");
  out.lens               = FindString(exif, "Exif.Photo.LensModel");
  out.date_time_original = FindString(exif, "Exif.Photo.DateTimeOriginal");

  if (auto iso = FindInt(exif, "Exif.Photo.ISOSpeedRatings")) {
    out.iso = static_cast<double>(*iso);
  }
  if (auto rating = FindInt(exif, "Exif.Image.Rating")) {
    out.rating = static_cast<int>(*rating);
  }

  out.latitude  = FindCoordinate(exif, "Exif.GPSInfo.GPSLatitude", "Exif.GPSInfo.GPSLatitudeRef", 'S');
  out.longitude = FindCoordinate(exif, "Exif.GPSInfo.GPSLongitude", "Exif.GPSInfo.GPSLongitudeRef", 'W');
  if (!out.latitude || !out.longitude) {
    out.latitude.reset();
    out.longitude.reset();
  }

  return out;
}

} // namespace framecache::extract
