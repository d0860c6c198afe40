#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <string>
#include <string_view>

namespace framecache::index {

inline constexpr std::array<std::string_view, 5> kSupportedExtensions = {"png", "jpg", "jpeg", "heif", "heic"};

// Directory name macOS writes resource-fork sidecars into on shared volumes.
inline constexpr std::string_view kAppleSidecarDir = ".AppleDouble";

inline std::string ToLower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

// Extension without the leading dot, case preserved ("IMG_0001.JPG" -> "JPG").
inline std::string ExtensionOf(const std::filesystem::path& file) {
  auto ext = file.extension().string();
  if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
  return ext;
}

inline bool IsSupportedExtension(std::string_view extension) {
  const auto lower = ToLower(extension);
  return std::find(kSupportedExtensions.begin(), kSupportedExtensions.end(), lower) != kSupportedExtensions.end();
}

inline bool IsInsideAppleSidecar(const std::filesystem::path& folder) {
  for (const auto& part : folder) {
    if (part == kAppleSidecarDir) return true;
  }
  return false;
}

/*
  Decides whether a directory entry is an indexable image:
  supported extension, not hidden, not under an .AppleDouble folder.
*/
inline bool IsIndexableImage(const std::filesystem::path& folder, const std::filesystem::path& file_name) {
  const auto name = file_name.filename().string();
  if (name.empty() || name.front() == '.') {
    return false;
  }
  if (IsInsideAppleSidecar(folder)) {
    return false;
  }
  return IsSupportedExtension(ExtensionOf(file_name));
}

} // namespace framecache::index
