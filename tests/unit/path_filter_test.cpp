#include "internal/index/path_filter.hpp"

#include <cassert>
#include <iostream>

namespace {

using framecache::index::ExtensionOf;
using framecache::index::IsIndexableImage;

void TestSupportedExtensionsAnyCase() {
  assert(IsIndexableImage("/pics", "a.jpg"));
  assert(IsIndexableImage("/pics", "a.JPG"));
  assert(IsIndexableImage("/pics", "a.Jpeg"));
  assert(IsIndexableImage("/pics", "a.png"));
  assert(IsIndexableImage("/pics", "a.heic"));
  assert(IsIndexableImage("/pics", "a.HEIF"));

  assert(!IsIndexableImage("/pics", "a.gif"));
  assert(!IsIndexableImage("/pics", "a.txt"));
  assert(!IsIndexableImage("/pics", "jpg"));
  assert(!IsIndexableImage("/pics", "a.jpg.bak"));
}

void TestHiddenAndSidecarFilesAreSkipped() {
  assert(!IsIndexableImage("/pics", ".hidden.jpg"));
  assert(!IsIndexableImage("/pics/.AppleDouble", "a.jpg"));
  assert(!IsIndexableImage("/pics/.AppleDouble/nested", "a.jpg"));
  assert(IsIndexableImage("/pics/AppleDouble", "a.jpg"));
}

void TestExtensionKeepsCase() {
  assert(ExtensionOf("/pics/IMG_0001.JPG") == "JPG");
  assert(ExtensionOf("/pics/holiday.2019.jpeg") == "jpeg");
  assert(ExtensionOf("/pics/noext").empty());
}

} // namespace

int main() {
  TestSupportedExtensionsAnyCase();
  TestHiddenAndSidecarFilesAreSkipped();
  TestExtensionKeepsCase();

  std::cout << "framecache_unit_path_filter: pass\n";
  return 0;
}
