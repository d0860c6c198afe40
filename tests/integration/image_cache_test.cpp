#include "internal/core/image_cache.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/factory.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_support.hpp"

namespace {

namespace fs = std::filesystem;

using framecache::core::ImageCache;
using framecache::query::Slot;
using framecache::testing::FakeExtractor;
using framecache::testing::FakeGeocoder;
using framecache::testing::TempDir;
using framecache::testing::Touch;
using framecache::testing::WriteFile;

struct Fixture {
  explicit Fixture(const std::string& name, bool portrait_pairs = false, bool fast_first_scan = false,
                   std::shared_ptr<FakeGeocoder> geo = std::make_shared<FakeGeocoder>())
      : dir(name), pictures(dir.Path() / "pictures"), extractor(std::make_shared<FakeExtractor>()), geocoder(std::move(geo)) {
    fs::create_directories(pictures);

    auto config = framecache::testing::MakeConfig(pictures, dir.Path() / "index.db3");
    config.mutable_library()->set_portrait_pairs(portrait_pairs);
    config.mutable_scheduler()->set_fast_first_scan(fast_first_scan);

    cache = framecache::factory::Build(config, {extractor, geocoder});
  }

  // id of the file stored under pictures/<relative>
  int64_t IdOf(const std::string& relative) {
    const auto slots = cache->Query("fname = '" + (pictures / relative).string() + "'", "");
    assert(slots.size() == 1 && slots[0].size() == 1);
    return slots[0][0];
  }

  std::vector<Slot> All() {
    return cache->Query("", "capture_time ASC");
  }

  TempDir                        dir;
  fs::path                       pictures;
  std::shared_ptr<FakeExtractor> extractor;
  std::shared_ptr<FakeGeocoder>  geocoder;
  std::shared_ptr<ImageCache>    cache;
};

void TestSecondCycleIsIdempotent() {
  Fixture f("idempotent");
  f.extractor->Landscape("a.jpg", "2019:01:01 10:00:00");
  WriteFile(f.pictures / "a.jpg");
  WriteFile(f.pictures / "b.PNG");

  const auto first = f.cache->UpdateCache();
  assert(first.modified_folders == 1);
  assert(first.modified_files == 2);
  assert(first.meta_written == 2);
  assert(f.extractor->Calls() == 2);

  const auto before = f.cache->GetFileInfo(f.IdOf("a.jpg"));

  const auto second = f.cache->UpdateCache();
  assert(!second.Changed());
  assert(second.modified_folders == 0 && second.modified_files == 0 && second.meta_written == 0);
  assert(f.extractor->Calls() == 2);

  const auto after = f.cache->GetFileInfo(f.IdOf("a.jpg"));
  assert(after.file_id == before.file_id && after.last_modified == before.last_modified);
  assert(after.meta->capture_time == before.meta->capture_time);
}

void TestAddedFileIsQueryable() {
  Fixture f("addition");
  f.extractor->Landscape("old.jpg", "2019:01:01 10:00:00");
  f.extractor->Landscape("new.jpg", "2021:06:01 10:00:00");
  WriteFile(f.pictures / "old.jpg");
  f.cache->UpdateCache();

  WriteFile(f.pictures / "new.jpg");
  Touch(f.pictures);
  const auto report = f.cache->UpdateCache();
  assert(report.modified_folders == 1);
  assert(report.modified_files == 1);

  const auto slots = f.cache->Query("true", "capture_time asc");
  assert((slots == std::vector<Slot>{{f.IdOf("old.jpg")}, {f.IdOf("new.jpg")}}));
}

void TestDeletedFileIsPurged() {
  Fixture f("deletion");
  WriteFile(f.pictures / "keep.jpg");
  WriteFile(f.pictures / "drop.jpg");
  f.cache->UpdateCache();

  const auto keep = f.IdOf("keep.jpg");
  const auto drop = f.IdOf("drop.jpg");

  fs::remove(f.pictures / "drop.jpg");
  const auto report = f.cache->UpdateCache();
  assert(report.purged_files == 1);
  assert(report.purged_folders == 0);

  bool not_found = false;
  try {
    (void)f.cache->GetFileInfo(drop);
  } catch (const framecache::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);
  assert(f.cache->GetFileInfo(keep).meta);
  assert(f.All().size() == 1);
}

void TestRemovedFolderCascades() {
  Fixture f("cascade");
  WriteFile(f.pictures / "keep.jpg");
  WriteFile(f.pictures / "trip" / "one.jpg");
  WriteFile(f.pictures / "trip" / "two.jpg");
  WriteFile(f.pictures / "trip" / "deeper" / "three.jpg");
  const auto first = f.cache->UpdateCache();
  assert(first.modified_folders == 3);
  assert(first.modified_files == 4);

  const auto keep = f.IdOf("keep.jpg");

  fs::remove_all(f.pictures / "trip");
  const auto report = f.cache->UpdateCache();
  assert(report.purged_folders == 2);
  assert(report.purged_files == 0);

  assert((f.All() == std::vector<Slot>{{keep}}));
  assert(f.cache->Status().images == 1);
}

void TestPortraitPairs() {
  Fixture f("pairing", /*portrait_pairs=*/true);
  f.extractor->Landscape("a.jpg", "2020:01:01 10:00:00");
  f.extractor->Portrait("b.jpg", "2020:01:02 10:00:00");
  f.extractor->Portrait("c.jpg", "2020:01:03 10:00:00");
  f.extractor->Landscape("d.jpg", "2020:01:04 10:00:00");
  for (const auto* name : {"a.jpg", "b.jpg", "c.jpg", "d.jpg"}) WriteFile(f.pictures / name);
  f.cache->UpdateCache();

  const auto a = f.IdOf("a.jpg");
  const auto b = f.IdOf("b.jpg");
  const auto c = f.IdOf("c.jpg");
  const auto d = f.IdOf("d.jpg");

  assert((f.All() == std::vector<Slot>{{a}, {b, c}, {d}}));
  assert((f.cache->Query("", "capture_time DESC") == std::vector<Slot>{{d}, {c, b}, {a}}));

  // a positional ORDER BY would give the two passes different orders
  for (const auto* sort : {"1", "1 DESC", "capture_time, 2"}) {
    bool threw = false;
    try {
      (void)f.cache->Query("", sort);
    } catch (const framecache::util::InvalidArgument&) {
      threw = true;
    }
    assert(threw);
  }

  // only portraits left: [B, C, D] -> [[B, C], [D]]
  f.extractor->Portrait("d.jpg", "2020:01:04 10:00:00");
  Touch(f.pictures / "d.jpg");
  Touch(f.pictures);
  f.cache->UpdateCache();
  assert((f.cache->Query("is_portrait", "capture_time ASC") == std::vector<Slot>{{b, c}, {d}}));

  f.cache->SetPortraitPairs(false);
  assert((f.All() == std::vector<Slot>{{a}, {b}, {c}, {d}}));
}

void TestGeocodeResultIsCached() {
  Fixture f("geocode");
  framecache::extract::ExtractedMetadata gps;
  gps.latitude  = 51.50123456;
  gps.longitude = -0.12783210;
  f.extractor->Set("gps.jpg", gps);

  framecache::extract::ExtractedMetadata near = gps;
  near.latitude  = 51.50124;
  near.longitude = -0.12779;
  f.extractor->Set("near.jpg", near);

  WriteFile(f.pictures / "gps.jpg");
  WriteFile(f.pictures / "near.jpg");
  WriteFile(f.pictures / "plain.jpg");
  f.cache->UpdateCache();

  const auto id    = f.IdOf("gps.jpg");
  const auto first = f.cache->GetFileInfo(id);
  assert(*first.meta->latitude == 51.5012);
  assert(*first.meta->longitude == -0.1278);
  assert(first.location == "Westminster, London");
  assert(f.geocoder->Calls() == 1);
  assert(f.geocoder->LastLatitude() == 51.5012 && f.geocoder->LastLongitude() == -0.1278);

  const auto second = f.cache->GetFileInfo(id);
  assert(second.location == "Westminster, London");
  assert(f.geocoder->Calls() == 1);

  // a different reading rounding onto the same pair reuses the row
  assert(f.cache->GetFileInfo(f.IdOf("near.jpg")).location == "Westminster, London");
  assert(f.geocoder->Calls() == 1);

  // no coordinates: geocoder not consulted
  assert(!f.cache->GetFileInfo(f.IdOf("plain.jpg")).location);
  assert(f.geocoder->Calls() == 1);

  // the description is queryable through the view
  assert(f.cache->Query("location LIKE '%London%'", "").size() == 2);
}

void TestEmptyGeocodeIsRetried() {
  Fixture f("geocode_empty", false, false, std::make_shared<FakeGeocoder>(""));
  framecache::extract::ExtractedMetadata gps;
  gps.latitude  = -33.8568;
  gps.longitude = 151.2153;
  f.extractor->Set("gps.jpg", gps);
  WriteFile(f.pictures / "gps.jpg");
  f.cache->UpdateCache();

  const auto id = f.IdOf("gps.jpg");
  assert(!f.cache->GetFileInfo(id).location);
  assert(!f.cache->GetFileInfo(id).location);
  assert(f.geocoder->Calls() == 2);
}

void TestExtractionFailureIsIsolated() {
  Fixture f("extract_failure");
  f.extractor->Fail("broken.jpg");
  f.extractor->Landscape("fine.jpg", "2018:05:05 05:05:05");
  WriteFile(f.pictures / "broken.jpg");
  WriteFile(f.pictures / "fine.jpg");

  const auto report = f.cache->UpdateCache();
  assert(report.modified_files == 2);
  assert(report.meta_written == 1);
  assert(report.meta_failed == 1);

  assert(f.cache->GetFileInfo(f.IdOf("fine.jpg")).meta);
  const auto broken = f.cache->GetFileInfo(f.IdOf("broken.jpg"));
  assert(!broken.meta && !broken.is_portrait);
  assert(f.cache->Query("has_meta = 0", "").size() == 1);
}

void TestOnlySupportedImagesAreIndexed() {
  Fixture f("filtering");
  WriteFile(f.pictures / "photo.JPEG");
  WriteFile(f.pictures / "photo.heic");
  WriteFile(f.pictures / "notes.txt");
  WriteFile(f.pictures / "anim.gif");
  WriteFile(f.pictures / ".hidden.jpg");
  WriteFile(f.pictures / ".AppleDouble" / "photo.jpg");
  fs::create_directories(f.pictures / "folder.jpg");

  const auto report = f.cache->UpdateCache();
  assert(report.modified_files == 2);
  assert(f.All().size() == 2);
}

void TestChangedFileIsReextracted() {
  Fixture f("changed_file");
  f.extractor->Landscape("a.jpg", "2019:01:01 10:00:00");
  WriteFile(f.pictures / "a.jpg");
  f.cache->UpdateCache();
  const auto id = f.IdOf("a.jpg");
  assert(!f.cache->GetFileInfo(id).is_portrait);

  f.extractor->Portrait("a.jpg", "2019:01:01 10:00:00");
  Touch(f.pictures / "a.jpg");
  Touch(f.pictures);
  const auto report = f.cache->UpdateCache();
  assert(report.modified_files == 1 && report.meta_written == 1);

  const auto info = f.cache->GetFileInfo(id);
  assert(info.file_id == id);
  assert(info.is_portrait);
}

void TestFastFirstScanStopsEarly() {
  Fixture f("fast_first", false, /*fast_first_scan=*/true);
  WriteFile(f.pictures / "a" / "one.jpg");
  WriteFile(f.pictures / "b" / "two.jpg");

  // the root is out of date first and holds no images itself
  const auto first = f.cache->UpdateCache();
  assert(first.modified_folders == 1);
  assert(first.modified_files == 0);

  const auto second = f.cache->UpdateCache();
  assert(second.modified_folders == 2);
  assert(second.modified_files == 2);
  assert(f.All().size() == 2);
}

void TestQueryExpressionsAreValidated() {
  Fixture f("query_validation");
  WriteFile(f.pictures / "a.jpg");
  f.cache->UpdateCache();

  auto rejected = [&](const std::string& filter, const std::string& sort) {
    try {
      (void)f.cache->Query(filter, sort);
    } catch (const framecache::util::InvalidArgument&) {
      return true;
    }
    return false;
  };

  assert(rejected("1; DELETE FROM file", ""));
  assert(rejected("rating >", ""));
  assert(rejected("", "capture_time; DROP TABLE meta"));
  assert(!rejected("rating IS NULL", "fname DESC"));
  assert(f.cache->Status().images == 1);
}

} // namespace

int main() {
  TestSecondCycleIsIdempotent();
  TestAddedFileIsQueryable();
  TestDeletedFileIsPurged();
  TestRemovedFolderCascades();
  TestPortraitPairs();
  TestGeocodeResultIsCached();
  TestEmptyGeocodeIsRetried();
  TestExtractionFailureIsIsolated();
  TestOnlySupportedImagesAreIndexed();
  TestChangedFileIsReextracted();
  TestFastFirstScanStopsEarly();
  TestQueryExpressionsAreValidated();

  std::cout << "framecache_integration_image_cache: pass\n";
  return 0;
}
