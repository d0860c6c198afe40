#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/image_cache.hpp"
#include "internal/extract/metadata_extractor.hpp"
#include "internal/geo/geocoder.hpp"

namespace framecache::factory {

/*
  Capabilities the core consumes but does not implement.

  A null geocoder with geocode.enabled set builds the Nominatim
  client from the config; with geocode.enabled unset no geocoder
  is used at all.
*/
struct Capabilities {
  std::shared_ptr<extract::MetadataExtractor> extractor;
  std::shared_ptr<geo::Geocoder>              geocoder;
};

/*
  Build

  Constructs the whole cache from runtime config: opens the writer
  connection (migrating the schema), the read connection, and wires
  the scheduler and query engine. The scheduler is not started.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.

  Throws util::StoreError when the store cannot be opened.
*/
std::shared_ptr<core::ImageCache> Build(const framecache::runtime::config::RuntimeConfig& config, Capabilities capabilities);

} // namespace framecache::factory
