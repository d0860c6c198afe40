#pragma once

#include <string>

namespace framecache::db::model {

// Cached reverse-geocode answer. Immutable once written.
struct LocationRecord {
  double      latitude  = 0.0;
  double      longitude = 0.0;
  std::string description;
};

} // namespace framecache::db::model
