#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/model/meta_record.hpp"

namespace framecache::db::model {

/*
  One row of the all_data read view.

  meta is empty when the file has been enumerated but its
  metadata was never extracted (or extraction failed).
*/
struct ImageRecord {
  int64_t     file_id   = 0;
  int64_t     folder_id = 0;
  std::string fname; // full path
  double      last_modified = 0.0;

  std::optional<MetaRecord> meta;

  bool                       is_portrait = false;
  std::optional<std::string> location;

  bool HasCoordinates() const {
    return meta && meta->latitude && meta->longitude;
  }
};

} // namespace framecache::db::model
