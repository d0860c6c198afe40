#pragma once

namespace framecache::db::sql {

/*
  Canonical SQL for the image index.

  IMPORTANT:
  Folder rows use INSERT OR IGNORE + UPDATE rather than INSERT OR REPLACE,
  which would delete and re-create the row under a new folder_id and
  cascade away every file below it.
*/

// folders

static constexpr const char* SELECT_FOLDER =
    "SELECT folder_id,name,last_modified FROM folder WHERE name=?;";

static constexpr const char* LIST_FOLDERS =
    "SELECT folder_id,name,last_modified FROM folder;";

static constexpr const char* INSERT_FOLDER_IF_ABSENT =
    "INSERT OR IGNORE INTO folder(name,last_modified) VALUES(?,?);";

static constexpr const char* UPDATE_FOLDER_MODIFIED =
    "UPDATE folder SET last_modified=? WHERE name=?;";

static constexpr const char* DELETE_FOLDER =
    "DELETE FROM folder WHERE folder_id=?;";

// files

static constexpr const char* SELECT_FILE_MODIFIED =
    "SELECT last_modified FROM all_data WHERE fname=?;";

static constexpr const char* UPSERT_FILE =
    "INSERT INTO file(folder_id,basename,extension,last_modified)"
    " VALUES(?,?,?,?)"
    " ON CONFLICT(folder_id,basename,extension) DO UPDATE SET"
    " last_modified=excluded.last_modified;";

static constexpr const char* SELECT_FILE_ID =
    "SELECT file_id FROM file WHERE folder_id=? AND basename=? AND extension=?;";

static constexpr const char* LIST_FILE_PATHS =
    "SELECT file_id,fname FROM all_data;";

static constexpr const char* DELETE_FILE =
    "DELETE FROM file WHERE file_id=?;";

// meta

static constexpr const char* UPSERT_META =
    "INSERT INTO meta(file_id,orientation,capture_time,f_number,exposure_time,iso,"
    "focal_length,make,model,lens,rating,latitude,longitude,width,height)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(file_id) DO UPDATE SET"
    " orientation=excluded.orientation,"
    " capture_time=excluded.capture_time,"
    " f_number=excluded.f_number,"
    " exposure_time=excluded.exposure_time,"
    " iso=excluded.iso,"
    " focal_length=excluded.focal_length,"
    " make=excluded.make,"
    " model=excluded.model,"
    " lens=excluded.lens,"
    " rating=excluded.rating,"
    " latitude=excluded.latitude,"
    " longitude=excluded.longitude,"
    " width=excluded.width,"
    " height=excluded.height;";

// locations

static constexpr const char* SELECT_LOCATION =
    "SELECT description FROM location WHERE latitude=? AND longitude=?;";

static constexpr const char* INSERT_LOCATION =
    "INSERT OR IGNORE INTO location(latitude,longitude,description) VALUES(?,?,?);";

// read view

static constexpr const char* SELECT_IMAGE =
    "SELECT file_id,folder_id,fname,last_modified,"
    "orientation,capture_time,f_number,exposure_time,iso,focal_length,"
    "make,model,lens,rating,latitude,longitude,width,height,"
    "is_portrait,location,has_meta"
    " FROM all_data WHERE file_id=?;";

static constexpr const char* COUNT_IMAGES =
    "SELECT COUNT(*) FROM all_data;";

} // namespace framecache::db::sql
