#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/file_record.hpp"
#include "internal/db/model/folder_record.hpp"
#include "internal/db/model/image_record.hpp"
#include "internal/db/model/location_record.hpp"
#include "internal/db/model/meta_record.hpp"

namespace framecache::db {

// Which ids a selection over the read view yields.
enum class Selection {
  kAll,             // every matching file_id
  kLandscapeOrHole, // file_id for landscape rows, nullopt for portrait rows
  kPortraitOnly,    // only rows with is_portrait = 1
};

/*
  Repository abstraction over the image index.

  CRITICAL GUARANTEES:

  - All reads and writes require a Transaction
  - Reads inside a transaction see its writes
  - Deleting a folder removes its files, deleting a file removes its meta
  - Folder and file upserts never change an existing row's id

  Folder/file/meta writes belong to the cache scheduler's connection;
  location inserts are the only writes issued from the read side.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin(TxMode mode = TxMode::kWrite) = 0;

  // ---------------------------------------------------------------------
  // Folders
  // ---------------------------------------------------------------------

  virtual std::optional<model::FolderRecord> GetFolder(Transaction&, const std::string& name) = 0;

  virtual std::vector<model::FolderRecord> ListFolders(Transaction&) = 0;

  // insert-if-absent followed by an unconditional last_modified update
  virtual Result UpsertFolders(Transaction&, const std::vector<model::FolderRecord>& folders) = 0;

  virtual Result DeleteFolders(Transaction&, const std::vector<int64_t>& folder_ids) = 0;

  // ---------------------------------------------------------------------
  // Files
  // ---------------------------------------------------------------------

  // last_modified of the file stored under this full path, if any
  virtual std::optional<double> GetFileModified(Transaction&, const std::string& full_path) = 0;

  // fills record.file_id with the (possibly pre-existing) row id
  virtual Result UpsertFile(Transaction&, model::FileRecord& record) = 0;

  // (file_id, full path) of every indexed file
  virtual std::vector<std::pair<int64_t, std::string>> ListFilePaths(Transaction&) = 0;

  virtual Result DeleteFiles(Transaction&, const std::vector<int64_t>& file_ids) = 0;

  // ---------------------------------------------------------------------
  // Metadata
  // ---------------------------------------------------------------------

  virtual Result UpsertMeta(Transaction&, const model::MetaRecord& record) = 0;

  // ---------------------------------------------------------------------
  // Geocode cache
  // ---------------------------------------------------------------------

  virtual std::optional<std::string> GetLocation(Transaction&, double latitude, double longitude) = 0;

  // no-op when the coordinate pair is already cached
  virtual Result InsertLocation(Transaction&, const model::LocationRecord& record) = 0;

  // ---------------------------------------------------------------------
  // Read view
  // ---------------------------------------------------------------------

  virtual std::optional<model::ImageRecord> GetImage(Transaction&, int64_t file_id) = 0;

  /*
    Evaluates a validated filter and ordering expression against the
    read view. Both strings are spliced into the statement, so callers
    must have passed them through query::FilterGuard first.
  */
  virtual Result SelectImageIds(Transaction&, const std::string& where_clause, const std::string& order_clause, Selection selection,
                                std::vector<std::optional<int64_t>>* out) = 0;

  virtual int64_t CountImages(Transaction&) = 0;
};

} // namespace framecache::db
