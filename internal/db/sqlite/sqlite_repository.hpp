#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace framecache::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin(TxMode mode) override;

  std::optional<model::FolderRecord> GetFolder(Transaction&, const std::string& name) override;
  std::vector<model::FolderRecord> ListFolders(Transaction&) override;
  Result UpsertFolders(Transaction&, const std::vector<model::FolderRecord>& folders) override;
  Result DeleteFolders(Transaction&, const std::vector<int64_t>& folder_ids) override;

  std::optional<double> GetFileModified(Transaction&, const std::string& full_path) override;
  Result UpsertFile(Transaction&, model::FileRecord& record) override;
  std::vector<std::pair<int64_t, std::string>> ListFilePaths(Transaction&) override;
  Result DeleteFiles(Transaction&, const std::vector<int64_t>& file_ids) override;

  Result UpsertMeta(Transaction&, const model::MetaRecord& record) override;

  std::optional<std::string> GetLocation(Transaction&, double latitude, double longitude) override;
  Result InsertLocation(Transaction&, const model::LocationRecord& record) override;

  std::optional<model::ImageRecord> GetImage(Transaction&, int64_t file_id) override;
  Result SelectImageIds(Transaction&, const std::string& where_clause, const std::string& order_clause,
                        Selection selection, std::vector<std::optional<int64_t>>* out) override;
  int64_t CountImages(Transaction&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
  static Result DeleteByIds(sqlite3* db, const char* sql, const std::vector<int64_t>& ids);
};

}
