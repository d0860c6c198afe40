#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"

namespace framecache::db::sqlite {

using framecache::db::ErrorCode;
using framecache::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
    if (s) BindText(st, idx, *s);
    else sqlite3_bind_null(st, idx);
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

static void BindOptI32(sqlite3_stmt* st, int idx, const std::optional<int>& v) {
    if (v) BindI32(st, idx, *v);
    else sqlite3_bind_null(st, idx);
}

static void BindDouble(sqlite3_stmt* st, int idx, double v) {
    sqlite3_bind_double(st, idx, v);
}

static void BindOptDouble(sqlite3_stmt* st, int idx, const std::optional<double>& v) {
    if (v) BindDouble(st, idx, *v);
    else sqlite3_bind_null(st, idx);
}

static bool IsNull(sqlite3_stmt* st, int col) {
    return sqlite3_column_type(st, col) == SQLITE_NULL;
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
    if (IsNull(st, col)) return std::nullopt;
    return ColText(st, col);
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

static int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

static std::optional<int> ColOptI32(sqlite3_stmt* st, int col) {
    if (IsNull(st, col)) return std::nullopt;
    return ColI32(st, col);
}

static double ColDouble(sqlite3_stmt* st, int col) {
    return sqlite3_column_double(st, col);
}

static std::optional<double> ColOptDouble(sqlite3_stmt* st, int col) {
    if (IsNull(st, col)) return std::nullopt;
    return ColDouble(st, col);
}

static model::FolderRecord ReadFolder(sqlite3_stmt* st) {
    model::FolderRecord r;
    r.folder_id = ColI64(st, 0);
    r.name = ColText(st, 1);
    r.last_modified = ColDouble(st, 2);
    return r;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin(TxMode mode) {
    return std::make_unique<SqliteTransaction>(db_, mode);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

Result SqliteRepository::DeleteByIds(sqlite3* db, const char* sql, const std::vector<int64_t>& ids) {
    if (ids.empty()) return Result::Ok();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    for (int64_t id : ids) {
        BindI64(st, 1, id);
        int rc = sqlite3_step(st);
        if (rc != SQLITE_DONE) {
            auto result = Translate(db, rc);
            sqlite3_finalize(st);
            return result;
        }
        sqlite3_reset(st);
    }

    sqlite3_finalize(st);
    return Result::Ok();
}

// ------------------------------------------------------------------
// Folders
// ------------------------------------------------------------------

std::optional<model::FolderRecord>
SqliteRepository::GetFolder(Transaction& t, const std::string& name) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::SELECT_FOLDER, -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, name);

    if (sqlite3_step(st) != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadFolder(st);
    sqlite3_finalize(st);
    return r;
}

std::vector<model::FolderRecord> SqliteRepository::ListFolders(Transaction& t) {
    auto* db = TX(t).Handle();

    std::vector<model::FolderRecord> out;
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::LIST_FOLDERS, -1, &st, nullptr) != SQLITE_OK)
        return out;

    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ReadFolder(st));
    }

    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::UpsertFolders(Transaction& t, const std::vector<model::FolderRecord>& folders) {
    auto* db = TX(t).Handle();
    if (folders.empty()) return Result::Ok();

    sqlite3_stmt* insert = nullptr;
    sqlite3_stmt* update = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_FOLDER_IF_ABSENT, -1, &insert, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    if (sqlite3_prepare_v2(db, sql::UPDATE_FOLDER_MODIFIED, -1, &update, nullptr) != SQLITE_OK) {
        sqlite3_finalize(insert);
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }

    Result result = Result::Ok();
    for (const auto& folder : folders) {
        BindText(insert, 1, folder.name);
        BindDouble(insert, 2, folder.last_modified);
        int rc = sqlite3_step(insert);
        sqlite3_reset(insert);
        if (rc != SQLITE_DONE) {
            result = Translate(db, rc);
            break;
        }

        BindDouble(update, 1, folder.last_modified);
        BindText(update, 2, folder.name);
        rc = sqlite3_step(update);
        sqlite3_reset(update);
        if (rc != SQLITE_DONE) {
            result = Translate(db, rc);
            break;
        }
    }

    sqlite3_finalize(insert);
    sqlite3_finalize(update);
    return result;
}

Result SqliteRepository::DeleteFolders(Transaction& t, const std::vector<int64_t>& folder_ids) {
    return DeleteByIds(TX(t).Handle(), sql::DELETE_FOLDER, folder_ids);
}

// ------------------------------------------------------------------
// Files
// ------------------------------------------------------------------

std::optional<double>
SqliteRepository::GetFileModified(Transaction& t, const std::string& full_path) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::SELECT_FILE_MODIFIED, -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, full_path);

    std::optional<double> modified;
    if (sqlite3_step(st) == SQLITE_ROW) {
        modified = ColDouble(st, 0);
    }

    sqlite3_finalize(st);
    return modified;
}

Result SqliteRepository::UpsertFile(Transaction& t, model::FileRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::UPSERT_FILE, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st, 1, r.folder_id);
    BindText(st, 2, r.basename);
    BindText(st, 3, r.extension);
    BindDouble(st, 4, r.last_modified);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE)
        return Translate(db, rc);

    // last_insert_rowid is stale when the conflict branch ran, so look the id up
    if (sqlite3_prepare_v2(db, sql::SELECT_FILE_ID, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st, 1, r.folder_id);
    BindText(st, 2, r.basename);
    BindText(st, 3, r.extension);

    rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        auto result = rc == SQLITE_DONE ? Result::Err(ErrorCode::NotFound, "file row vanished after upsert") : Translate(db, rc);
        sqlite3_finalize(st);
        return result;
    }

    r.file_id = ColI64(st, 0);
    sqlite3_finalize(st);
    return Result::Ok();
}

std::vector<std::pair<int64_t, std::string>> SqliteRepository::ListFilePaths(Transaction& t) {
    auto* db = TX(t).Handle();

    std::vector<std::pair<int64_t, std::string>> out;
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::LIST_FILE_PATHS, -1, &st, nullptr) != SQLITE_OK)
        return out;

    while (sqlite3_step(st) == SQLITE_ROW) {
        out.emplace_back(ColI64(st, 0), ColText(st, 1));
    }

    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::DeleteFiles(Transaction& t, const std::vector<int64_t>& file_ids) {
    return DeleteByIds(TX(t).Handle(), sql::DELETE_FILE, file_ids);
}

// ------------------------------------------------------------------
// Metadata
// ------------------------------------------------------------------

Result SqliteRepository::UpsertMeta(Transaction& t, const model::MetaRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::UPSERT_META, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st, 1, r.file_id);
    BindI32(st, 2, r.orientation);
    BindDouble(st, 3, r.capture_time);
    BindDouble(st, 4, r.f_number);
    BindOptText(st, 5, r.exposure_time);
    BindDouble(st, 6, r.iso);
    BindOptText(st, 7, r.focal_length);
    BindOptText(st, 8, r.make);
    BindOptText(st, 9, r.model);
    BindOptText(st, 10, r.lens);
    BindOptI32(st, 11, r.rating);
    BindOptDouble(st, 12, r.latitude);
    BindOptDouble(st, 13, r.longitude);
    BindI32(st, 14, r.width);
    BindI32(st, 15, r.height);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Geocode cache
// ------------------------------------------------------------------

std::optional<std::string>
SqliteRepository::GetLocation(Transaction& t, double latitude, double longitude) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::SELECT_LOCATION, -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindDouble(st, 1, latitude);
    BindDouble(st, 2, longitude);

    std::optional<std::string> description;
    if (sqlite3_step(st) == SQLITE_ROW) {
        description = ColOptText(st, 0);
    }

    sqlite3_finalize(st);
    return description;
}

Result SqliteRepository::InsertLocation(Transaction& t, const model::LocationRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_LOCATION, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindDouble(st, 1, r.latitude);
    BindDouble(st, 2, r.longitude);
    BindText(st, 3, r.description);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Read view
// ------------------------------------------------------------------

std::optional<model::ImageRecord>
SqliteRepository::GetImage(Transaction& t, int64_t file_id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::SELECT_IMAGE, -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindI64(st, 1, file_id);

    if (sqlite3_step(st) != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    model::ImageRecord r;
    r.file_id = ColI64(st, 0);
    r.folder_id = ColI64(st, 1);
    r.fname = ColText(st, 2);
    r.last_modified = ColDouble(st, 3);

    if (ColI32(st, 20) != 0) {
        model::MetaRecord m;
        m.file_id = r.file_id;
        m.orientation = ColI32(st, 4);
        m.capture_time = ColDouble(st, 5);
        m.f_number = ColDouble(st, 6);
        m.exposure_time = ColOptText(st, 7);
        m.iso = ColDouble(st, 8);
        m.focal_length = ColOptText(st, 9);
        m.make = ColOptText(st, 10);
        m.model = ColOptText(st, 11);
        m.lens = ColOptText(st, 12);
        m.rating = ColOptI32(st, 13);
        m.latitude = ColOptDouble(st, 14);
        m.longitude = ColOptDouble(st, 15);
        m.width = ColI32(st, 16);
        m.height = ColI32(st, 17);
        r.meta = std::move(m);
    }

    r.is_portrait = ColI32(st, 18) != 0;
    r.location = ColOptText(st, 19);

    sqlite3_finalize(st);
    return r;
}

Result SqliteRepository::SelectImageIds(Transaction& t, const std::string& where_clause, const std::string& order_clause,
                                        Selection selection, std::vector<std::optional<int64_t>>* out) {
    auto* db = TX(t).Handle();

    std::string sql;
    switch (selection) {
        case Selection::kAll:
            sql = "SELECT file_id FROM all_data WHERE (" + where_clause + ")";
            break;
        case Selection::kLandscapeOrHole:
            sql = "SELECT CASE WHEN is_portrait = 0 THEN file_id ELSE NULL END FROM all_data WHERE (" + where_clause + ")";
            break;
        case Selection::kPortraitOnly:
            sql = "SELECT file_id FROM all_data WHERE (" + where_clause + ") AND is_portrait = 1";
            break;
    }
    // file_id breaks ties so both pairing passes see rows in the same order
    sql += " ORDER BY " + order_clause + ", file_id ASC;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        if (IsNull(st, 0)) out->emplace_back(std::nullopt);
        else out->emplace_back(ColI64(st, 0));
    }

    auto result = Translate(db, rc);
    sqlite3_finalize(st);
    return result;
}

int64_t SqliteRepository::CountImages(Transaction& t) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::COUNT_IMAGES, -1, &st, nullptr) != SQLITE_OK)
        return 0;

    int64_t count = 0;
    if (sqlite3_step(st) == SQLITE_ROW) {
        count = ColI64(st, 0);
    }

    sqlite3_finalize(st);
    return count;
}

}
