#include "sqlite_repository.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <sqlite3.h>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace graphingest::db::sqlite {

using graphingest::db::ErrorCode;
using graphingest::db::Result;

namespace {

using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

constexpr const char* kDatasetColumns =
    "id,name,description,cascade_delete,status,total_files,processed_files,total_nodes,total_relationships,created_at_ms,updated_at_ms";

constexpr const char* kTaskColumns =
    "id,dataset_id,file_name,file_path,kind,label,source_label,target_label,status,total_rows,processed_rows,progress_percentage,"
    "error_message,error_details,warnings,created_at_ms,started_at_ms,completed_at_ms";

Statement Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    return Statement(nullptr, &sqlite3_finalize);
  }
  return Statement(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, std::int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, std::uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<std::int64_t>(sqlite3_column_int64(st, col));
}

std::uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<std::uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

std::string EncodeWarnings(const std::vector<std::string>& warnings) {
  google::protobuf::ListValue list;
  for (const auto& warning : warnings) {
    list.add_values()->set_string_value(warning);
  }
  std::string json;
  if (!google::protobuf::util::MessageToJsonString(list, &json).ok()) {
    return "[]";
  }
  return json;
}

std::vector<std::string> DecodeWarnings(const std::string& json) {
  std::vector<std::string>    warnings;
  google::protobuf::ListValue list;
  const auto                  status = google::protobuf::util::JsonStringToMessage(json, &list);
  if (!status.ok()) {
    GRAPHINGEST_LOG_WARN("unreadable task warnings column", {observability::StringField("error", status.ToString())});
    return warnings;
  }
  for (const auto& value : list.values()) {
    warnings.push_back(value.string_value());
  }
  return warnings;
}

model::DatasetRecord ReadDataset(sqlite3_stmt* st) {
  model::DatasetRecord r;
  r.id                  = ColI64(st, 0);
  r.name                = ColText(st, 1);
  r.description         = ColText(st, 2);
  r.cascade_delete      = ColI32(st, 3) != 0;
  r.status              = static_cast<graphingest::v1::DatasetStatus>(ColI32(st, 4));
  r.total_files         = ColU64(st, 5);
  r.processed_files     = ColU64(st, 6);
  r.total_nodes         = ColU64(st, 7);
  r.total_relationships = ColU64(st, 8);
  r.created_at_ms       = ColU64(st, 9);
  r.updated_at_ms       = ColU64(st, 10);
  return r;
}

model::TaskRecord ReadTask(sqlite3_stmt* st) {
  model::TaskRecord r;
  r.id                  = ColI64(st, 0);
  r.dataset_id          = ColI64(st, 1);
  r.file_name           = ColText(st, 2);
  r.file_path           = ColText(st, 3);
  r.kind                = static_cast<graphingest::v1::FileKind>(ColI32(st, 4));
  r.label               = ColText(st, 5);
  r.source_label        = ColText(st, 6);
  r.target_label        = ColText(st, 7);
  r.status              = static_cast<graphingest::v1::TaskStatus>(ColI32(st, 8));
  r.total_rows          = ColU64(st, 9);
  r.processed_rows      = ColU64(st, 10);
  r.progress_percentage = sqlite3_column_double(st, 11);
  r.error_message       = ColText(st, 12);
  r.error_details       = ColText(st, 13);
  r.warnings            = DecodeWarnings(ColText(st, 14));
  r.created_at_ms       = ColU64(st, 15);
  r.started_at_ms       = ColU64(st, 16);
  r.completed_at_ms     = ColU64(st, 17);
  return r;
}

// Binds every task column after id, starting at idx; returns the next index.
int BindTaskFields(sqlite3_stmt* st, int idx, const model::TaskRecord& r) {
  BindI64(st, idx++, r.dataset_id);
  BindText(st, idx++, r.file_name);
  BindText(st, idx++, r.file_path);
  BindI32(st, idx++, static_cast<int>(r.kind));
  BindText(st, idx++, r.label);
  BindText(st, idx++, r.source_label);
  BindText(st, idx++, r.target_label);
  BindI32(st, idx++, static_cast<int>(r.status));
  BindU64(st, idx++, r.total_rows);
  BindU64(st, idx++, r.processed_rows);
  sqlite3_bind_double(st, idx++, r.progress_percentage);
  BindText(st, idx++, r.error_message);
  BindText(st, idx++, r.error_details);
  BindText(st, idx++, EncodeWarnings(r.warnings));
  BindU64(st, idx++, r.created_at_ms);
  BindU64(st, idx++, r.started_at_ms);
  BindU64(st, idx++, r.completed_at_ms);
  return idx;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Datasets
// ------------------------------------------------------------------

Result SqliteRepository::CreateDataset(Transaction& t, model::DatasetRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "INSERT INTO dataset(name,description,cascade_delete,status,total_files,processed_files,total_nodes,total_relationships,"
                    "created_at_ms,updated_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  if (r.created_at_ms == 0) r.created_at_ms = util::NowMillis();
  r.updated_at_ms = r.created_at_ms;

  BindText(st.get(), 1, r.name);
  BindText(st.get(), 2, r.description);
  BindI32(st.get(), 3, r.cascade_delete ? 1 : 0);
  BindI32(st.get(), 4, static_cast<int>(r.status));
  BindU64(st.get(), 5, r.total_files);
  BindU64(st.get(), 6, r.processed_files);
  BindU64(st.get(), 7, r.total_nodes);
  BindU64(st.get(), 8, r.total_relationships);
  BindU64(st.get(), 9, r.created_at_ms);
  BindU64(st.get(), 10, r.updated_at_ms);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) r.id = static_cast<std::int64_t>(sqlite3_last_insert_rowid(db));
  return Translate(db, rc);
}

std::optional<model::DatasetRecord> SqliteRepository::GetDataset(Transaction& t, std::int64_t id) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, std::string("SELECT ") + kDatasetColumns + " FROM dataset WHERE id=?;");
  if (!st) return std::nullopt;

  BindI64(st.get(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadDataset(st.get());
}

Result SqliteRepository::UpdateDataset(Transaction& t, const model::DatasetRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "UPDATE dataset SET name=?,description=?,cascade_delete=?,status=?,total_files=?,processed_files=?,total_nodes=?,"
                    "total_relationships=?,updated_at_ms=? WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.name);
  BindText(st.get(), 2, r.description);
  BindI32(st.get(), 3, r.cascade_delete ? 1 : 0);
  BindI32(st.get(), 4, static_cast<int>(r.status));
  BindU64(st.get(), 5, r.total_files);
  BindU64(st.get(), 6, r.processed_files);
  BindU64(st.get(), 7, r.total_nodes);
  BindU64(st.get(), 8, r.total_relationships);
  BindU64(st.get(), 9, util::NowMillis());
  BindI64(st.get(), 10, r.id);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "dataset " + std::to_string(r.id));
  return Translate(db, rc);
}

std::vector<model::DatasetRecord> SqliteRepository::ListDatasets(Transaction& t) {
  auto* db = TX(t).Handle();

  std::vector<model::DatasetRecord> records;
  auto st = Prepare(db, std::string("SELECT ") + kDatasetColumns + " FROM dataset ORDER BY id;");
  if (!st) return records;

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    records.push_back(ReadDataset(st.get()));
  }
  return records;
}

// ------------------------------------------------------------------
// Tasks
// ------------------------------------------------------------------

Result SqliteRepository::CreateTask(Transaction& t, model::TaskRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "INSERT INTO upload_task(dataset_id,file_name,file_path,kind,label,source_label,target_label,status,total_rows,"
                    "processed_rows,progress_percentage,error_message,error_details,warnings,created_at_ms,started_at_ms,completed_at_ms) "
                    "VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  if (r.created_at_ms == 0) r.created_at_ms = util::NowMillis();
  BindTaskFields(st.get(), 1, r);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::NotFound, "dataset " + std::to_string(r.dataset_id));
  if (rc == SQLITE_DONE) r.id = static_cast<std::int64_t>(sqlite3_last_insert_rowid(db));
  return Translate(db, rc);
}

std::optional<model::TaskRecord> SqliteRepository::GetTask(Transaction& t, std::int64_t id) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, std::string("SELECT ") + kTaskColumns + " FROM upload_task WHERE id=?;");
  if (!st) return std::nullopt;

  BindI64(st.get(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadTask(st.get());
}

Result SqliteRepository::UpdateTask(Transaction& t, const model::TaskRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "UPDATE upload_task SET dataset_id=?,file_name=?,file_path=?,kind=?,label=?,source_label=?,target_label=?,status=?,"
                    "total_rows=?,processed_rows=?,progress_percentage=?,error_message=?,error_details=?,warnings=?,created_at_ms=?,"
                    "started_at_ms=?,completed_at_ms=? WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  const int next = BindTaskFields(st.get(), 1, r);
  BindI64(st.get(), next, r.id);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "task " + std::to_string(r.id));
  return Translate(db, rc);
}

std::vector<model::TaskRecord> SqliteRepository::ListTasksByDataset(Transaction& t, std::int64_t dataset_id, const TaskFilter& filter) {
  auto* db = TX(t).Handle();

  std::string sql = std::string("SELECT ") + kTaskColumns + " FROM upload_task WHERE dataset_id=?";
  if (filter.kind) sql += " AND kind=?";
  if (filter.status) sql += " AND status=?";
  sql += " ORDER BY id;";

  std::vector<model::TaskRecord> records;
  auto                           st = Prepare(db, sql);
  if (!st) return records;

  int idx = 1;
  BindI64(st.get(), idx++, dataset_id);
  if (filter.kind) BindI32(st.get(), idx++, static_cast<int>(*filter.kind));
  if (filter.status) BindI32(st.get(), idx++, static_cast<int>(*filter.status));

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    records.push_back(ReadTask(st.get()));
  }
  return records;
}

} // namespace graphingest::db::sqlite
