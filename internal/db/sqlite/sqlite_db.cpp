#include "sqlite_db.hpp"

#include <stdexcept>
#include <vector>

namespace graphingest::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

void SqliteDB::Configure() {
  // WAL enables concurrent readers from other processes while a writer holds the lock
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

void SqliteDB::Bootstrap() {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS dataset (id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT NOT NULL, description TEXT NOT NULL DEFAULT '', "
      "cascade_delete INTEGER NOT NULL DEFAULT 0, status INTEGER NOT NULL, total_files INTEGER NOT NULL DEFAULT 0, "
      "processed_files INTEGER NOT NULL DEFAULT 0, total_nodes INTEGER NOT NULL DEFAULT 0, total_relationships INTEGER NOT NULL DEFAULT 0, "
      "created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS upload_task (id INTEGER PRIMARY KEY AUTOINCREMENT, dataset_id INTEGER NOT NULL REFERENCES dataset(id) ON DELETE CASCADE, "
      "file_name TEXT NOT NULL, file_path TEXT NOT NULL, kind INTEGER NOT NULL, label TEXT NOT NULL DEFAULT '', source_label TEXT NOT NULL DEFAULT '', "
      "target_label TEXT NOT NULL DEFAULT '', status INTEGER NOT NULL, total_rows INTEGER NOT NULL DEFAULT 0, processed_rows INTEGER NOT NULL DEFAULT 0, "
      "progress_percentage REAL NOT NULL DEFAULT 0, error_message TEXT NOT NULL DEFAULT '', error_details TEXT NOT NULL DEFAULT '', "
      "warnings TEXT NOT NULL DEFAULT '[]', created_at_ms INTEGER NOT NULL, started_at_ms INTEGER NOT NULL DEFAULT 0, "
      "completed_at_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS upload_task_dataset_status ON upload_task(dataset_id, status);",
  };

  for (const auto& sql : kBootstrapSql) {
    Exec(sql);
  }

  Exec("SELECT id,name,cascade_delete,status,total_nodes,total_relationships FROM dataset LIMIT 1;");
  Exec("SELECT id,dataset_id,kind,label,status,warnings FROM upload_task LIMIT 1;");
}

} // namespace graphingest::db::sqlite
