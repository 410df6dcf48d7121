#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace graphingest::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by all workers; SqliteTransaction holds
  TxMutex() for its whole lifetime so transactions never interleave on it.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  // Creates the dataset/upload_task tables when missing.
  void Bootstrap();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace graphingest::db::sqlite
