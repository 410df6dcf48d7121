#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace graphingest::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                              CreateDataset(Transaction&, model::DatasetRecord&) override;
  std::optional<model::DatasetRecord> GetDataset(Transaction&, std::int64_t id) override;
  Result                              UpdateDataset(Transaction&, const model::DatasetRecord&) override;
  std::vector<model::DatasetRecord>   ListDatasets(Transaction&) override;

  Result                           CreateTask(Transaction&, model::TaskRecord&) override;
  std::optional<model::TaskRecord> GetTask(Transaction&, std::int64_t id) override;
  Result                           UpdateTask(Transaction&, const model::TaskRecord&) override;
  std::vector<model::TaskRecord>   ListTasksByDataset(Transaction&, std::int64_t dataset_id, const TaskFilter& filter = {}) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace graphingest::db::sqlite
