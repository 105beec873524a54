#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace geocache::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertRecord(Transaction&, model::GeocodeRecord&) override;
  std::optional<model::GeocodeRecord> GetCurrent(Transaction&, const std::string&) override;
  std::optional<model::GeocodeRecord> GetCurrentByRecordKey(Transaction&, const std::string&) override;
  std::vector<model::GeocodeRecord> GetHistory(Transaction&, const std::string&) override;
  Result RetireRecord(Transaction&, uint64_t) override;
  Result UpdateLock(Transaction&, const model::GeocodeRecord&) override;
  std::vector<model::GeocodeRecord> ListCurrent(Transaction&) override;
  std::vector<model::GeocodeRecord> ListAll(Transaction&) override;
  uint64_t CountVersions(Transaction&) override;
  Result DeleteAllRecords(Transaction&) override;

  Result InsertRun(Transaction&, const model::RunRecord&) override;
  Result UpdateRun(Transaction&, const model::RunRecord&) override;
  std::vector<model::RunRecord> ListRuns(Transaction&, std::size_t) override;
  Result DeleteAllRuns(Transaction&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

} // namespace geocache::db::sqlite
