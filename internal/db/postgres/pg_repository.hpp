#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace geocache::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

} // namespace geocache::db::postgres
