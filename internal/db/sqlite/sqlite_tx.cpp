#include "sqlite_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace geocache::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!committed_ && !rolled_back_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      GEOCACHE_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  rolled_back_ = true;
}

} // namespace geocache::db::sqlite
