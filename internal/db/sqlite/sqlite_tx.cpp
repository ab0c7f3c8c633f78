#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace caretask::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      CARETASK_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  db_->Exec("ROLLBACK;");
  lock_.unlock();
}

} // namespace caretask::db::sqlite
