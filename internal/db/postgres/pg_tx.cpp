#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace dispatch::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  conn_ = pool->Acquire();
  tx_   = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (finished_) return;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    DISPATCH_LOG_ERROR("postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  tx_->commit();
  finished_ = true;
  RunAfterCommit();
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

} // namespace dispatch::db::postgres
