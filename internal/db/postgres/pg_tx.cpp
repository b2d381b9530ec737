#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace jobguard::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<SerializableWork>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!committed_ && !rolled_back_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      JOBGUARD_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const pqxx::serialization_failure& e) {
    rolled_back_ = true;
    throw util::TransactionConflict(e.what());
  }
  committed_ = true;
}

void PgTransaction::Rollback() {
  tx_->abort();
  rolled_back_ = true;
}

}
