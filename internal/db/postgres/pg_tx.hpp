#pragma once

#include <memory>
#include <pqxx/pqxx>
#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace jobguard::db::postgres {

using SerializableWork = pqxx::transaction<pqxx::isolation_level::serializable>;

/*
  One pooled connection + one SERIALIZABLE transaction.
  pqxx::serialization_failure surfaces as util::TransactionConflict.
*/
class PgTransaction final : public db::Transaction {
public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction();

  SerializableWork& Work() { return *tx_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<SerializableWork> tx_;
  bool committed_   = false;
  bool rolled_back_ = false;
};

}
