#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace jobguard::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

struct Migration {
  int32_t                  version = 0;
  std::vector<std::string> statements;
};

/*
  Runs migrations in order and records each version in
  jobguard_schema_migrations. Statements must be idempotent
  (CREATE ... IF NOT EXISTS) so a restart can replay them.
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered, uint64_t applied_at_ms);

const std::vector<Migration>& SqliteMigrations();
const std::vector<Migration>& PostgresMigrations();

} // namespace jobguard::db::sql
