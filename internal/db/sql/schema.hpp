#pragma once

#include <string>
#include <vector>

namespace dispatch::db::sql {

/*
  Backend-agnostic schema bootstrap.

  Each backend implements ExecuteSQL(). Statements are idempotent
  (IF NOT EXISTS) so bootstrap runs on every start.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

// Runs statements in order; the first failure propagates.
void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

const std::vector<std::string>& SqliteSchema();
const std::vector<std::string>& PostgresSchema();

} // namespace dispatch::db::sql
