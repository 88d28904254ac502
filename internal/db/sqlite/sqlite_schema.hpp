#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace reactor::db::sqlite {

/*
  Schema bootstrap for the three stores under the storage root.
  Each call is idempotent and runs inside one BEGIN IMMEDIATE
  transaction; it returns the number of migrations applied.
*/

int MigrateEventStore(const std::shared_ptr<SqliteDB>& db);
int MigrateSubscriptionStore(const std::shared_ptr<SqliteDB>& db);
int MigrateSwarmStore(const std::shared_ptr<SqliteDB>& db);

} // namespace reactor::db::sqlite
