#pragma once

struct sqlite3;

namespace hr {

// Brings the database forward to targetVersion one step at a time, each step
// in its own transaction. A database newer than targetVersion is refused.
bool applyMigrations(sqlite3* db, int targetVersion);

// schema_version from the settings table; 0 before the schema exists.
int currentSchemaVersion(sqlite3* db);

} // namespace hr
