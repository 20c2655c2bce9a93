#include "core/store/migration.h"
#include "core/store/sql_util.h"
#include "core/shared/logging.h"

#include <sqlite3.h>

namespace hr {

namespace {

struct MigrationStep {
    int toVersion;
    const char* summary;
    const char* sql;
};

// v2: per-user ranking weight overrides as a JSON object.
constexpr MigrationStep kSteps[] = {
    {2, "user_profiles.ranking_weights",
     "ALTER TABLE user_profiles ADD COLUMN ranking_weights TEXT;"},
};

bool setVersion(sqlite3* db, int version)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db,
            "INSERT OR REPLACE INTO settings (key, value) VALUES ('schema_version', ?1)",
            -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    sql::bindText(stmt, 1, QString::number(version));
    const bool ok = sqlite3_step(stmt) == SQLITE_DONE;
    sqlite3_finalize(stmt);
    return ok;
}

} // namespace

int currentSchemaVersion(sqlite3* db)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT value FROM settings WHERE key = 'schema_version'",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        sqlite3_finalize(stmt);
        return 0;
    }
    int version = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        version = sql::columnText(stmt, 0).toInt();
    }
    sqlite3_finalize(stmt);
    return version;
}

bool applyMigrations(sqlite3* db, int targetVersion)
{
    int version = currentSchemaVersion(db);
    if (version > targetVersion) {
        LOG_ERROR(hrStore, "Database schema v%d is newer than supported v%d", version, targetVersion);
        return false;
    }

    for (const MigrationStep& step : kSteps) {
        if (step.toVersion <= version || step.toVersion > targetVersion) {
            continue;
        }
        LOG_INFO(hrStore, "Migrating schema v%d -> v%d (%s)", version, step.toVersion, step.summary);
        if (!sql::begin(db)) {
            return false;
        }
        if (!sql::exec(db, step.sql) || !setVersion(db, step.toVersion) || !sql::commit(db)) {
            sql::rollback(db);
            return false;
        }
        version = step.toVersion;
    }

    return version == targetVersion;
}

} // namespace hr
