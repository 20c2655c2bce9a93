#include "core/store/sqlite_store.h"
#include "core/store/migration.h"
#include "core/store/schema.h"
#include "core/store/sql_util.h"
#include "core/shared/logging.h"

#include <QFile>

namespace hr {

namespace {

bool hasSchema(sqlite3* db)
{
    sqlite3_stmt* stmt = nullptr;
    bool found = false;
    if (sqlite3_prepare_v2(db,
            "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = 'user_interactions'",
            -1, &stmt, nullptr) == SQLITE_OK) {
        found = sqlite3_step(stmt) == SQLITE_ROW;
    }
    sqlite3_finalize(stmt);
    return found;
}

bool createSchema(sqlite3* db, bool onDisk)
{
    if (onDisk && !sql::exec(db, kDatabasePragmas)) {
        return false;
    }
    if (!sql::begin(db)) {
        return false;
    }
    if (!sql::exec(db, kSchemaV1) || !sql::exec(db, kDefaultSettings) || !sql::commit(db)) {
        sql::rollback(db);
        return false;
    }
    return true;
}

} // namespace

SQLiteStore::SQLiteStore(SQLiteStore&& other) noexcept
    : m_db(other.m_db)
{
    other.m_db = nullptr;
}

SQLiteStore& SQLiteStore::operator=(SQLiteStore&& other) noexcept
{
    if (this != &other) {
        close();
        m_db = other.m_db;
        other.m_db = nullptr;
    }
    return *this;
}

SQLiteStore::~SQLiteStore()
{
    close();
}

void SQLiteStore::close()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::optional<SQLiteStore> SQLiteStore::open(const QString& dbPath)
{
    sqlite3* handle = nullptr;
    const int rc = sqlite3_open(dbPath.toUtf8().constData(), &handle);
    // The store owns the handle from here on, even when opening failed.
    SQLiteStore store(handle);
    if (rc != SQLITE_OK) {
        LOG_ERROR(hrStore, "Cannot open %s: %s", qUtf8Printable(dbPath),
                  handle ? sqlite3_errmsg(handle) : "out of memory");
        return std::nullopt;
    }

    sqlite3_busy_timeout(handle, 30000);
    if (!sql::exec(handle, kConnectionPragmas)) {
        LOG_ERROR(hrStore, "Connection pragmas failed for %s", qUtf8Printable(dbPath));
        return std::nullopt;
    }

    const bool onDisk = dbPath != QLatin1String(":memory:");
    if (!hasSchema(handle) && !createSchema(handle, onDisk)) {
        LOG_ERROR(hrStore, "Schema creation failed for %s", qUtf8Printable(dbPath));
        return std::nullopt;
    }
    if (!applyMigrations(handle, kCurrentSchemaVersion)) {
        LOG_ERROR(hrStore, "Migration failed for %s", qUtf8Printable(dbPath));
        return std::nullopt;
    }

    if (onDisk) {
        // Interaction history is private to the account.
        QFile(dbPath).setPermissions(QFile::ReadOwner | QFile::WriteOwner);
    }

    LOG_INFO(hrStore, "Opened %s at schema v%d", qUtf8Printable(dbPath), store.schemaVersion());
    return store;
}

int SQLiteStore::schemaVersion() const
{
    return currentSchemaVersion(m_db);
}

bool SQLiteStore::integrityCheck() const
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "PRAGMA integrity_check", -1, &stmt, nullptr) != SQLITE_OK) {
        sqlite3_finalize(stmt);
        return false;
    }
    const bool ok = sqlite3_step(stmt) == SQLITE_ROW && sql::columnText(stmt, 0) == QLatin1String("ok");
    sqlite3_finalize(stmt);
    return ok;
}

} // namespace hr
