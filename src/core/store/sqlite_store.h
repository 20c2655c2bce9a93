#pragma once

#include <QString>

#include <optional>

#include <sqlite3.h>

namespace hr {

// Owns the recommender database connection. open() creates the schema on a
// fresh file and migrates older ones; stores built on rawDb() borrow the
// handle and must not outlive this object.
class SQLiteStore {
public:
    ~SQLiteStore();

    SQLiteStore(SQLiteStore&& other) noexcept;
    SQLiteStore& operator=(SQLiteStore&& other) noexcept;
    SQLiteStore(const SQLiteStore&) = delete;
    SQLiteStore& operator=(const SQLiteStore&) = delete;

    // ":memory:" opens a private in-memory database.
    static std::optional<SQLiteStore> open(const QString& dbPath);

    int schemaVersion() const;
    bool integrityCheck() const;

    sqlite3* rawDb() const { return m_db; }

private:
    explicit SQLiteStore(sqlite3* db) : m_db(db) {}
    void close();

    sqlite3* m_db = nullptr;
};

} // namespace hr
