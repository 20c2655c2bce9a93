#pragma once

#include <QString>
#include <QStringList>
#include <optional>

struct sqlite3;
struct sqlite3_stmt;

namespace hr::sql {

bool exec(sqlite3* db, const char* sql);

// BEGIN IMMEDIATE so the write lock is taken before any read in the transaction.
bool begin(sqlite3* db);
bool commit(sqlite3* db);
void rollback(sqlite3* db);

// Binds a UTF-8 copy owned by SQLite (SQLITE_TRANSIENT).
void bindText(sqlite3_stmt* stmt, int index, const QString& value);
void bindOptionalText(sqlite3_stmt* stmt, int index, const QString& value);
void bindOptionalDouble(sqlite3_stmt* stmt, int index, const std::optional<double>& value);

QString columnText(sqlite3_stmt* stmt, int column);
std::optional<double> columnOptionalDouble(sqlite3_stmt* stmt, int column);

// JSON array <-> QStringList for list-valued columns.
QString encodeList(const QStringList& values);
QStringList decodeList(const QString& json);

double nowEpoch();

} // namespace hr::sql
