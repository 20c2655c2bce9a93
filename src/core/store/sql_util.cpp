#include "core/store/sql_util.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>

#include <sqlite3.h>

namespace hr::sql {

bool exec(sqlite3* db, const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_WARN(hrStore, "SQL failed: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

bool begin(sqlite3* db)
{
    return exec(db, "BEGIN IMMEDIATE");
}

bool commit(sqlite3* db)
{
    return exec(db, "COMMIT");
}

void rollback(sqlite3* db)
{
    if (sqlite3_get_autocommit(db) == 0) {
        exec(db, "ROLLBACK");
    }
}

void bindText(sqlite3_stmt* stmt, int index, const QString& value)
{
    const QByteArray utf8 = value.toUtf8();
    sqlite3_bind_text(stmt, index, utf8.constData(), utf8.size(), SQLITE_TRANSIENT);
}

void bindOptionalText(sqlite3_stmt* stmt, int index, const QString& value)
{
    if (value.isEmpty()) {
        sqlite3_bind_null(stmt, index);
    } else {
        bindText(stmt, index, value);
    }
}

void bindOptionalDouble(sqlite3_stmt* stmt, int index, const std::optional<double>& value)
{
    if (value.has_value()) {
        sqlite3_bind_double(stmt, index, *value);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

QString columnText(sqlite3_stmt* stmt, int column)
{
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return text ? QString::fromUtf8(text) : QString();
}

std::optional<double> columnOptionalDouble(sqlite3_stmt* stmt, int column)
{
    if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
        return std::nullopt;
    }
    return sqlite3_column_double(stmt, column);
}

QString encodeList(const QStringList& values)
{
    return QString::fromUtf8(
        QJsonDocument(QJsonArray::fromStringList(values)).toJson(QJsonDocument::Compact));
}

QStringList decodeList(const QString& json)
{
    QStringList out;
    const QJsonDocument doc = QJsonDocument::fromJson(json.toUtf8());
    if (!doc.isArray()) {
        return out;
    }
    for (const QJsonValue& value : doc.array()) {
        if (value.isString()) {
            out.append(value.toString());
        }
    }
    return out;
}

double nowEpoch()
{
    return static_cast<double>(QDateTime::currentMSecsSinceEpoch()) / 1000.0;
}

} // namespace hr::sql
