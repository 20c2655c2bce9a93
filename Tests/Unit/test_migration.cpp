#include <QtTest/QtTest>

#include "core/store/migration.h"
#include "core/store/schema.h"
#include "core/store/sqlite_store.h"

#include <QTemporaryDir>

#include <sqlite3.h>

class TestMigration : public QObject {
    Q_OBJECT

private slots:
    void testCurrentVersionMissingSettingsDefaultsToZero();
    void testFreshStoreIsAtCurrentVersion();
    void testApplyMigrationsFromV1AddsRankingWeights();
    void testRejectsDowngrade();
    void testReopenKeepsRowsAndVersion();
};

namespace {

bool hasColumn(sqlite3* db, const char* table, const char* column)
{
    sqlite3_stmt* stmt = nullptr;
    const QByteArray sql = QByteArray("PRAGMA table_info(") + table + ")";
    if (sqlite3_prepare_v2(db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    bool found = false;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        if (name && qstrcmp(name, column) == 0) {
            found = true;
        }
    }
    sqlite3_finalize(stmt);
    return found;
}

} // namespace

void TestMigration::testCurrentVersionMissingSettingsDefaultsToZero()
{
    sqlite3* db = nullptr;
    QCOMPARE(sqlite3_open(":memory:", &db), SQLITE_OK);
    QCOMPARE(hr::currentSchemaVersion(db), 0);
    sqlite3_close(db);
}

void TestMigration::testFreshStoreIsAtCurrentVersion()
{
    auto store = hr::SQLiteStore::open(QStringLiteral(":memory:"));
    QVERIFY(store.has_value());
    QCOMPARE(store->schemaVersion(), hr::kCurrentSchemaVersion);
    QVERIFY(store->integrityCheck());
    QVERIFY(hasColumn(store->rawDb(), "user_profiles", "ranking_weights"));
    QVERIFY(hasColumn(store->rawDb(), "user_interactions", "return_visits"));
    QVERIFY(hasColumn(store->rawDb(), "recommendation_feedback", "rank_position"));
}

void TestMigration::testApplyMigrationsFromV1AddsRankingWeights()
{
    sqlite3* db = nullptr;
    QCOMPARE(sqlite3_open(":memory:", &db), SQLITE_OK);
    QCOMPARE(sqlite3_exec(db, hr::kSchemaV1, nullptr, nullptr, nullptr), SQLITE_OK);
    QCOMPARE(sqlite3_exec(db, hr::kDefaultSettings, nullptr, nullptr, nullptr), SQLITE_OK);
    QCOMPARE(hr::currentSchemaVersion(db), 1);
    QVERIFY(!hasColumn(db, "user_profiles", "ranking_weights"));

    QVERIFY(hr::applyMigrations(db, 2));
    QCOMPARE(hr::currentSchemaVersion(db), 2);
    QVERIFY(hasColumn(db, "user_profiles", "ranking_weights"));

    // Already current: no-op.
    QVERIFY(hr::applyMigrations(db, 2));
    sqlite3_close(db);
}

void TestMigration::testRejectsDowngrade()
{
    sqlite3* db = nullptr;
    QCOMPARE(sqlite3_open(":memory:", &db), SQLITE_OK);
    QCOMPARE(sqlite3_exec(db,
                          "CREATE TABLE settings (key TEXT PRIMARY KEY, value TEXT NOT NULL);"
                          "INSERT INTO settings (key, value) VALUES ('schema_version', '9');",
                          nullptr, nullptr, nullptr),
             SQLITE_OK);
    QVERIFY(!hr::applyMigrations(db, hr::kCurrentSchemaVersion));
    QCOMPARE(hr::currentSchemaVersion(db), 9);
    sqlite3_close(db);
}

void TestMigration::testReopenKeepsRowsAndVersion()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("hybridrec.db"));

    {
        auto store = hr::SQLiteStore::open(path);
        QVERIFY(store.has_value());
        QCOMPARE(sqlite3_exec(store->rawDb(),
                              "INSERT INTO user_profiles (user_id, created_at, updated_at) "
                              "VALUES ('u1', 1.0, 1.0)",
                              nullptr, nullptr, nullptr),
                 SQLITE_OK);
    }

    auto reopened = hr::SQLiteStore::open(path);
    QVERIFY(reopened.has_value());
    QCOMPARE(reopened->schemaVersion(), hr::kCurrentSchemaVersion);

    sqlite3_stmt* stmt = nullptr;
    QCOMPARE(sqlite3_prepare_v2(reopened->rawDb(), "SELECT COUNT(*) FROM user_profiles", -1, &stmt, nullptr),
             SQLITE_OK);
    QCOMPARE(sqlite3_step(stmt), SQLITE_ROW);
    QCOMPARE(sqlite3_column_int(stmt, 0), 1);
    sqlite3_finalize(stmt);
}

QTEST_MAIN(TestMigration)
#include "test_migration.moc"
