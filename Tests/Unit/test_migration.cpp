#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <QThread>

#include "core/store/migration.h"
#include "core/store/schema.h"
#include "core/store/sqlite_store.h"

#include <sqlite3.h>

#include <atomic>
#include <memory>
#include <vector>

class TestMigration : public QObject {
    Q_OBJECT

private slots:
    void testCurrentVersionMissingSettingsDefaultsToZero();
    void testApplyMigrationsUpToV2();
    void testMigrationBackfillsClaimTimestamps();
    void testAlreadyCurrentIsNoOp();
    void testRejectsDowngrade();
    void testConcurrentSessionsMigrateOnce();
    void testConcurrentStoreOpensOnFreshFile();

private:
    static sqlite3* openV1();
};

sqlite3* TestMigration::openV1()
{
    sqlite3* db = nullptr;
    if (sqlite3_open(":memory:", &db) != SQLITE_OK) {
        return nullptr;
    }
    if (sqlite3_exec(db, vmc::kSchemaV1, nullptr, nullptr, nullptr) != SQLITE_OK
        || sqlite3_exec(db, vmc::kDefaultLookups, nullptr, nullptr, nullptr) != SQLITE_OK) {
        sqlite3_close(db);
        return nullptr;
    }
    return db;
}

void TestMigration::testCurrentVersionMissingSettingsDefaultsToZero()
{
    sqlite3* db = nullptr;
    QCOMPARE(sqlite3_open(":memory:", &db), SQLITE_OK);
    QVERIFY(db != nullptr);

    QCOMPARE(vmc::currentSchemaVersion(db), 0);

    sqlite3_close(db);
}

void TestMigration::testApplyMigrationsUpToV2()
{
    sqlite3* db = openV1();
    QVERIFY(db != nullptr);
    QCOMPARE(vmc::currentSchemaVersion(db), 1);

    QVERIFY(vmc::applyMigrations(db, 2));
    QCOMPARE(vmc::currentSchemaVersion(db), 2);

    sqlite3_stmt* stmt = nullptr;
    QCOMPARE(sqlite3_prepare_v2(
                 db,
                 "SELECT COUNT(*) FROM pragma_table_info('sample_pool') "
                 "WHERE name IN ('claimed_at', 'claimed_by');",
                 -1, &stmt, nullptr),
             SQLITE_OK);
    QCOMPARE(sqlite3_step(stmt), SQLITE_ROW);
    QCOMPARE(sqlite3_column_int(stmt, 0), 2);
    sqlite3_finalize(stmt);

    sqlite3_close(db);
}

void TestMigration::testMigrationBackfillsClaimTimestamps()
{
    sqlite3* db = openV1();
    QVERIFY(db != nullptr);

    QCOMPARE(sqlite3_exec(db,
                          "INSERT INTO participants (child_id, sex, date_of_birth, group_name) "
                          "  VALUES ('c1', 'M', '2020-01-01', 'High Risk');"
                          "INSERT INTO recordings (participant_id, assessment_id, recording_date, "
                          "  age_in_months, start_time) VALUES (1, 'A1', '2021-01-01', 12, 0);"
                          "INSERT INTO segments (recording_id, start_seconds, end_seconds, modified_at) "
                          "  VALUES (1, 0, 300, 0);"
                          "INSERT INTO utterances (segment_id, start_seconds, end_seconds, "
                          "  duration_seconds, audio_file_name, added_at) VALUES (1, 1, 2, 1, 'u.mp3', 0);"
                          "INSERT INTO sample_pool (utterance_id, batch_group, is_processing, added_at, modified_at) "
                          "  VALUES (1, 100, 1, 5, 42);"
                          "INSERT INTO sample_pool (utterance_id, batch_group, is_processing, added_at, modified_at) "
                          "  VALUES (1, 100, 0, 5, 43);",
                          nullptr, nullptr, nullptr),
             SQLITE_OK);

    QVERIFY(vmc::applyMigrations(db, 2));

    sqlite3_stmt* stmt = nullptr;
    QCOMPARE(sqlite3_prepare_v2(db, "SELECT claimed_at FROM sample_pool ORDER BY id", -1, &stmt,
                                nullptr),
             SQLITE_OK);
    QCOMPARE(sqlite3_step(stmt), SQLITE_ROW);
    QCOMPARE(sqlite3_column_double(stmt, 0), 42.0);
    QCOMPARE(sqlite3_step(stmt), SQLITE_ROW);
    QCOMPARE(sqlite3_column_type(stmt, 0), SQLITE_NULL);
    sqlite3_finalize(stmt);

    sqlite3_close(db);
}

void TestMigration::testAlreadyCurrentIsNoOp()
{
    sqlite3* db = openV1();
    QVERIFY(db != nullptr);

    QVERIFY(vmc::applyMigrations(db, 2));
    QVERIFY(vmc::applyMigrations(db, 2));
    QCOMPARE(vmc::currentSchemaVersion(db), 2);

    sqlite3_close(db);
}

void TestMigration::testRejectsDowngrade()
{
    sqlite3* db = nullptr;
    QCOMPARE(sqlite3_open(":memory:", &db), SQLITE_OK);
    QVERIFY(db != nullptr);

    QCOMPARE(sqlite3_exec(db,
                          "CREATE TABLE settings (key TEXT PRIMARY KEY, value TEXT NOT NULL);"
                          "INSERT INTO settings (key, value) VALUES ('schema_version', '5');",
                          nullptr, nullptr, nullptr),
             SQLITE_OK);

    QVERIFY(!vmc::applyMigrations(db, 2));
    QCOMPARE(vmc::currentSchemaVersion(db), 5);

    sqlite3_close(db);
}

void TestMigration::testConcurrentSessionsMigrateOnce()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QByteArray dbPath = (dir.path() + "/v1.db").toUtf8();

    {
        sqlite3* db = nullptr;
        QCOMPARE(sqlite3_open(dbPath.constData(), &db), SQLITE_OK);
        QCOMPARE(sqlite3_exec(db, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr), SQLITE_OK);
        QCOMPARE(sqlite3_exec(db, vmc::kSchemaV1, nullptr, nullptr, nullptr), SQLITE_OK);
        QCOMPARE(sqlite3_exec(db, vmc::kDefaultLookups, nullptr, nullptr, nullptr), SQLITE_OK);
        QCOMPARE(vmc::currentSchemaVersion(db), 1);
        sqlite3_close(db);
    }

    // Both sessions read version 1 before either takes the write lock.
    constexpr int kSessions = 4;
    std::atomic<int> opened{0};
    std::atomic<int> migrated{0};
    std::vector<std::unique_ptr<QThread>> threads;
    for (int i = 0; i < kSessions; ++i) {
        threads.emplace_back(QThread::create([&dbPath, &opened, &migrated]() {
            sqlite3* db = nullptr;
            if (sqlite3_open(dbPath.constData(), &db) != SQLITE_OK) {
                sqlite3_close(db);
                return;
            }
            sqlite3_busy_timeout(db, 30000);
            ++opened;
            while (opened.load() < kSessions) {
                QThread::yieldCurrentThread();
            }
            if (vmc::applyMigrations(db, 2)) {
                ++migrated;
            }
            sqlite3_close(db);
        }));
    }
    for (auto& thread : threads) {
        thread->start();
    }
    for (auto& thread : threads) {
        QVERIFY(thread->wait(60000));
    }

    QCOMPARE(migrated.load(), kSessions);

    sqlite3* db = nullptr;
    QCOMPARE(sqlite3_open(dbPath.constData(), &db), SQLITE_OK);
    QCOMPARE(vmc::currentSchemaVersion(db), 2);
    sqlite3_stmt* stmt = nullptr;
    QCOMPARE(sqlite3_prepare_v2(
                 db,
                 "SELECT COUNT(*) FROM pragma_table_info('sample_pool') "
                 "WHERE name IN ('claimed_at', 'claimed_by');",
                 -1, &stmt, nullptr),
             SQLITE_OK);
    QCOMPARE(sqlite3_step(stmt), SQLITE_ROW);
    QCOMPARE(sqlite3_column_int(stmt, 0), 2);
    sqlite3_finalize(stmt);
    sqlite3_close(db);
}

void TestMigration::testConcurrentStoreOpensOnFreshFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString dbPath = dir.path() + "/fresh.db";

    constexpr int kSessions = 3;
    std::atomic<int> opened{0};
    std::vector<std::unique_ptr<QThread>> threads;
    for (int i = 0; i < kSessions; ++i) {
        threads.emplace_back(QThread::create([&dbPath, &opened]() {
            auto store = vmc::SQLiteStore::open(dbPath);
            if (store.has_value()) {
                ++opened;
            }
        }));
    }
    for (auto& thread : threads) {
        thread->start();
    }
    for (auto& thread : threads) {
        QVERIFY(thread->wait(60000));
    }

    QCOMPARE(opened.load(), kSessions);
    auto store = vmc::SQLiteStore::open(dbPath);
    QVERIFY(store.has_value());
    QCOMPARE(vmc::currentSchemaVersion(store->rawDb()), vmc::kCurrentSchemaVersion);
}

QTEST_MAIN(TestMigration)
#include "test_migration.moc"
