#include "core/store/sqlite_store.h"
#include "core/store/schema.h"
#include "core/store/migration.h"
#include "core/shared/logging.h"
#include <sqlite3.h>
#include <QDateTime>
#include <QFile>
#include <QThread>

namespace vmc {

namespace {

double nowSeconds()
{
    return static_cast<double>(QDateTime::currentMSecsSinceEpoch()) / 1000.0;
}

QString columnText(sqlite3_stmt* stmt, int column)
{
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return text ? QString::fromUtf8(text) : QString();
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

constexpr const char* kCodingSelect = R"(
    SELECT c.id, c.utterance_id, c.coder_id, k.first_name || ' ' || k.last_name,
           c.total_syllable_count, c.canonical_syllable_count,
           c.non_canonical_syllable_count, c.word_syllable_count, c.word_count,
           t.description, a.description, c.comments, c.is_acceptable, c.added_at
    FROM utterance_codings c
    JOIN coders k ON c.coder_id = k.id
    JOIN annotations a ON c.annotation_id = a.id
    JOIN utterance_types t ON a.utterance_type_id = t.id
)";

CodingRow readCodingRow(sqlite3_stmt* stmt)
{
    CodingRow row;
    row.codingId = sqlite3_column_int64(stmt, 0);
    row.utteranceId = sqlite3_column_int64(stmt, 1);
    row.coderId = sqlite3_column_int64(stmt, 2);
    row.coderName = columnText(stmt, 3);
    row.totalSyllableCount = sqlite3_column_int(stmt, 4);
    row.canonicalSyllableCount = sqlite3_column_int(stmt, 5);
    row.nonCanonicalSyllableCount = sqlite3_column_int(stmt, 6);
    row.wordSyllableCount = sqlite3_column_int(stmt, 7);
    row.wordCount = sqlite3_column_int(stmt, 8);
    row.utteranceType = columnText(stmt, 9);
    row.annotation = columnText(stmt, 10);
    row.comments = columnText(stmt, 11);
    row.isAcceptable = sqlite3_column_int(stmt, 12) != 0;
    row.addedAt = sqlite3_column_double(stmt, 13);
    return row;
}

Segment readSegment(sqlite3_stmt* stmt)
{
    Segment segment;
    segment.id = sqlite3_column_int64(stmt, 0);
    segment.recordingId = sqlite3_column_int64(stmt, 1);
    segment.startSeconds = sqlite3_column_double(stmt, 2);
    segment.endSeconds = sqlite3_column_double(stmt, 3);
    segment.activityCount = sqlite3_column_int(stmt, 4);
    segment.isSelected = sqlite3_column_int(stmt, 5) != 0;
    segment.criterion = selectionCriterionFromSymbol(columnText(stmt, 6));
    return segment;
}

} // namespace

int stepWithRetry(sqlite3_stmt* stmt, int maxAttempts)
{
    // sqlite3_busy_timeout's handler is NOT invoked when SQLite detects a
    // potential WAL deadlock; sqlite3_step() then returns SQLITE_BUSY
    // immediately, so retry at the application level.
    int rc = SQLITE_BUSY;
    for (int attempt = 0; attempt < maxAttempts && (rc == SQLITE_BUSY || rc == SQLITE_LOCKED);
         ++attempt) {
        if (attempt > 0) {
            sqlite3_reset(stmt);
            QThread::msleep(50 * attempt);  // 50, 100, 150, 200 ms
        }
        rc = sqlite3_step(stmt);
    }
    return rc;
}

SQLiteStore::~SQLiteStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::optional<SQLiteStore> SQLiteStore::open(const QString& dbPath)
{
    SQLiteStore store;
    if (!store.init(dbPath)) {
        return std::nullopt;
    }
    return store;
}

bool SQLiteStore::init(const QString& dbPath)
{
    int rc = sqlite3_open(dbPath.toUtf8().constData(), &m_db);
    if (rc != SQLITE_OK) {
        LOG_ERROR(vmcStore, "Failed to open database: %s", sqlite3_errmsg(m_db));
        return false;
    }

    // Set busy_timeout FIRST via C API, before running any SQL.
    sqlite3_busy_timeout(m_db, 30000);

    if (!execSql(kConnectionPragmas)) {
        LOG_ERROR(vmcStore, "Failed to set connection pragmas");
        return false;
    }

    // Skip the write-heavy schema creation when another session already
    // created the database.
    bool schemaExists = false;
    {
        sqlite3_stmt* stmt = nullptr;
        rc = sqlite3_prepare_v2(m_db,
            "SELECT count(*) FROM sqlite_master WHERE type='table' AND name='sample_pool'",
            -1, &stmt, nullptr);
        if (rc == SQLITE_OK && sqlite3_step(stmt) == SQLITE_ROW) {
            schemaExists = (sqlite3_column_int(stmt, 0) > 0);
        }
        sqlite3_finalize(stmt);
    }

    if (!schemaExists) {
        if (!execSql(kDatabasePragmas)) {
            LOG_ERROR(vmcStore, "Failed to set database pragmas");
            return false;
        }

        {
            sqlite3_stmt* stmt = nullptr;
            if (sqlite3_prepare_v2(m_db, "PRAGMA journal_mode", -1, &stmt, nullptr) == SQLITE_OK
                && sqlite3_step(stmt) == SQLITE_ROW) {
                const QString mode = columnText(stmt, 0);
                if (mode != QLatin1String("wal")) {
                    LOG_WARN(vmcStore, "Expected WAL journal mode, got: %s", qUtf8Printable(mode));
                }
            }
            sqlite3_finalize(stmt);
        }

        // Sessions racing to create a fresh file serialize on the write lock.
        if (!beginImmediateTransaction()) {
            LOG_ERROR(vmcStore, "Failed to lock database for schema creation");
            return false;
        }

        if (!execSql(kSchemaV1)) {
            LOG_ERROR(vmcStore, "Failed to create schema");
            if (!rollbackTransaction()) {
                LOG_WARN(vmcStore, "Schema creation rollback failed");
            }
            return false;
        }

        if (!execSql(kDefaultLookups)) {
            LOG_ERROR(vmcStore, "Failed to insert default lookups");
            if (!rollbackTransaction()) {
                LOG_WARN(vmcStore, "Schema creation rollback failed");
            }
            return false;
        }

        if (!commitTransaction()) {
            LOG_ERROR(vmcStore, "Failed to commit schema");
            if (!rollbackTransaction()) {
                LOG_WARN(vmcStore, "Schema creation rollback failed");
            }
            return false;
        }
    }

    if (!applyMigrations(m_db, kCurrentSchemaVersion)) {
        LOG_ERROR(vmcStore, "Migration failed");
        return false;
    }

    // Restrict database file permissions to owner-only (0600)
    QFile dbFile(dbPath);
    if (dbFile.exists()) {
        dbFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);
    }

    LOG_INFO(vmcStore, "Database opened successfully: %s", qUtf8Printable(dbPath));
    return true;
}

bool SQLiteStore::execSql(const char* sql)
{
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(vmcStore, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

// ── Participants / recordings ───────────────────────────────

std::optional<int64_t> SQLiteStore::insertParticipant(const QString& childId,
                                                      const QString& sex,
                                                      const QString& dateOfBirth,
                                                      const QString& groupName)
{
    const char* sql = R"(
        INSERT INTO participants (child_id, sex, date_of_birth, group_name)
        VALUES (?1, ?2, ?3, ?4)
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(vmcStore, "insertParticipant prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    bindText(stmt, 1, childId);
    bindText(stmt, 2, sex);
    bindText(stmt, 3, dateOfBirth);
    bindText(stmt, 4, groupName);

    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(vmcStore, "insertParticipant step failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(m_db);
}

std::optional<int64_t> SQLiteStore::insertRecording(const RecordingRow& recording)
{
    const char* sql = R"(
        INSERT INTO recordings (participant_id, assessment_id, recording_date,
                                age_in_months, start_time, is_valid)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6)
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(vmcStore, "insertRecording prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, recording.participantId);
    bindText(stmt, 2, recording.assessmentId);
    bindText(stmt, 3, recording.recordingDate);
    sqlite3_bind_double(stmt, 4, recording.ageInMonths);
    sqlite3_bind_double(stmt, 5, recording.startTime);
    sqlite3_bind_int(stmt, 6, recording.isValid ? 1 : 0);

    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(vmcStore, "insertRecording step failed for %s: %s",
                  qUtf8Printable(recording.assessmentId), sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(m_db);
}

std::optional<SQLiteStore::RecordingRow> SQLiteStore::getRecording(int64_t recordingId)
{
    const char* sql = R"(
        SELECT id, participant_id, assessment_id, recording_date, age_in_months,
               start_time, is_valid
        FROM recordings WHERE id = ?1
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, recordingId);

    std::optional<RecordingRow> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        RecordingRow row;
        row.id = sqlite3_column_int64(stmt, 0);
        row.participantId = sqlite3_column_int64(stmt, 1);
        row.assessmentId = columnText(stmt, 2);
        row.recordingDate = columnText(stmt, 3);
        row.ageInMonths = sqlite3_column_double(stmt, 4);
        row.startTime = sqlite3_column_double(stmt, 5);
        row.isValid = sqlite3_column_int(stmt, 6) != 0;
        result = row;
    }
    sqlite3_finalize(stmt);
    return result;
}

bool SQLiteStore::setRecordingValid(int64_t recordingId, bool isValid)
{
    const char* sql = "UPDATE recordings SET is_valid = ?1 WHERE id = ?2";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    sqlite3_bind_int(stmt, 1, isValid ? 1 : 0);
    sqlite3_bind_int64(stmt, 2, recordingId);
    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(m_db) == 1;
}

// ── Segments ────────────────────────────────────────────────

std::optional<int64_t> SQLiteStore::insertSegment(int64_t recordingId,
                                                  double startSeconds,
                                                  double endSeconds,
                                                  int activityCount)
{
    const char* sql = R"(
        INSERT INTO segments (recording_id, start_seconds, end_seconds,
                              activity_count, modified_at)
        VALUES (?1, ?2, ?3, ?4, ?5)
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(vmcStore, "insertSegment prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, recordingId);
    sqlite3_bind_double(stmt, 2, startSeconds);
    sqlite3_bind_double(stmt, 3, endSeconds);
    sqlite3_bind_int(stmt, 4, activityCount);
    sqlite3_bind_double(stmt, 5, nowSeconds());

    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(vmcStore, "insertSegment step failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(m_db);
}

std::optional<std::vector<Segment>> SQLiteStore::segmentsForRecording(int64_t recordingId)
{
    const char* sql = R"(
        SELECT id, recording_id, start_seconds, end_seconds, activity_count,
               is_selected, selection_criterion
        FROM segments
        WHERE recording_id = ?1
        ORDER BY activity_count DESC, id ASC
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(vmcStore, "segmentsForRecording prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, recordingId);

    std::vector<Segment> segments;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        segments.push_back(readSegment(stmt));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(vmcStore, "segmentsForRecording step failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return segments;
}

std::optional<std::vector<Segment>> SQLiteStore::selectedSegmentsForRecording(int64_t recordingId)
{
    const char* sql = R"(
        SELECT id, recording_id, start_seconds, end_seconds, activity_count,
               is_selected, selection_criterion
        FROM segments
        WHERE recording_id = ?1 AND is_selected = 1
        ORDER BY start_seconds ASC
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(vmcStore, "selectedSegmentsForRecording prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, recordingId);

    std::vector<Segment> segments;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        segments.push_back(readSegment(stmt));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return std::nullopt;
    }
    return segments;
}

bool SQLiteStore::markSegmentsSelected(
    const std::vector<std::pair<int64_t, SelectionCriterion>>& selections)
{
    const char* sql = R"(
        UPDATE segments
        SET is_selected = 1, selection_criterion = ?2, modified_at = ?3
        WHERE id = ?1 AND is_selected = 0
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(vmcStore, "markSegmentsSelected prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }

    const double now = nowSeconds();
    bool ok = true;
    for (const auto& [segmentId, criterion] : selections) {
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        sqlite3_bind_int64(stmt, 1, segmentId);
        bindText(stmt, 2, selectionCriterionToSymbol(criterion));
        sqlite3_bind_double(stmt, 3, now);
        if (stepWithRetry(stmt) != SQLITE_DONE || sqlite3_changes(m_db) != 1) {
            LOG_ERROR(vmcStore, "markSegmentsSelected failed for segment %lld: %s",
                      static_cast<long long>(segmentId), sqlite3_errmsg(m_db));
            ok = false;
            break;
        }
    }
    sqlite3_finalize(stmt);
    return ok;
}

// ── Exclusions ──────────────────────────────────────────────

std::optional<int64_t> SQLiteStore::insertExclusion(const ExclusionWindow& window)
{
    const char* sql = R"(
        INSERT INTO exclusion_durations (recording_id, start_time, end_time, category)
        VALUES (?1, ?2, ?3, ?4)
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(vmcStore, "insertExclusion prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, window.recordingId);
    sqlite3_bind_double(stmt, 2, window.startTime);
    sqlite3_bind_double(stmt, 3, window.endTime);
    bindText(stmt, 4, exclusionCategoryToString(window.category));

    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(vmcStore, "insertExclusion step failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(m_db);
}

std::optional<std::vector<ExclusionWindow>> SQLiteStore::exclusionsForRecording(int64_t recordingId)
{
    const char* sql = R"(
        SELECT id, recording_id, start_time, end_time, category
        FROM exclusion_durations
        WHERE recording_id = ?1
        ORDER BY start_time ASC
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(vmcStore, "exclusionsForRecording prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, recordingId);

    std::vector<ExclusionWindow> windows;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        ExclusionWindow window;
        window.id = sqlite3_column_int64(stmt, 0);
        window.recordingId = sqlite3_column_int64(stmt, 1);
        window.startTime = sqlite3_column_double(stmt, 2);
        window.endTime = sqlite3_column_double(stmt, 3);
        const QString category = columnText(stmt, 4);
        const auto parsed = exclusionCategoryFromString(category);
        if (!parsed.has_value()) {
            LOG_WARN(vmcStore, "Unknown exclusion category '%s' on window %lld",
                     qUtf8Printable(category), static_cast<long long>(window.id));
        }
        window.category = parsed.value_or(ExclusionCategory::Nap);
        windows.push_back(window);
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return std::nullopt;
    }
    return windows;
}

// ── Utterances ──────────────────────────────────────────────

std::optional<int64_t> SQLiteStore::insertUtterance(const Utterance& utterance)
{
    const char* sql = R"(
        INSERT INTO utterances (segment_id, start_seconds, end_seconds, duration_seconds,
                                audio_file_name, min_pitch, max_pitch, average_pitch,
                                pitch_range, added_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10)
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(vmcStore, "insertUtterance prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, utterance.segmentId);
    sqlite3_bind_double(stmt, 2, utterance.startSeconds);
    sqlite3_bind_double(stmt, 3, utterance.endSeconds);
    sqlite3_bind_double(stmt, 4, utterance.durationSeconds);
    bindText(stmt, 5, utterance.audioFileName);
    sqlite3_bind_double(stmt, 6, utterance.minPitch);
    sqlite3_bind_double(stmt, 7, utterance.maxPitch);
    sqlite3_bind_double(stmt, 8, utterance.averagePitch);
    sqlite3_bind_double(stmt, 9, utterance.pitchRange);
    sqlite3_bind_double(stmt, 10, nowSeconds());

    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(vmcStore, "insertUtterance step failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(m_db);
}

std::optional<Utterance> SQLiteStore::getUtterance(int64_t utteranceId)
{
    const char* sql = R"(
        SELECT id, segment_id, start_seconds, end_seconds, duration_seconds,
               audio_file_name, min_pitch, max_pitch, average_pitch, pitch_range
        FROM utterances WHERE id = ?1
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, utteranceId);

    std::optional<Utterance> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        Utterance row;
        row.id = sqlite3_column_int64(stmt, 0);
        row.segmentId = sqlite3_column_int64(stmt, 1);
        row.startSeconds = sqlite3_column_double(stmt, 2);
        row.endSeconds = sqlite3_column_double(stmt, 3);
        row.durationSeconds = sqlite3_column_double(stmt, 4);
        row.audioFileName = columnText(stmt, 5);
        row.minPitch = sqlite3_column_double(stmt, 6);
        row.maxPitch = sqlite3_column_double(stmt, 7);
        row.averagePitch = sqlite3_column_double(stmt, 8);
        row.pitchRange = sqlite3_column_double(stmt, 9);
        result = row;
    }
    sqlite3_finalize(stmt);
    return result;
}

std::optional<int> SQLiteStore::utteranceCountForRecording(int64_t recordingId)
{
    const char* sql = R"(
        SELECT COUNT(*)
        FROM utterances u
        JOIN segments s ON u.segment_id = s.id
        WHERE s.recording_id = ?1
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, recordingId);

    std::optional<int> count;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

// ── Coding batches ──────────────────────────────────────────

std::optional<int> SQLiteStore::createCodingBatch(const std::vector<int64_t>& recordingIds)
{
    if (recordingIds.empty()) {
        LOG_WARN(vmcStore, "createCodingBatch called with no recordings");
        return std::nullopt;
    }

    if (!beginImmediateTransaction()) {
        return std::nullopt;
    }
    auto abort = [this]() {
        if (!rollbackTransaction()) {
            LOG_WARN(vmcStore, "createCodingBatch: rollback failed");
        }
    };

    for (int64_t recordingId : recordingIds) {
        if (!getRecording(recordingId).has_value()) {
            LOG_WARN(vmcStore, "createCodingBatch: recording %lld does not exist",
                     static_cast<long long>(recordingId));
            abort();
            return std::nullopt;
        }
        const auto existing = batchGroupForRecording(recordingId);
        if (existing.has_value()) {
            LOG_WARN(vmcStore, "createCodingBatch: recording %lld already in batch group %d",
                     static_cast<long long>(recordingId), *existing);
            abort();
            return std::nullopt;
        }
    }

    int newGroup = 0;
    {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, "SELECT COALESCE(MAX(batch_group), 0) FROM coding_batches",
                               -1, &stmt, nullptr) != SQLITE_OK
            || sqlite3_step(stmt) != SQLITE_ROW) {
            LOG_ERROR(vmcStore, "createCodingBatch: failed to read last group: %s",
                      sqlite3_errmsg(m_db));
            sqlite3_finalize(stmt);
            abort();
            return std::nullopt;
        }
        newGroup = sqlite3_column_int(stmt, 0) + 100;
        sqlite3_finalize(stmt);
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db,
            "INSERT INTO coding_batches (recording_id, batch_group, added_at) VALUES (?1, ?2, ?3)",
            -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(vmcStore, "createCodingBatch prepare failed: %s", sqlite3_errmsg(m_db));
        abort();
        return std::nullopt;
    }

    const double now = nowSeconds();
    for (int64_t recordingId : recordingIds) {
        sqlite3_reset(stmt);
        sqlite3_bind_int64(stmt, 1, recordingId);
        sqlite3_bind_int(stmt, 2, newGroup);
        sqlite3_bind_double(stmt, 3, now);
        if (stepWithRetry(stmt) != SQLITE_DONE) {
            LOG_ERROR(vmcStore, "createCodingBatch insert failed: %s", sqlite3_errmsg(m_db));
            sqlite3_finalize(stmt);
            abort();
            return std::nullopt;
        }
    }
    sqlite3_finalize(stmt);

    if (!commitTransaction()) {
        abort();
        return std::nullopt;
    }

    LOG_INFO(vmcStore, "Created coding batch group %d with %d recordings",
             newGroup, static_cast<int>(recordingIds.size()));
    return newGroup;
}

std::optional<int> SQLiteStore::batchGroupForRecording(int64_t recordingId)
{
    const char* sql = "SELECT batch_group FROM coding_batches WHERE recording_id = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, recordingId);

    std::optional<int> group;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        group = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return group;
}

std::optional<std::vector<int64_t>> SQLiteStore::utteranceIdsForBatchGroup(int batchGroup)
{
    const char* sql = R"(
        SELECT u.id
        FROM utterances u
        JOIN segments s ON u.segment_id = s.id
        JOIN coding_batches b ON b.recording_id = s.recording_id
        WHERE b.batch_group = ?1
        ORDER BY u.id
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(vmcStore, "utteranceIdsForBatchGroup prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    sqlite3_bind_int(stmt, 1, batchGroup);

    std::vector<int64_t> ids;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        ids.push_back(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return std::nullopt;
    }
    return ids;
}

// ── Sample pool ─────────────────────────────────────────────

bool SQLiteStore::insertPoolEntries(int batchGroup, const std::vector<int64_t>& utteranceIds)
{
    const char* sql = R"(
        INSERT INTO sample_pool (utterance_id, batch_group, coder_id, is_processing,
                                 added_at, modified_at)
        VALUES (?1, ?2, NULL, 0, ?3, ?3)
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(vmcStore, "insertPoolEntries prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }

    const double now = nowSeconds();
    bool ok = true;
    for (int64_t utteranceId : utteranceIds) {
        sqlite3_reset(stmt);
        sqlite3_bind_int64(stmt, 1, utteranceId);
        sqlite3_bind_int(stmt, 2, batchGroup);
        sqlite3_bind_double(stmt, 3, now);
        if (stepWithRetry(stmt) != SQLITE_DONE) {
            LOG_ERROR(vmcStore, "insertPoolEntries step failed: %s", sqlite3_errmsg(m_db));
            ok = false;
            break;
        }
    }
    sqlite3_finalize(stmt);
    return ok;
}

std::optional<PoolEntry> SQLiteStore::getPoolEntry(int64_t poolEntryId)
{
    const char* sql = R"(
        SELECT id, utterance_id, batch_group, coder_id, is_processing, claimed_by, claimed_at
        FROM sample_pool WHERE id = ?1
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, poolEntryId);

    std::optional<PoolEntry> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        PoolEntry entry;
        entry.id = sqlite3_column_int64(stmt, 0);
        entry.utteranceId = sqlite3_column_int64(stmt, 1);
        entry.batchGroup = sqlite3_column_int(stmt, 2);
        if (sqlite3_column_type(stmt, 3) != SQLITE_NULL) {
            entry.coderId = sqlite3_column_int64(stmt, 3);
        }
        entry.isProcessing = sqlite3_column_int(stmt, 4) != 0;
        if (sqlite3_column_type(stmt, 5) != SQLITE_NULL) {
            entry.claimedBy = sqlite3_column_int64(stmt, 5);
        }
        if (sqlite3_column_type(stmt, 6) != SQLITE_NULL) {
            entry.claimedAt = sqlite3_column_double(stmt, 6);
        }
        result = entry;
    }
    sqlite3_finalize(stmt);
    return result;
}

std::optional<int> SQLiteStore::poolEntryCount(int batchGroup)
{
    const char* sql = "SELECT COUNT(*) FROM sample_pool WHERE batch_group = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sqlite3_bind_int(stmt, 1, batchGroup);

    std::optional<int> count;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

bool SQLiteStore::completePoolEntry(int64_t poolEntryId, int64_t coderId)
{
    const char* sql = R"(
        UPDATE sample_pool
        SET coder_id = ?2, is_processing = 0, claimed_by = NULL, modified_at = ?3
        WHERE id = ?1 AND is_processing = 1 AND coder_id IS NULL
          AND (claimed_by IS NULL OR claimed_by = ?2)
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(vmcStore, "completePoolEntry prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    sqlite3_bind_int64(stmt, 1, poolEntryId);
    sqlite3_bind_int64(stmt, 2, coderId);
    sqlite3_bind_double(stmt, 3, nowSeconds());
    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(m_db) == 1;
}

std::optional<int> SQLiteStore::releaseClaimsOlderThan(double cutoff)
{
    const char* sql = R"(
        UPDATE sample_pool
        SET is_processing = 0, claimed_by = NULL, claimed_at = NULL, modified_at = ?2
        WHERE is_processing = 1 AND coder_id IS NULL
          AND COALESCE(claimed_at, modified_at) <= ?1
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(vmcStore, "releaseClaimsOlderThan prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    sqlite3_bind_double(stmt, 1, cutoff);
    sqlite3_bind_double(stmt, 2, nowSeconds());
    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(vmcStore, "releaseClaimsOlderThan step failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return sqlite3_changes(m_db);
}

std::optional<SQLiteStore::PoolStats> SQLiteStore::poolStats(int batchGroup, double orphanCutoff)
{
    const char* sql = R"(
        SELECT COUNT(*),
               SUM(CASE WHEN coder_id IS NULL AND is_processing = 0 THEN 1 ELSE 0 END),
               SUM(CASE WHEN is_processing = 1 THEN 1 ELSE 0 END),
               SUM(CASE WHEN coder_id IS NOT NULL THEN 1 ELSE 0 END),
               SUM(CASE WHEN is_processing = 1 AND coder_id IS NULL
                         AND COALESCE(claimed_at, modified_at) <= ?2 THEN 1 ELSE 0 END)
        FROM sample_pool
        WHERE ?1 < 0 OR batch_group = ?1
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(vmcStore, "poolStats prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    sqlite3_bind_int(stmt, 1, batchGroup);
    sqlite3_bind_double(stmt, 2, orphanCutoff);

    std::optional<PoolStats> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        PoolStats stats;
        stats.total = sqlite3_column_int(stmt, 0);
        stats.available = sqlite3_column_int(stmt, 1);
        stats.processing = sqlite3_column_int(stmt, 2);
        stats.completed = sqlite3_column_int(stmt, 3);
        stats.orphaned = sqlite3_column_int(stmt, 4);
        result = stats;
    }
    sqlite3_finalize(stmt);
    return result;
}

std::optional<std::vector<int>> SQLiteStore::batchGroupsInProcess()
{
    const char* sql = R"(
        SELECT DISTINCT batch_group
        FROM sample_pool
        WHERE coder_id IS NULL OR is_processing = 1
        ORDER BY batch_group
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(vmcStore, "batchGroupsInProcess prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }

    std::vector<int> groups;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        groups.push_back(sqlite3_column_int(stmt, 0));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return std::nullopt;
    }
    return groups;
}

// ── Coders / codings ────────────────────────────────────────

std::optional<int64_t> SQLiteStore::insertCoder(const QString& firstName, const QString& lastName)
{
    const char* sql = "INSERT INTO coders (first_name, last_name) VALUES (?1, ?2)";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(vmcStore, "insertCoder prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    bindText(stmt, 1, firstName);
    bindText(stmt, 2, lastName);
    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(vmcStore, "insertCoder step failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(m_db);
}

std::optional<int64_t> SQLiteStore::annotationIdFor(const QString& description)
{
    const char* sql = "SELECT id FROM annotations WHERE description = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    bindText(stmt, 1, description);

    std::optional<int64_t> id;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        id = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return id;
}

std::optional<int64_t> SQLiteStore::insertCoding(const UtteranceCode& code)
{
    const auto annotationId = annotationIdFor(code.annotation);
    if (!annotationId.has_value()) {
        LOG_WARN(vmcStore, "insertCoding: unknown annotation '%s'",
                 qUtf8Printable(code.annotation));
        return std::nullopt;
    }

    const char* sql = R"(
        INSERT INTO utterance_codings (utterance_id, coder_id, annotation_id,
                                       total_syllable_count, canonical_syllable_count,
                                       non_canonical_syllable_count, word_syllable_count,
                                       word_count, comments, added_at, modified_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?10)
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(vmcStore, "insertCoding prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, code.utteranceId);
    sqlite3_bind_int64(stmt, 2, code.coderId);
    sqlite3_bind_int64(stmt, 3, *annotationId);
    sqlite3_bind_int(stmt, 4, code.totalSyllableCount);
    sqlite3_bind_int(stmt, 5, code.canonicalSyllableCount);
    sqlite3_bind_int(stmt, 6, code.nonCanonicalSyllableCount());
    sqlite3_bind_int(stmt, 7, code.wordSyllableCount);
    sqlite3_bind_int(stmt, 8, code.wordCount);
    bindOptionalText(stmt, 9, code.comments);
    sqlite3_bind_double(stmt, 10, nowSeconds());

    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(vmcStore, "insertCoding step failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(m_db);
}

bool SQLiteStore::updateCoding(const UtteranceCode& code)
{
    if (!code.codingId.has_value()) {
        return false;
    }
    const auto annotationId = annotationIdFor(code.annotation);
    if (!annotationId.has_value()) {
        LOG_WARN(vmcStore, "updateCoding: unknown annotation '%s'",
                 qUtf8Printable(code.annotation));
        return false;
    }

    // The coding must stay with the coder and utterance it was created for.
    const char* sql = R"(
        UPDATE utterance_codings
        SET annotation_id = ?4,
            total_syllable_count = ?5,
            canonical_syllable_count = ?6,
            non_canonical_syllable_count = ?7,
            word_syllable_count = ?8,
            word_count = ?9,
            comments = ?10,
            modified_at = ?11
        WHERE id = ?1 AND coder_id = ?2 AND utterance_id = ?3
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(vmcStore, "updateCoding prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    sqlite3_bind_int64(stmt, 1, *code.codingId);
    sqlite3_bind_int64(stmt, 2, code.coderId);
    sqlite3_bind_int64(stmt, 3, code.utteranceId);
    sqlite3_bind_int64(stmt, 4, *annotationId);
    sqlite3_bind_int(stmt, 5, code.totalSyllableCount);
    sqlite3_bind_int(stmt, 6, code.canonicalSyllableCount);
    sqlite3_bind_int(stmt, 7, code.nonCanonicalSyllableCount());
    sqlite3_bind_int(stmt, 8, code.wordSyllableCount);
    sqlite3_bind_int(stmt, 9, code.wordCount);
    bindOptionalText(stmt, 10, code.comments);
    sqlite3_bind_double(stmt, 11, nowSeconds());

    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(m_db) == 1;
}

std::optional<CodingRow> SQLiteStore::getCoding(int64_t codingId)
{
    const QByteArray sql = QByteArray(kCodingSelect) + " WHERE c.id = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, codingId);

    std::optional<CodingRow> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = readCodingRow(stmt);
    }
    sqlite3_finalize(stmt);
    return result;
}

bool SQLiteStore::setCodingAcceptable(int64_t codingId, bool isAcceptable)
{
    const char* sql = "UPDATE utterance_codings SET is_acceptable = ?1, modified_at = ?2 WHERE id = ?3";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    sqlite3_bind_int(stmt, 1, isAcceptable ? 1 : 0);
    sqlite3_bind_double(stmt, 2, nowSeconds());
    sqlite3_bind_int64(stmt, 3, codingId);
    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(m_db) == 1;
}

std::optional<bool> SQLiteStore::hasCoded(int64_t coderId, int64_t utteranceId)
{
    const char* sql = "SELECT 1 FROM utterance_codings WHERE coder_id = ?1 AND utterance_id = ?2";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, coderId);
    sqlite3_bind_int64(stmt, 2, utteranceId);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        return std::nullopt;
    }
    return rc == SQLITE_ROW;
}

std::optional<std::vector<CodingRow>> SQLiteStore::acceptableCodingsForUtterance(int64_t utteranceId)
{
    const QByteArray sql = QByteArray(kCodingSelect)
        + " WHERE c.utterance_id = ?1 AND c.is_acceptable = 1 ORDER BY c.added_at, c.id";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(vmcStore, "acceptableCodingsForUtterance prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, utteranceId);

    std::vector<CodingRow> rows;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        rows.push_back(readCodingRow(stmt));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return std::nullopt;
    }
    return rows;
}

std::optional<std::vector<CodingRow>> SQLiteStore::codingTimeline(std::optional<double> from,
                                                                  std::optional<double> to)
{
    const QByteArray sql = QByteArray(kCodingSelect) + R"(
        WHERE (c.comments IS NULL OR c.comments != ?3)
          AND (?1 IS NULL OR c.added_at >= ?1)
          AND (?2 IS NULL OR c.added_at <= ?2)
        ORDER BY k.first_name, k.last_name, c.coder_id, c.added_at
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(vmcStore, "codingTimeline prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    if (from.has_value()) {
        sqlite3_bind_double(stmt, 1, *from);
    } else {
        sqlite3_bind_null(stmt, 1);
    }
    if (to.has_value()) {
        sqlite3_bind_double(stmt, 2, *to);
    } else {
        sqlite3_bind_null(stmt, 2);
    }
    sqlite3_bind_text(stmt, 3, kLegacyCodeComment, -1, SQLITE_STATIC);

    std::vector<CodingRow> rows;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        rows.push_back(readCodingRow(stmt));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return std::nullopt;
    }
    return rows;
}

// ── Report sources ──────────────────────────────────────────

std::optional<std::vector<int64_t>> SQLiteStore::reportableUtteranceIds(
    const std::vector<int>& excludedBatchGroups)
{
    QByteArray sql = R"(
        SELECT DISTINCT u.id
        FROM utterances u
        JOIN utterance_codings c ON c.utterance_id = u.id
        JOIN segments s ON u.segment_id = s.id
        JOIN recordings r ON s.recording_id = r.id
        WHERE r.is_valid = 1
          AND c.is_acceptable = 1
          AND s.selection_criterion IS NOT NULL
    )";
    if (!excludedBatchGroups.empty()) {
        // Every recording with an entry in an excluded group is left out.
        QByteArray placeholders;
        for (size_t i = 0; i < excludedBatchGroups.size(); ++i) {
            placeholders += (i == 0) ? "?" : ", ?";
        }
        sql += R"(
          AND r.id NOT IN (
              SELECT s2.recording_id
              FROM sample_pool p
              JOIN utterances u2 ON p.utterance_id = u2.id
              JOIN segments s2 ON u2.segment_id = s2.id
              WHERE p.batch_group IN ()" + placeholders + "))";
    }
    sql += "\n        ORDER BY u.id\n";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(vmcStore, "reportableUtteranceIds prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    for (size_t i = 0; i < excludedBatchGroups.size(); ++i) {
        sqlite3_bind_int(stmt, static_cast<int>(i) + 1, excludedBatchGroups[i]);
    }

    std::vector<int64_t> ids;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        ids.push_back(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return std::nullopt;
    }
    return ids;
}

std::optional<UtteranceMetadata> SQLiteStore::utteranceMetadata(int64_t utteranceId)
{
    const char* sql = R"(
        SELECT u.id, r.assessment_id, r.recording_date, p.child_id, p.sex,
               p.date_of_birth, r.age_in_months, p.group_name, s.id,
               s.selection_criterion, u.start_seconds, u.end_seconds,
               u.duration_seconds, u.min_pitch, u.max_pitch, u.average_pitch,
               u.pitch_range
        FROM utterances u
        JOIN segments s ON u.segment_id = s.id
        JOIN recordings r ON s.recording_id = r.id
        JOIN participants p ON r.participant_id = p.id
        WHERE u.id = ?1
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(vmcStore, "utteranceMetadata prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, utteranceId);

    std::optional<UtteranceMetadata> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        UtteranceMetadata row;
        row.utteranceId = sqlite3_column_int64(stmt, 0);
        row.assessmentId = columnText(stmt, 1);
        row.recordingDate = columnText(stmt, 2);
        row.childId = columnText(stmt, 3);
        row.childSex = columnText(stmt, 4);
        row.childDateOfBirth = columnText(stmt, 5);
        row.ageInMonths = sqlite3_column_double(stmt, 6);
        row.childGroup = columnText(stmt, 7);
        row.segmentId = sqlite3_column_int64(stmt, 8);
        row.selectionCriterion = selectionCriterionFromSymbol(columnText(stmt, 9));
        row.startSeconds = sqlite3_column_double(stmt, 10);
        row.endSeconds = sqlite3_column_double(stmt, 11);
        row.durationSeconds = sqlite3_column_double(stmt, 12);
        row.minPitch = sqlite3_column_double(stmt, 13);
        row.maxPitch = sqlite3_column_double(stmt, 14);
        row.averagePitch = sqlite3_column_double(stmt, 15);
        row.pitchRange = sqlite3_column_double(stmt, 16);
        result = row;
    }
    sqlite3_finalize(stmt);
    return result;
}

// ── Settings ────────────────────────────────────────────────

std::optional<QString> SQLiteStore::getSetting(const QString& key)
{
    const char* sql = "SELECT value FROM settings WHERE key = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    bindText(stmt, 1, key);

    std::optional<QString> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = columnText(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return result;
}

bool SQLiteStore::setSetting(const QString& key, const QString& value)
{
    const char* sql = R"(
        INSERT INTO settings (key, value) VALUES (?1, ?2)
        ON CONFLICT(key) DO UPDATE SET value = excluded.value
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    bindText(stmt, 1, key);
    bindText(stmt, 2, value);
    const int rc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

// ── Transactions ────────────────────────────────────────────

bool SQLiteStore::beginTransaction()
{
    return execSql("BEGIN TRANSACTION");
}

bool SQLiteStore::beginImmediateTransaction()
{
    return execSql("BEGIN IMMEDIATE TRANSACTION");
}

bool SQLiteStore::commitTransaction()
{
    return execSql("COMMIT");
}

bool SQLiteStore::rollbackTransaction()
{
    return execSql("ROLLBACK");
}

bool SQLiteStore::integrityCheck() const
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "PRAGMA integrity_check", -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    bool ok = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* result = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        ok = result && QString::fromUtf8(result) == QLatin1String("ok");
    }
    sqlite3_finalize(stmt);
    return ok;
}

} // namespace vmc
