#include "core/pool/sqlite_atomic_claim.h"
#include "core/store/sqlite_store.h"
#include "core/shared/logging.h"

#include <QThread>

#include <sqlite3.h>

namespace vmc {

namespace {

// Eligible: idle, unassigned, and for an utterance the coder has neither
// completed, coded, nor currently holds.
constexpr const char* kSelectEligible = R"(
    SELECT p.id, p.utterance_id, u.duration_seconds, u.audio_file_name
    FROM sample_pool p
    JOIN utterances u ON p.utterance_id = u.id
    WHERE p.is_processing = 0
      AND p.coder_id IS NULL
      AND p.utterance_id NOT IN (
          SELECT utterance_id FROM sample_pool
          WHERE coder_id = ?1 OR (is_processing = 1 AND claimed_by = ?1)
          UNION
          SELECT utterance_id FROM utterance_codings WHERE coder_id = ?1)
    ORDER BY p.id
    LIMIT 1
)";

constexpr const char* kMarkProcessing = R"(
    UPDATE sample_pool
    SET is_processing = 1, claimed_by = ?2, claimed_at = ?3, modified_at = ?3
    WHERE id = ?1 AND is_processing = 0 AND coder_id IS NULL
)";

} // namespace

SqliteAtomicClaim::SqliteAtomicClaim(sqlite3* db, int maxAttempts)
    : m_db(db)
    , m_maxAttempts(maxAttempts > 0 ? maxAttempts : 1)
{
}

bool SqliteAtomicClaim::beginImmediate()
{
    int rc = SQLITE_BUSY;
    for (int attempt = 0; attempt < m_maxAttempts && (rc == SQLITE_BUSY || rc == SQLITE_LOCKED);
         ++attempt) {
        if (attempt > 0) {
            QThread::msleep(50 * attempt);
        }
        rc = sqlite3_exec(m_db, "BEGIN IMMEDIATE TRANSACTION", nullptr, nullptr, nullptr);
    }
    if (rc != SQLITE_OK) {
        LOG_ERROR(vmcPool, "Claim could not take the write lock: %s", sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

void SqliteAtomicClaim::rollback()
{
    char* errMsg = nullptr;
    if (sqlite3_exec(m_db, "ROLLBACK", nullptr, nullptr, &errMsg) != SQLITE_OK) {
        LOG_WARN(vmcPool, "Claim rollback failed: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
    }
}

ClaimOutcome SqliteAtomicClaim::claim(int64_t coderId, double nowSecs)
{
    ClaimOutcome outcome;
    if (!m_db) {
        LOG_ERROR(vmcPool, "SqliteAtomicClaim::claim called with null DB");
        return outcome;
    }

    if (!beginImmediate()) {
        return outcome;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSelectEligible, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(vmcPool, "Claim select prepare failed: %s", sqlite3_errmsg(m_db));
        rollback();
        return outcome;
    }
    sqlite3_bind_int64(stmt, 1, coderId);

    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(stmt);
        rollback();
        outcome.status = ClaimOutcome::Status::NoWork;
        return outcome;
    }
    if (rc != SQLITE_ROW) {
        LOG_ERROR(vmcPool, "Claim select failed: %s", sqlite3_errmsg(m_db));
        sqlite3_finalize(stmt);
        rollback();
        return outcome;
    }

    ClaimedSample sample;
    sample.poolEntryId = sqlite3_column_int64(stmt, 0);
    sample.utteranceId = sqlite3_column_int64(stmt, 1);
    sample.durationSeconds = sqlite3_column_double(stmt, 2);
    const char* fileName = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 3));
    sample.audioFileName = fileName ? QString::fromUtf8(fileName) : QString();
    sqlite3_finalize(stmt);

    stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kMarkProcessing, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(vmcPool, "Claim update prepare failed: %s", sqlite3_errmsg(m_db));
        rollback();
        return outcome;
    }
    sqlite3_bind_int64(stmt, 1, sample.poolEntryId);
    sqlite3_bind_int64(stmt, 2, coderId);
    sqlite3_bind_double(stmt, 3, nowSecs);

    const int updateRc = stepWithRetry(stmt);
    sqlite3_finalize(stmt);
    if (updateRc != SQLITE_DONE || sqlite3_changes(m_db) != 1) {
        LOG_ERROR(vmcPool, "Claim compare-and-set failed for entry %lld: %s",
                  static_cast<long long>(sample.poolEntryId), sqlite3_errmsg(m_db));
        rollback();
        return outcome;
    }

    char* errMsg = nullptr;
    if (sqlite3_exec(m_db, "COMMIT", nullptr, nullptr, &errMsg) != SQLITE_OK) {
        LOG_ERROR(vmcPool, "Claim commit failed: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        rollback();
        return outcome;
    }

    LOG_DEBUG(vmcPool, "Coder %lld claimed pool entry %lld (utterance %lld)",
              static_cast<long long>(coderId), static_cast<long long>(sample.poolEntryId),
              static_cast<long long>(sample.utteranceId));
    outcome.status = ClaimOutcome::Status::Claimed;
    outcome.sample = sample;
    return outcome;
}

} // namespace vmc
