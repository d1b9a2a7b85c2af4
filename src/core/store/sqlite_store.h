#pragma once

#include "core/shared/types.h"
#include <QString>
#include <optional>
#include <utility>
#include <vector>
#include <cstdint>

#include <sqlite3.h>

namespace vmc {

// SQLiteStore — owner of one SQLite connection to the coding database.
//
// One instance per thread. Rater sessions that run concurrently each open
// their own store on the same file; cross-connection exclusivity comes from
// SQLite's write lock (BEGIN IMMEDIATE), never from in-process locking.
//
// Read methods return std::nullopt when the store itself fails, so callers
// can tell "no rows" apart from "store unavailable".
class SQLiteStore {
public:
    ~SQLiteStore();

    // Move-only (owns sqlite3* handle)
    SQLiteStore(SQLiteStore&& other) noexcept : m_db(other.m_db) { other.m_db = nullptr; }
    SQLiteStore& operator=(SQLiteStore&& other) noexcept {
        if (this != &other) {
            if (m_db) sqlite3_close(m_db);
            m_db = other.m_db;
            other.m_db = nullptr;
        }
        return *this;
    }
    SQLiteStore(const SQLiteStore&) = delete;
    SQLiteStore& operator=(const SQLiteStore&) = delete;

    // Open or create the database at the given path.
    // Creates schema, seeds lookups and applies migrations on open.
    static std::optional<SQLiteStore> open(const QString& dbPath);

    // ── Participants / recordings ───────────────────────────

    std::optional<int64_t> insertParticipant(const QString& childId,
                                             const QString& sex,
                                             const QString& dateOfBirth,
                                             const QString& groupName);

    struct RecordingRow {
        int64_t id = 0;
        int64_t participantId = 0;
        QString assessmentId;
        QString recordingDate;
        double ageInMonths = 0.0;
        // Absolute start of the recording, epoch seconds.
        double startTime = 0.0;
        bool isValid = true;
    };

    std::optional<int64_t> insertRecording(const RecordingRow& recording);
    std::optional<RecordingRow> getRecording(int64_t recordingId);
    bool setRecordingValid(int64_t recordingId, bool isValid);

    // ── Segments ────────────────────────────────────────────

    std::optional<int64_t> insertSegment(int64_t recordingId,
                                         double startSeconds,
                                         double endSeconds,
                                         int activityCount);

    // All segments of a recording, activity descending, id ascending.
    std::optional<std::vector<Segment>> segmentsForRecording(int64_t recordingId);
    std::optional<std::vector<Segment>> selectedSegmentsForRecording(int64_t recordingId);

    // Marks each segment selected with its criterion. Only rows that are not
    // yet selected are touched; returns false unless every row was updated.
    // Must run inside a transaction owned by the caller.
    bool markSegmentsSelected(
        const std::vector<std::pair<int64_t, SelectionCriterion>>& selections);

    // ── Exclusions ──────────────────────────────────────────

    std::optional<int64_t> insertExclusion(const ExclusionWindow& window);
    std::optional<std::vector<ExclusionWindow>> exclusionsForRecording(int64_t recordingId);

    // ── Utterances ──────────────────────────────────────────

    std::optional<int64_t> insertUtterance(const Utterance& utterance);
    std::optional<Utterance> getUtterance(int64_t utteranceId);
    std::optional<int> utteranceCountForRecording(int64_t recordingId);

    // ── Coding batches ──────────────────────────────────────

    // Records the recordings as one new batch group and returns its number
    // (max existing + 100; the first group is 100). Returns nullopt if any
    // recording is unknown or already batched.
    std::optional<int> createCodingBatch(const std::vector<int64_t>& recordingIds);
    std::optional<int> batchGroupForRecording(int64_t recordingId);
    std::optional<std::vector<int64_t>> utteranceIdsForBatchGroup(int batchGroup);

    // ── Sample pool ─────────────────────────────────────────

    // Inserts one unassigned entry per element, in order.
    // Must run inside a transaction owned by the caller.
    bool insertPoolEntries(int batchGroup, const std::vector<int64_t>& utteranceIds);

    std::optional<PoolEntry> getPoolEntry(int64_t poolEntryId);
    std::optional<int> poolEntryCount(int batchGroup);

    // Compare-and-set: processing+unassigned -> assigned+idle. The entry must
    // be claimed by coderId (or by nobody, for claims older than the claim
    // owner column). Returns true only if exactly this transition happened.
    bool completePoolEntry(int64_t poolEntryId, int64_t coderId);

    // Clears the processing flag on unassigned entries claimed at or before
    // cutoff. Returns the number of released entries.
    std::optional<int> releaseClaimsOlderThan(double cutoff);

    struct PoolStats {
        int total = 0;
        int available = 0;
        int processing = 0;
        int completed = 0;
        // Processing entries whose claim is at or before the orphan cutoff.
        int orphaned = 0;
    };

    // batchGroup < 0 means all groups.
    std::optional<PoolStats> poolStats(int batchGroup, double orphanCutoff);

    // Batch groups with at least one entry that is unassigned or processing.
    std::optional<std::vector<int>> batchGroupsInProcess();

    // ── Coders / codings ────────────────────────────────────

    std::optional<int64_t> insertCoder(const QString& firstName, const QString& lastName);
    std::optional<int64_t> annotationIdFor(const QString& description);

    std::optional<int64_t> insertCoding(const UtteranceCode& code);
    // Rewrites the coding identified by code.codingId.
    bool updateCoding(const UtteranceCode& code);
    std::optional<CodingRow> getCoding(int64_t codingId);
    bool setCodingAcceptable(int64_t codingId, bool isAcceptable);
    std::optional<bool> hasCoded(int64_t coderId, int64_t utteranceId);

    // Codings that count towards consensus for one utterance, oldest first.
    std::optional<std::vector<CodingRow>> acceptableCodingsForUtterance(int64_t utteranceId);

    // Non-legacy codings within [from, to] (either bound may be absent),
    // ordered by coder name, coder id, then time.
    std::optional<std::vector<CodingRow>> codingTimeline(std::optional<double> from,
                                                         std::optional<double> to);

    // ── Report sources ──────────────────────────────────────

    // Utterances with acceptable codes on selected segments of valid
    // recordings, ordered by id. Recordings with any pool entry in
    // excludedBatchGroups are skipped.
    std::optional<std::vector<int64_t>> reportableUtteranceIds(
        const std::vector<int>& excludedBatchGroups = {});
    std::optional<UtteranceMetadata> utteranceMetadata(int64_t utteranceId);

    // ── Settings ────────────────────────────────────────────

    std::optional<QString> getSetting(const QString& key);
    bool setSetting(const QString& key, const QString& value);

    // ── Transactions ────────────────────────────────────────

    bool beginTransaction();
    // Takes the database write lock up front.
    bool beginImmediateTransaction();
    bool commitTransaction();
    bool rollbackTransaction();

    // Returns true if database passes PRAGMA integrity_check
    bool integrityCheck() const;

    sqlite3* rawDb() const { return m_db; }

private:
    SQLiteStore() = default;
    bool init(const QString& dbPath);
    bool execSql(const char* sql);

    sqlite3* m_db = nullptr;
};

// Steps a prepared statement, retrying SQLITE_BUSY/SQLITE_LOCKED with a
// short backoff. Returns the final sqlite3_step() result.
int stepWithRetry(sqlite3_stmt* stmt, int maxAttempts = 5);

} // namespace vmc
