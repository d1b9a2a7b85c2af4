#pragma once

#include "core/pool/atomic_claim.h"
#include "core/shared/types.h"
#include "core/store/sqlite_store.h"

#include <memory>
#include <optional>
#include <vector>

class QRandomGenerator;

namespace vmc {

// Claims still processing after this long are reported as orphaned.
constexpr int64_t kOrphanedClaimSeconds = 3600;

// SamplePoolAllocator — the shared work queue raters pull utterances from.
//
// expand() turns every utterance of a batch group into coderCount
// unassigned entries in one shuffled bulk insert. Raters then cycle through
// claimNext() and submit(). An entry moves
//   unassigned/idle -> unassigned/processing -> assigned/idle
// and is never deleted. A rater is never handed an utterance they have
// already coded or are holding.
class SamplePoolAllocator {
public:
    // claim defaults to SqliteAtomicClaim on the store's connection; rng
    // defaults to QRandomGenerator::global().
    explicit SamplePoolAllocator(SQLiteStore& store,
                                 std::unique_ptr<AtomicClaim> claim = nullptr,
                                 QRandomGenerator* rng = nullptr);

    // When > 0, claimNext() first releases claims older than this.
    void setClaimLeaseSeconds(int64_t seconds) { m_claimLeaseSeconds = seconds; }
    int64_t claimLeaseSeconds() const { return m_claimLeaseSeconds; }

    std::optional<int> createBatch(const std::vector<int64_t>& recordingIds);

    // Refuses groups that already have entries, and groups with nothing to code.
    bool expand(int batchGroup, int coderCount = 3);

    // nullopt when no eligible entry exists or the store fails; never blocks
    // waiting for work.
    std::optional<ClaimedSample> claimNext(int64_t coderId);

    // A code without codingId completes the claimed entry and inserts one
    // coding. A code with codingId revises that coding, which must belong to
    // the same coder. Returns false, with nothing written, otherwise.
    bool submit(int64_t poolEntryId, const UtteranceCode& code);

    // Returns the number of entries released.
    std::optional<int> releaseStaleClaims(int64_t olderThanSeconds);

    // batchGroup < 0 reports every group.
    std::optional<SQLiteStore::PoolStats> stats(int batchGroup = -1,
                                                int64_t orphanAfterSeconds = kOrphanedClaimSeconds);

private:
    bool submitNew(int64_t poolEntryId, const UtteranceCode& code);
    bool submitRevision(int64_t poolEntryId, const UtteranceCode& code);
    void rollback();

    SQLiteStore& m_store;
    std::unique_ptr<AtomicClaim> m_claim;
    QRandomGenerator* m_rng = nullptr;
    int64_t m_claimLeaseSeconds = 0;
};

} // namespace vmc
