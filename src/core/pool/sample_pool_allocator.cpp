#include "core/pool/sample_pool_allocator.h"
#include "core/pool/sqlite_atomic_claim.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QRandomGenerator>

#include <utility>

namespace vmc {

namespace {

double nowSeconds()
{
    return static_cast<double>(QDateTime::currentMSecsSinceEpoch()) / 1000.0;
}

bool validCounts(const UtteranceCode& code)
{
    return code.totalSyllableCount >= 0
        && code.canonicalSyllableCount >= 0
        && code.wordSyllableCount >= 0
        && code.wordCount >= 0
        && code.canonicalSyllableCount <= code.totalSyllableCount;
}

} // namespace

SamplePoolAllocator::SamplePoolAllocator(SQLiteStore& store,
                                         std::unique_ptr<AtomicClaim> claim,
                                         QRandomGenerator* rng)
    : m_store(store)
    , m_claim(std::move(claim))
    , m_rng(rng ? rng : QRandomGenerator::global())
{
    if (!m_claim) {
        m_claim = std::make_unique<SqliteAtomicClaim>(m_store.rawDb());
    }
}

void SamplePoolAllocator::rollback()
{
    if (!m_store.rollbackTransaction()) {
        LOG_WARN(vmcPool, "Pool rollback failed");
    }
}

std::optional<int> SamplePoolAllocator::createBatch(const std::vector<int64_t>& recordingIds)
{
    return m_store.createCodingBatch(recordingIds);
}

bool SamplePoolAllocator::expand(int batchGroup, int coderCount)
{
    if (coderCount < 1) {
        LOG_WARN(vmcPool, "expand: coder count must be at least 1 (got %d)", coderCount);
        return false;
    }

    if (!m_store.beginImmediateTransaction()) {
        return false;
    }

    const auto existing = m_store.poolEntryCount(batchGroup);
    if (!existing.has_value()) {
        rollback();
        return false;
    }
    if (*existing > 0) {
        LOG_WARN(vmcPool, "expand: batch group %d already has %d pool entries",
                 batchGroup, *existing);
        rollback();
        return false;
    }

    const auto utteranceIds = m_store.utteranceIdsForBatchGroup(batchGroup);
    if (!utteranceIds.has_value()) {
        rollback();
        return false;
    }
    if (utteranceIds->empty()) {
        LOG_WARN(vmcPool, "expand: batch group %d has no utterances", batchGroup);
        rollback();
        return false;
    }

    std::vector<int64_t> entries;
    entries.reserve(utteranceIds->size() * static_cast<size_t>(coderCount));
    for (int64_t utteranceId : *utteranceIds) {
        for (int i = 0; i < coderCount; ++i) {
            entries.push_back(utteranceId);
        }
    }

    // Fisher-Yates over the whole group so raters see utterances from all
    // recordings interleaved.
    for (size_t i = entries.size(); i > 1; --i) {
        const size_t j = static_cast<size_t>(m_rng->bounded(static_cast<quint32>(i)));
        std::swap(entries[i - 1], entries[j]);
    }

    if (!m_store.insertPoolEntries(batchGroup, entries)) {
        rollback();
        return false;
    }

    if (!m_store.commitTransaction()) {
        rollback();
        return false;
    }

    LOG_INFO(vmcPool, "Expanded batch group %d: %d utterances x %d coders",
             batchGroup, static_cast<int>(utteranceIds->size()), coderCount);
    return true;
}

std::optional<ClaimedSample> SamplePoolAllocator::claimNext(int64_t coderId)
{
    if (m_claimLeaseSeconds > 0) {
        const auto released = releaseStaleClaims(m_claimLeaseSeconds);
        if (!released.has_value()) {
            LOG_WARN(vmcPool, "claimNext: could not release expired claims");
        }
    }

    const ClaimOutcome outcome = m_claim->claim(coderId, nowSeconds());
    switch (outcome.status) {
    case ClaimOutcome::Status::Claimed:
        return outcome.sample;
    case ClaimOutcome::Status::NoWork:
        LOG_DEBUG(vmcPool, "No work available for coder %lld", static_cast<long long>(coderId));
        return std::nullopt;
    case ClaimOutcome::Status::StoreUnavailable:
        LOG_ERROR(vmcPool, "claimNext failed for coder %lld", static_cast<long long>(coderId));
        return std::nullopt;
    }
    return std::nullopt;
}

bool SamplePoolAllocator::submit(int64_t poolEntryId, const UtteranceCode& code)
{
    if (!validCounts(code)) {
        LOG_WARN(vmcPool, "submit: rejected counts for entry %lld (total=%d canonical=%d)",
                 static_cast<long long>(poolEntryId), code.totalSyllableCount,
                 code.canonicalSyllableCount);
        return false;
    }
    return code.codingId.has_value() ? submitRevision(poolEntryId, code)
                                     : submitNew(poolEntryId, code);
}

bool SamplePoolAllocator::submitNew(int64_t poolEntryId, const UtteranceCode& code)
{
    if (!m_store.beginImmediateTransaction()) {
        return false;
    }

    const auto entry = m_store.getPoolEntry(poolEntryId);
    if (!entry.has_value()) {
        LOG_WARN(vmcPool, "submit: pool entry %lld not found", static_cast<long long>(poolEntryId));
        rollback();
        return false;
    }
    if (entry->utteranceId != code.utteranceId) {
        LOG_WARN(vmcPool, "submit: entry %lld is for utterance %lld, code is for %lld",
                 static_cast<long long>(poolEntryId), static_cast<long long>(entry->utteranceId),
                 static_cast<long long>(code.utteranceId));
        rollback();
        return false;
    }
    if (!entry->isProcessing || entry->coderId.has_value()) {
        LOG_WARN(vmcPool, "submit: entry %lld is not awaiting a code",
                 static_cast<long long>(poolEntryId));
        rollback();
        return false;
    }

    const auto alreadyCoded = m_store.hasCoded(code.coderId, code.utteranceId);
    if (!alreadyCoded.has_value()) {
        rollback();
        return false;
    }
    if (*alreadyCoded) {
        LOG_WARN(vmcPool, "submit: coder %lld already coded utterance %lld",
                 static_cast<long long>(code.coderId), static_cast<long long>(code.utteranceId));
        rollback();
        return false;
    }

    if (!m_store.completePoolEntry(poolEntryId, code.coderId)) {
        LOG_WARN(vmcPool, "submit: entry %lld is held by another coder",
                 static_cast<long long>(poolEntryId));
        rollback();
        return false;
    }

    if (!m_store.insertCoding(code).has_value()) {
        rollback();
        return false;
    }

    if (!m_store.commitTransaction()) {
        rollback();
        return false;
    }

    LOG_DEBUG(vmcPool, "Coder %lld completed pool entry %lld",
              static_cast<long long>(code.coderId), static_cast<long long>(poolEntryId));
    return true;
}

bool SamplePoolAllocator::submitRevision(int64_t poolEntryId, const UtteranceCode& code)
{
    if (!m_store.beginImmediateTransaction()) {
        return false;
    }

    const auto entry = m_store.getPoolEntry(poolEntryId);
    const auto coding = m_store.getCoding(*code.codingId);
    if (!entry.has_value() || !coding.has_value()) {
        LOG_WARN(vmcPool, "submit: revision target not found (entry %lld, coding %lld)",
                 static_cast<long long>(poolEntryId), static_cast<long long>(*code.codingId));
        rollback();
        return false;
    }

    const bool sameCoder = coding->coderId == code.coderId
        && entry->coderId.has_value() && *entry->coderId == code.coderId;
    const bool sameUtterance = coding->utteranceId == code.utteranceId
        && entry->utteranceId == code.utteranceId;
    if (!sameCoder || !sameUtterance) {
        LOG_WARN(vmcPool, "submit: coding %lld does not belong to coder %lld on entry %lld",
                 static_cast<long long>(*code.codingId), static_cast<long long>(code.coderId),
                 static_cast<long long>(poolEntryId));
        rollback();
        return false;
    }

    if (!m_store.updateCoding(code)) {
        rollback();
        return false;
    }

    if (!m_store.commitTransaction()) {
        rollback();
        return false;
    }

    LOG_DEBUG(vmcPool, "Coder %lld revised coding %lld",
              static_cast<long long>(code.coderId), static_cast<long long>(*code.codingId));
    return true;
}

std::optional<int> SamplePoolAllocator::releaseStaleClaims(int64_t olderThanSeconds)
{
    if (olderThanSeconds < 0) {
        LOG_WARN(vmcPool, "releaseStaleClaims: negative age %lld",
                 static_cast<long long>(olderThanSeconds));
        return std::nullopt;
    }

    const auto released =
        m_store.releaseClaimsOlderThan(nowSeconds() - static_cast<double>(olderThanSeconds));
    if (released.has_value() && *released > 0) {
        LOG_INFO(vmcPool, "Released %d stale claims older than %lld s",
                 *released, static_cast<long long>(olderThanSeconds));
    }
    return released;
}

std::optional<SQLiteStore::PoolStats> SamplePoolAllocator::stats(int batchGroup,
                                                                 int64_t orphanAfterSeconds)
{
    return m_store.poolStats(batchGroup,
                             nowSeconds() - static_cast<double>(orphanAfterSeconds));
}

} // namespace vmc
