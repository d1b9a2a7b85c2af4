#include "core/consensus/consensus_aggregator.h"
#include "core/consensus/majority_vote.h"
#include "core/store/sqlite_store.h"
#include "core/shared/logging.h"

#include <functional>

namespace vmc {

namespace {

NumericFieldConsensus numericConsensus(const std::vector<CodingRow>& codes,
                                       const std::function<int(const CodingRow&)>& field,
                                       const std::vector<QString>& categories,
                                       int raterCount,
                                       const QString& referenceCategory)
{
    std::vector<int> values;
    values.reserve(codes.size());
    for (const CodingRow& code : codes) {
        values.push_back(field(code));
    }

    NumericFieldConsensus result;
    const auto vote = plurality(values, raterCount);
    if (vote.has_value()) {
        result.consensus = vote->consensus;
        result.agreement = vote->agreement;
    }
    result.average = scopedAverage(values, categories, referenceCategory);
    return result;
}

CategoryFieldConsensus categoryConsensus(const std::vector<QString>& values, int raterCount)
{
    CategoryFieldConsensus result;
    const auto vote = plurality(values, raterCount);
    if (vote.has_value()) {
        result.consensus = vote->consensus;
        result.agreement = vote->agreement;
    }
    return result;
}

ConsensusReport failure(ConsensusReport::Status status, const QString& message)
{
    ConsensusReport report;
    report.status = status;
    report.errorMessage = message;
    return report;
}

} // namespace

ConsensusAggregator::ConsensusAggregator(SQLiteStore& store, int raterCount,
                                         const QString& referenceCategory)
    : m_store(store)
    , m_raterCount(raterCount)
    , m_referenceCategory(referenceCategory)
{
}

std::optional<ConsensusRecord> ConsensusAggregator::reduce(const UtteranceMetadata& metadata,
                                                           const std::vector<CodingRow>& codes,
                                                           int raterCount,
                                                           const QString& referenceCategory)
{
    if (raterCount < 1 || codes.size() != static_cast<size_t>(raterCount)) {
        return std::nullopt;
    }

    std::vector<QString> types;
    std::vector<QString> annotations;
    types.reserve(codes.size());
    annotations.reserve(codes.size());
    for (const CodingRow& code : codes) {
        types.push_back(code.utteranceType);
        annotations.push_back(code.annotation);
    }

    ConsensusRecord record;
    record.metadata = metadata;
    record.totalSyllableCount = numericConsensus(
        codes, [](const CodingRow& c) { return c.totalSyllableCount; },
        types, raterCount, referenceCategory);
    record.canonicalSyllableCount = numericConsensus(
        codes, [](const CodingRow& c) { return c.canonicalSyllableCount; },
        types, raterCount, referenceCategory);
    record.nonCanonicalSyllableCount = numericConsensus(
        codes, [](const CodingRow& c) { return c.nonCanonicalSyllableCount; },
        types, raterCount, referenceCategory);
    record.wordSyllableCount = numericConsensus(
        codes, [](const CodingRow& c) { return c.wordSyllableCount; },
        types, raterCount, referenceCategory);
    record.wordCount = numericConsensus(
        codes, [](const CodingRow& c) { return c.wordCount; },
        types, raterCount, referenceCategory);
    record.utteranceType = categoryConsensus(types, raterCount);
    record.annotation = categoryConsensus(annotations, raterCount);
    return record;
}

ConsensusReport ConsensusAggregator::aggregate(const std::vector<int64_t>& utteranceIds)
{
    if (m_raterCount < 1) {
        LOG_ERROR(vmcConsensus, "aggregate: rater count must be at least 1 (got %d)",
                  m_raterCount);
        return failure(ConsensusReport::Status::ConsistencyError,
                       QStringLiteral("Rater count must be at least 1"));
    }

    std::vector<ConsensusRecord> records;
    records.reserve(utteranceIds.size());

    for (int64_t utteranceId : utteranceIds) {
        const auto codes = m_store.acceptableCodingsForUtterance(utteranceId);
        if (!codes.has_value()) {
            return failure(ConsensusReport::Status::StoreUnavailable,
                           QStringLiteral("Could not load codes for utterance %1").arg(utteranceId));
        }
        if (codes->size() != static_cast<size_t>(m_raterCount)) {
            LOG_ERROR(vmcConsensus, "Utterance %lld has %d acceptable codes, expected %d",
                      static_cast<long long>(utteranceId), static_cast<int>(codes->size()),
                      m_raterCount);
            return failure(ConsensusReport::Status::ConsistencyError,
                           QStringLiteral("Utterance %1 has %2 codes, expected %3")
                               .arg(utteranceId)
                               .arg(codes->size())
                               .arg(m_raterCount));
        }

        const auto metadata = m_store.utteranceMetadata(utteranceId);
        if (!metadata.has_value()) {
            return failure(ConsensusReport::Status::StoreUnavailable,
                           QStringLiteral("Could not load metadata for utterance %1")
                               .arg(utteranceId));
        }

        auto record = reduce(*metadata, *codes, m_raterCount, m_referenceCategory);
        if (!record.has_value()) {
            return failure(ConsensusReport::Status::ConsistencyError,
                           QStringLiteral("Could not reduce codes for utterance %1")
                               .arg(utteranceId));
        }
        records.push_back(std::move(*record));
    }

    LOG_INFO(vmcConsensus, "Aggregated consensus for %d utterances",
             static_cast<int>(records.size()));

    ConsensusReport report;
    report.status = ConsensusReport::Status::Success;
    report.records = std::move(records);
    return report;
}

ConsensusReport ConsensusAggregator::generateReport()
{
    // One read transaction so the report sees a single snapshot.
    if (!m_store.beginTransaction()) {
        return failure(ConsensusReport::Status::StoreUnavailable,
                       QStringLiteral("Could not start report transaction"));
    }

    // A recording is still in process while any entry of its batch group is
    // unassigned or processing.
    const auto inProcess = m_store.batchGroupsInProcess();
    if (!inProcess.has_value()) {
        if (!m_store.rollbackTransaction()) {
            LOG_WARN(vmcConsensus, "generateReport: rollback failed");
        }
        return failure(ConsensusReport::Status::StoreUnavailable,
                       QStringLiteral("Could not load batch groups in process"));
    }
    if (!inProcess->empty()) {
        LOG_INFO(vmcConsensus, "Report skips %d batch groups still in process",
                 static_cast<int>(inProcess->size()));
    }

    const auto utteranceIds = m_store.reportableUtteranceIds(*inProcess);
    if (!utteranceIds.has_value()) {
        if (!m_store.rollbackTransaction()) {
            LOG_WARN(vmcConsensus, "generateReport: rollback failed");
        }
        return failure(ConsensusReport::Status::StoreUnavailable,
                       QStringLiteral("Could not load reportable utterances"));
    }

    ConsensusReport report = aggregate(*utteranceIds);
    if (!m_store.commitTransaction()) {
        LOG_WARN(vmcConsensus, "generateReport: closing read transaction failed");
    }
    return report;
}

} // namespace vmc
