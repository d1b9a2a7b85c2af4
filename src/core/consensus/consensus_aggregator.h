#pragma once

#include "core/consensus/consensus_record.h"
#include "core/shared/types.h"

#include <QString>

#include <optional>
#include <vector>

namespace vmc {

class SQLiteStore;

struct ConsensusReport {
    enum class Status {
        Success,
        ConsistencyError,  // some utterance lacks exactly raterCount codes
        StoreUnavailable,
    };

    Status status = Status::StoreUnavailable;
    std::optional<QString> errorMessage;
    // Empty unless status is Success.
    std::vector<ConsensusRecord> records;
};

// ConsensusAggregator — reduces the independent codes of each utterance to
// one report row. Read-only against the store.
class ConsensusAggregator {
public:
    explicit ConsensusAggregator(SQLiteStore& store, int raterCount = 3,
                                 const QString& referenceCategory = QStringLiteral("Speech"));

    // All-or-nothing: one utterance with the wrong number of acceptable
    // codes fails the whole run.
    ConsensusReport aggregate(const std::vector<int64_t>& utteranceIds);

    // Aggregates every utterance on a valid recording whose batch has no
    // unassigned or processing entries left.
    ConsensusReport generateReport();

    // Pure reduction of one utterance's codes. nullopt unless codes holds
    // exactly raterCount rows.
    static std::optional<ConsensusRecord> reduce(const UtteranceMetadata& metadata,
                                                 const std::vector<CodingRow>& codes,
                                                 int raterCount,
                                                 const QString& referenceCategory);

private:
    SQLiteStore& m_store;
    int m_raterCount = 3;
    QString m_referenceCategory;
};

} // namespace vmc
