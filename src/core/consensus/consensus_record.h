#pragma once

#include "core/shared/types.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace vmc {

struct NumericFieldConsensus {
    std::optional<int> consensus;
    double agreement = 0.0;
    // Mean over the codes in the reference category.
    std::optional<double> average;
};

struct CategoryFieldConsensus {
    std::optional<QString> consensus;
    double agreement = 0.0;
};

// One denormalized report row: where the utterance came from and what its
// raters agreed on.
struct ConsensusRecord {
    UtteranceMetadata metadata;

    NumericFieldConsensus totalSyllableCount;
    NumericFieldConsensus canonicalSyllableCount;
    NumericFieldConsensus nonCanonicalSyllableCount;
    NumericFieldConsensus wordSyllableCount;
    NumericFieldConsensus wordCount;

    CategoryFieldConsensus utteranceType;
    CategoryFieldConsensus annotation;

    QJsonObject toJson() const;
};

} // namespace vmc
