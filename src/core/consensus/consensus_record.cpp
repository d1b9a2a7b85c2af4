#include "core/consensus/consensus_record.h"

#include <QJsonValue>

namespace vmc {

namespace {

QJsonObject numericToJson(const NumericFieldConsensus& field)
{
    QJsonObject obj;
    obj[QStringLiteral("consensus")] = field.consensus.has_value()
        ? QJsonValue(*field.consensus) : QJsonValue(QJsonValue::Null);
    obj[QStringLiteral("agreement")] = field.agreement;
    obj[QStringLiteral("average")] = field.average.has_value()
        ? QJsonValue(*field.average) : QJsonValue(QJsonValue::Null);
    return obj;
}

QJsonObject categoryToJson(const CategoryFieldConsensus& field)
{
    QJsonObject obj;
    obj[QStringLiteral("consensus")] = field.consensus.has_value()
        ? QJsonValue(*field.consensus) : QJsonValue(QJsonValue::Null);
    obj[QStringLiteral("agreement")] = field.agreement;
    return obj;
}

} // namespace

QJsonObject ConsensusRecord::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("utteranceId")] = static_cast<qint64>(metadata.utteranceId);
    obj[QStringLiteral("assessmentId")] = metadata.assessmentId;
    obj[QStringLiteral("recordingDate")] = metadata.recordingDate;
    obj[QStringLiteral("childId")] = metadata.childId;
    obj[QStringLiteral("childSex")] = metadata.childSex;
    obj[QStringLiteral("childDateOfBirth")] = metadata.childDateOfBirth;
    obj[QStringLiteral("ageInMonths")] = metadata.ageInMonths;
    obj[QStringLiteral("childGroup")] = metadata.childGroup;
    obj[QStringLiteral("segmentId")] = static_cast<qint64>(metadata.segmentId);
    obj[QStringLiteral("selectionCriterion")] =
        selectionCriterionToString(metadata.selectionCriterion);
    obj[QStringLiteral("startSeconds")] = metadata.startSeconds;
    obj[QStringLiteral("endSeconds")] = metadata.endSeconds;
    obj[QStringLiteral("durationSeconds")] = metadata.durationSeconds;
    obj[QStringLiteral("minPitch")] = metadata.minPitch;
    obj[QStringLiteral("maxPitch")] = metadata.maxPitch;
    obj[QStringLiteral("averagePitch")] = metadata.averagePitch;
    obj[QStringLiteral("pitchRange")] = metadata.pitchRange;

    obj[QStringLiteral("totalSyllableCount")] = numericToJson(totalSyllableCount);
    obj[QStringLiteral("canonicalSyllableCount")] = numericToJson(canonicalSyllableCount);
    obj[QStringLiteral("nonCanonicalSyllableCount")] = numericToJson(nonCanonicalSyllableCount);
    obj[QStringLiteral("wordSyllableCount")] = numericToJson(wordSyllableCount);
    obj[QStringLiteral("wordCount")] = numericToJson(wordCount);
    obj[QStringLiteral("utteranceType")] = categoryToJson(utteranceType);
    obj[QStringLiteral("annotation")] = categoryToJson(annotation);
    return obj;
}

} // namespace vmc
