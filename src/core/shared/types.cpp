#include "core/shared/types.h"

namespace vmc {

QString selectionCriterionToSymbol(SelectionCriterion criterion)
{
    switch (criterion) {
    case SelectionCriterion::HighVolubility: return QStringLiteral("HV");
    case SelectionCriterion::RandomSample:   return QStringLiteral("RS");
    case SelectionCriterion::None:           return QString();
    }
    return QString();
}

QString selectionCriterionToString(SelectionCriterion criterion)
{
    switch (criterion) {
    case SelectionCriterion::HighVolubility: return QStringLiteral("high-volubility");
    case SelectionCriterion::RandomSample:   return QStringLiteral("random-sample");
    case SelectionCriterion::None:           return QStringLiteral("none");
    }
    return QStringLiteral("none");
}

SelectionCriterion selectionCriterionFromSymbol(const QString& symbol)
{
    if (symbol == QLatin1String("HV")) return SelectionCriterion::HighVolubility;
    if (symbol == QLatin1String("RS")) return SelectionCriterion::RandomSample;
    return SelectionCriterion::None;
}

QString exclusionCategoryToString(ExclusionCategory category)
{
    switch (category) {
    case ExclusionCategory::Nap:   return QStringLiteral("nap");
    case ExclusionCategory::Scrub: return QStringLiteral("scrub");
    }
    return QStringLiteral("nap");
}

std::optional<ExclusionCategory> exclusionCategoryFromString(const QString& str)
{
    if (str == QLatin1String("nap"))   return ExclusionCategory::Nap;
    if (str == QLatin1String("scrub")) return ExclusionCategory::Scrub;
    return std::nullopt;
}

} // namespace vmc
