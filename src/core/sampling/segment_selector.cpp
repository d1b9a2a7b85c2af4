#include "core/sampling/segment_selector.h"
#include "core/store/sqlite_store.h"
#include "core/shared/logging.h"

#include <QRandomGenerator>

#include <algorithm>
#include <utility>

namespace vmc {

SegmentSelector::SegmentSelector(SQLiteStore& store, QRandomGenerator* rng, OverlapPolicy policy)
    : m_store(store)
    , m_rng(rng ? rng : QRandomGenerator::global())
    , m_policy(policy)
{
}

std::optional<SegmentSelector::Choice> SegmentSelector::chooseSegments(
    const std::vector<Segment>& candidates, int highVolubilityCount, int randomCount,
    QRandomGenerator& rng)
{
    if (highVolubilityCount < 0 || randomCount < 0) {
        return std::nullopt;
    }
    const size_t needed = static_cast<size_t>(highVolubilityCount)
        + static_cast<size_t>(randomCount);
    if (candidates.size() < needed) {
        return std::nullopt;
    }

    Choice choice;
    choice.highVolubilityIds.reserve(static_cast<size_t>(highVolubilityCount));
    for (int i = 0; i < highVolubilityCount; ++i) {
        choice.highVolubilityIds.push_back(candidates[static_cast<size_t>(i)].id);
    }

    std::vector<int64_t> remainder;
    remainder.reserve(candidates.size() - static_cast<size_t>(highVolubilityCount));
    for (size_t i = static_cast<size_t>(highVolubilityCount); i < candidates.size(); ++i) {
        remainder.push_back(candidates[i].id);
    }

    // Partial Fisher-Yates: the first randomCount slots become a uniform
    // draw without replacement.
    const int remaining = static_cast<int>(remainder.size());
    for (int i = 0; i < randomCount; ++i) {
        const int j = i + static_cast<int>(rng.bounded(remaining - i));
        std::swap(remainder[static_cast<size_t>(i)], remainder[static_cast<size_t>(j)]);
    }
    choice.randomSampleIds.assign(remainder.begin(), remainder.begin() + randomCount);
    return choice;
}

SelectionResult SegmentSelector::fail(SelectionResult::Status status, const QString& message)
{
    SelectionResult result;
    result.status = status;
    result.errorMessage = message;
    return result;
}

SelectionResult SegmentSelector::select(int64_t recordingId, int highVolubilityCount,
                                        int randomCount)
{
    if (highVolubilityCount < 0 || randomCount < 0) {
        LOG_WARN(vmcSampling, "select: negative counts requested (hv=%d, random=%d)",
                 highVolubilityCount, randomCount);
        return fail(SelectionResult::Status::InvalidRequest,
                    QStringLiteral("Segment counts must not be negative"));
    }

    // Every read happens under the write lock so two selectors racing on the
    // same recording cannot both pass the already-selected check.
    if (!m_store.beginImmediateTransaction()) {
        return fail(SelectionResult::Status::StoreUnavailable,
                    QStringLiteral("Could not start selection transaction"));
    }

    auto abort = [this](SelectionResult::Status status, const QString& message) {
        if (!m_store.rollbackTransaction()) {
            LOG_WARN(vmcSampling, "select: rollback failed");
        }
        return fail(status, message);
    };

    const auto recording = m_store.getRecording(recordingId);
    if (!recording.has_value()) {
        LOG_WARN(vmcSampling, "select: recording %lld not found",
                 static_cast<long long>(recordingId));
        return abort(SelectionResult::Status::RecordingNotFound,
                     QStringLiteral("Recording %1 not found").arg(recordingId));
    }

    const auto segments = m_store.segmentsForRecording(recordingId);
    if (!segments.has_value()) {
        return abort(SelectionResult::Status::StoreUnavailable,
                     QStringLiteral("Could not load segments"));
    }

    const bool alreadySelected = std::any_of(segments->begin(), segments->end(),
                                             [](const Segment& s) { return s.isSelected; });
    if (alreadySelected) {
        LOG_INFO(vmcSampling, "Recording %s already has selected segments",
                 qUtf8Printable(recording->assessmentId));
        if (!m_store.rollbackTransaction()) {
            LOG_WARN(vmcSampling, "select: rollback failed");
        }
        SelectionResult result;
        result.status = SelectionResult::Status::AlreadySelected;
        for (const Segment& segment : *segments) {
            if (segment.criterion == SelectionCriterion::HighVolubility) {
                result.highVolubilityIds.push_back(segment.id);
            } else if (segment.criterion == SelectionCriterion::RandomSample) {
                result.randomSampleIds.push_back(segment.id);
            }
        }
        return result;
    }

    const auto exclusions = m_store.exclusionsForRecording(recordingId);
    if (!exclusions.has_value()) {
        return abort(SelectionResult::Status::StoreUnavailable,
                     QStringLiteral("Could not load exclusion windows"));
    }

    const std::vector<Segment> candidates =
        ExclusionFilter::filter(*segments, recording->startTime, *exclusions, m_policy);

    const auto choice = chooseSegments(candidates, highVolubilityCount, randomCount, *m_rng);
    if (!choice.has_value()) {
        const qint64 required = static_cast<qint64>(highVolubilityCount) + randomCount;
        LOG_WARN(vmcSampling, "Recording %s has %d eligible segments, %lld required",
                 qUtf8Printable(recording->assessmentId),
                 static_cast<int>(candidates.size()), static_cast<long long>(required));
        return abort(SelectionResult::Status::InsufficientCandidates,
                     QStringLiteral("%1 eligible segments, %2 required")
                         .arg(candidates.size())
                         .arg(required));
    }

    std::vector<std::pair<int64_t, SelectionCriterion>> marks;
    marks.reserve(choice->highVolubilityIds.size() + choice->randomSampleIds.size());
    for (int64_t id : choice->highVolubilityIds) {
        marks.emplace_back(id, SelectionCriterion::HighVolubility);
    }
    for (int64_t id : choice->randomSampleIds) {
        marks.emplace_back(id, SelectionCriterion::RandomSample);
    }

    if (!m_store.markSegmentsSelected(marks)) {
        return abort(SelectionResult::Status::StoreUnavailable,
                     QStringLiteral("Could not persist selection"));
    }

    if (!m_store.commitTransaction()) {
        return abort(SelectionResult::Status::StoreUnavailable,
                     QStringLiteral("Could not commit selection"));
    }

    LOG_INFO(vmcSampling, "Selected %d HV and %d RS segments for recording %s",
             static_cast<int>(choice->highVolubilityIds.size()),
             static_cast<int>(choice->randomSampleIds.size()),
             qUtf8Printable(recording->assessmentId));

    SelectionResult result;
    result.status = SelectionResult::Status::Selected;
    result.highVolubilityIds = choice->highVolubilityIds;
    result.randomSampleIds = choice->randomSampleIds;
    return result;
}

} // namespace vmc
