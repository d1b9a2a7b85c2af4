#include "core/sampling/exclusion_filter.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QStringList>
#include <QTime>

namespace vmc {

namespace {

std::optional<double> parseClockTime(const QDate& date, const QString& text)
{
    const QTime time = QTime::fromString(text.trimmed(), QStringLiteral("h:mm AP"));
    if (!time.isValid()) {
        return std::nullopt;
    }
    return static_cast<double>(QDateTime(date, time).toSecsSinceEpoch());
}

} // namespace

bool ExclusionFilter::overlaps(const TimeWindow& segment, const TimeWindow& exclusion,
                               OverlapPolicy policy)
{
    switch (policy) {
    case OverlapPolicy::AnyIntersection:
        return segment.start < exclusion.end && exclusion.start < segment.end;
    case OverlapPolicy::Containment:
        return exclusion.start <= segment.start && segment.end <= exclusion.end;
    }
    return false;
}

std::vector<Segment> ExclusionFilter::filter(const std::vector<Segment>& candidates,
                                             double recordingStart,
                                             const std::vector<ExclusionWindow>& exclusions,
                                             OverlapPolicy policy)
{
    if (exclusions.empty()) {
        return candidates;
    }

    std::vector<Segment> kept;
    kept.reserve(candidates.size());
    for (const Segment& segment : candidates) {
        const TimeWindow absolute{recordingStart + segment.startSeconds,
                                  recordingStart + segment.endSeconds};
        bool excluded = false;
        for (const ExclusionWindow& window : exclusions) {
            if (overlaps(absolute, TimeWindow{window.startTime, window.endTime}, policy)) {
                excluded = true;
                break;
            }
        }
        if (!excluded) {
            kept.push_back(segment);
        }
    }

    LOG_DEBUG(vmcSampling, "Exclusion filter kept %d of %d segments",
              static_cast<int>(kept.size()), static_cast<int>(candidates.size()));
    return kept;
}

std::optional<std::vector<ExclusionWindow>> ExclusionFilter::parseExclusionWindows(
    const QDate& date, const QString& text, ExclusionCategory category, int64_t recordingId)
{
    std::vector<ExclusionWindow> windows;
    if (!date.isValid()) {
        LOG_WARN(vmcSampling, "Exclusion parse: invalid recording date");
        return std::nullopt;
    }
    if (text.trimmed().isEmpty()) {
        return windows;
    }

    const QStringList ranges = text.split(QLatin1Char(','));
    for (const QString& range : ranges) {
        // Blank entries such as a trailing comma carry no window.
        if (range.trimmed().isEmpty()) {
            continue;
        }
        const QStringList bounds = range.split(QLatin1Char('-'));
        if (bounds.size() != 2) {
            LOG_WARN(vmcSampling, "Exclusion parse: malformed range '%s'",
                     qUtf8Printable(range.trimmed()));
            return std::nullopt;
        }

        const auto start = parseClockTime(date, bounds.at(0));
        const auto end = parseClockTime(date, bounds.at(1));
        if (!start.has_value() || !end.has_value()) {
            LOG_WARN(vmcSampling, "Exclusion parse: unreadable time in '%s'",
                     qUtf8Printable(range.trimmed()));
            return std::nullopt;
        }
        if (*end <= *start) {
            LOG_WARN(vmcSampling, "Exclusion parse: range '%s' does not end after it starts",
                     qUtf8Printable(range.trimmed()));
            return std::nullopt;
        }

        ExclusionWindow window;
        window.recordingId = recordingId;
        window.startTime = *start;
        window.endTime = *end;
        window.category = category;
        windows.push_back(window);
    }
    return windows;
}

} // namespace vmc
