#pragma once

#include "core/shared/types.h"

#include <QDate>
#include <QString>

#include <optional>
#include <vector>

namespace vmc {

enum class OverlapPolicy {
    AnyIntersection, // [s, e) windows sharing any instant
    Containment,     // segment lies wholly inside the exclusion
};

// ExclusionFilter — removes segments that fall in excluded time (naps,
// scrubbed periods) from the sampling candidates.
//
// Segments carry recording-relative seconds; exclusion windows carry epoch
// seconds. filter() shifts each segment by the recording start before
// comparing.
class ExclusionFilter {
public:
    static bool overlaps(const TimeWindow& segment, const TimeWindow& exclusion,
                         OverlapPolicy policy = OverlapPolicy::AnyIntersection);

    // Keeps candidates overlapping no exclusion, in input order.
    static std::vector<Segment> filter(const std::vector<Segment>& candidates,
                                       double recordingStart,
                                       const std::vector<ExclusionWindow>& exclusions,
                                       OverlapPolicy policy = OverlapPolicy::AnyIntersection);

    // Parses operator-entered ranges such as "1:30 PM - 2:45 PM, 4:00 PM - 4:20 PM"
    // on the given recording date (local time). Empty text and blank entries
    // yield no windows.
    // Returns nullopt if any range is malformed or does not end after it starts.
    static std::optional<std::vector<ExclusionWindow>> parseExclusionWindows(
        const QDate& date, const QString& text, ExclusionCategory category,
        int64_t recordingId = 0);
};

} // namespace vmc
