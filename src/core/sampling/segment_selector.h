#pragma once

#include "core/shared/types.h"
#include "core/sampling/exclusion_filter.h"

#include <QString>

#include <optional>
#include <vector>

class QRandomGenerator;

namespace vmc {

class SQLiteStore;

struct SelectionResult {
    enum class Status {
        Selected,
        AlreadySelected,         // recording was selected earlier; nothing changed
        InsufficientCandidates,  // fewer eligible segments than requested
        InvalidRequest,
        RecordingNotFound,
        StoreUnavailable,
    };

    Status status = Status::StoreUnavailable;
    std::vector<int64_t> highVolubilityIds;
    std::vector<int64_t> randomSampleIds;
    std::optional<QString> errorMessage;

    bool isSuccess() const
    {
        return status == Status::Selected || status == Status::AlreadySelected;
    }
};

// SegmentSelector — picks the segments of a recording that enter the
// rating pipeline: the most active segments plus a uniform random draw
// from the rest, skipping anything overlapping an exclusion window.
//
// Selection is once-only per recording. A second select() on a recording
// with any selected segment reports AlreadySelected and writes nothing.
class SegmentSelector {
public:
    // rng defaults to QRandomGenerator::global(); tests pass a seeded one.
    explicit SegmentSelector(SQLiteStore& store, QRandomGenerator* rng = nullptr,
                             OverlapPolicy policy = OverlapPolicy::AnyIntersection);

    SelectionResult select(int64_t recordingId, int highVolubilityCount = 10,
                           int randomCount = 20);

    struct Choice {
        std::vector<int64_t> highVolubilityIds;
        std::vector<int64_t> randomSampleIds;
    };

    // Pure selection step. candidates must already be ordered by activity
    // descending. Returns nullopt if there are fewer than hv + random.
    static std::optional<Choice> chooseSegments(const std::vector<Segment>& candidates,
                                                int highVolubilityCount, int randomCount,
                                                QRandomGenerator& rng);

private:
    SelectionResult fail(SelectionResult::Status status, const QString& message);

    SQLiteStore& m_store;
    QRandomGenerator* m_rng = nullptr;
    OverlapPolicy m_policy = OverlapPolicy::AnyIntersection;
};

} // namespace vmc
