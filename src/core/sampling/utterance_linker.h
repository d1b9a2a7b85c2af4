#pragma once

#include "core/shared/types.h"

#include <QString>

#include <optional>
#include <vector>

namespace vmc {

class SQLiteStore;

struct LinkResult {
    enum class Status {
        Linked,
        AlreadyLinked,
        NoSelectedSegments,
        RecordingNotFound,
        StoreUnavailable,
    };

    Status status = Status::StoreUnavailable;
    int insertedCount = 0;
    std::optional<QString> errorMessage;

    bool isSuccess() const
    {
        return status == Status::Linked || status == Status::AlreadyLinked;
    }
};

// UtteranceLinker — turns the target speaker's vocal events into Utterance
// rows for the selected segments of a recording.
//
// An event belongs to a segment when segment.start <= event.start < segment.end.
// Events outside every selected segment are dropped. Linking is once-only:
// a recording that already has utterances is left untouched.
class UtteranceLinker {
public:
    explicit UtteranceLinker(SQLiteStore& store);

    LinkResult link(int64_t recordingId, const std::vector<VocalEvent>& events);

    static QString audioFileNameFor(const QString& assessmentId, const VocalEvent& event);

private:
    SQLiteStore& m_store;
};

} // namespace vmc
