#include "core/sampling/utterance_linker.h"
#include "core/store/sqlite_store.h"
#include "core/shared/logging.h"

#include <cmath>

namespace vmc {

namespace {

double roundTo4(double value)
{
    return std::round(value * 10000.0) / 10000.0;
}

} // namespace

UtteranceLinker::UtteranceLinker(SQLiteStore& store)
    : m_store(store)
{
}

QString UtteranceLinker::audioFileNameFor(const QString& assessmentId, const VocalEvent& event)
{
    return QStringLiteral("%1_%2_%3.mp3")
        .arg(assessmentId, QString::number(event.startSeconds), QString::number(event.endSeconds));
}

LinkResult UtteranceLinker::link(int64_t recordingId, const std::vector<VocalEvent>& events)
{
    LinkResult result;

    if (!m_store.beginImmediateTransaction()) {
        result.errorMessage = QStringLiteral("Could not start link transaction");
        return result;
    }

    auto abort = [this, &result](LinkResult::Status status, const QString& message) {
        if (!m_store.rollbackTransaction()) {
            LOG_WARN(vmcSampling, "link: rollback failed");
        }
        result.status = status;
        result.insertedCount = 0;
        result.errorMessage = message;
        return result;
    };

    const auto recording = m_store.getRecording(recordingId);
    if (!recording.has_value()) {
        return abort(LinkResult::Status::RecordingNotFound,
                     QStringLiteral("Recording %1 not found").arg(recordingId));
    }

    const auto segments = m_store.selectedSegmentsForRecording(recordingId);
    if (!segments.has_value()) {
        return abort(LinkResult::Status::StoreUnavailable,
                     QStringLiteral("Could not load selected segments"));
    }
    if (segments->empty()) {
        LOG_WARN(vmcSampling, "link: recording %s has no selected segments",
                 qUtf8Printable(recording->assessmentId));
        return abort(LinkResult::Status::NoSelectedSegments,
                     QStringLiteral("Recording has no selected segments"));
    }

    const auto existing = m_store.utteranceCountForRecording(recordingId);
    if (!existing.has_value()) {
        return abort(LinkResult::Status::StoreUnavailable,
                     QStringLiteral("Could not count existing utterances"));
    }
    if (*existing > 0) {
        LOG_INFO(vmcSampling, "Recording %s already has %d utterances",
                 qUtf8Printable(recording->assessmentId), *existing);
        if (!m_store.rollbackTransaction()) {
            LOG_WARN(vmcSampling, "link: rollback failed");
        }
        result.status = LinkResult::Status::AlreadyLinked;
        return result;
    }

    int inserted = 0;
    for (const Segment& segment : *segments) {
        for (const VocalEvent& event : events) {
            if (!(segment.startSeconds <= event.startSeconds
                  && event.startSeconds < segment.endSeconds)) {
                continue;
            }

            Utterance utterance;
            utterance.segmentId = segment.id;
            utterance.startSeconds = event.startSeconds;
            utterance.endSeconds = event.endSeconds;
            utterance.durationSeconds = roundTo4(event.endSeconds - event.startSeconds);
            utterance.audioFileName = audioFileNameFor(recording->assessmentId, event);
            utterance.minPitch = event.minPitch;
            utterance.maxPitch = event.maxPitch;
            utterance.averagePitch = event.averagePitch;
            utterance.pitchRange = event.maxPitch - event.minPitch;

            if (!m_store.insertUtterance(utterance).has_value()) {
                return abort(LinkResult::Status::StoreUnavailable,
                             QStringLiteral("Could not insert utterance at %1 s")
                                 .arg(event.startSeconds));
            }
            ++inserted;
        }
    }

    if (!m_store.commitTransaction()) {
        return abort(LinkResult::Status::StoreUnavailable,
                     QStringLiteral("Could not commit utterances"));
    }

    LOG_INFO(vmcSampling, "Linked %d utterances to recording %s",
             inserted, qUtf8Printable(recording->assessmentId));
    result.status = LinkResult::Status::Linked;
    result.insertedCount = inserted;
    return result;
}

} // namespace vmc
