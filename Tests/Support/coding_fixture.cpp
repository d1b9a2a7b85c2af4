#include "coding_fixture.h"

#include <QtTest/QtTest>

#include <sqlite3.h>

namespace vmc::test {

SeededRecording seedRecording(SQLiteStore& store,
                              const QString& assessmentId,
                              int segmentCount,
                              const std::function<int(int)>& activity,
                              double recordingStart)
{
    SeededRecording seeded;

    const auto participantId = store.insertParticipant(
        QStringLiteral("child-") + assessmentId, QStringLiteral("F"),
        QStringLiteral("2021-03-04"), QStringLiteral("Low Risk"));
    if (!participantId.has_value()) {
        qWarning("seedRecording: participant insert failed");
        return seeded;
    }
    seeded.participantId = *participantId;

    SQLiteStore::RecordingRow recording;
    recording.participantId = *participantId;
    recording.assessmentId = assessmentId;
    recording.recordingDate = QStringLiteral("2023-11-14");
    recording.ageInMonths = 18.5;
    recording.startTime = recordingStart;
    const auto recordingId = store.insertRecording(recording);
    if (!recordingId.has_value()) {
        qWarning("seedRecording: recording insert failed");
        return seeded;
    }
    seeded.recordingId = *recordingId;

    for (int i = 0; i < segmentCount; ++i) {
        const int count = activity ? activity(i) : i;
        const auto segmentId = store.insertSegment(*recordingId, i * kSegmentSeconds,
                                                   (i + 1) * kSegmentSeconds, count);
        if (!segmentId.has_value()) {
            qWarning("seedRecording: segment insert failed");
            return seeded;
        }
        seeded.segmentIds.push_back(*segmentId);
    }
    return seeded;
}

int64_t seedCoder(SQLiteStore& store, const QString& firstName, const QString& lastName)
{
    return store.insertCoder(firstName, lastName).value_or(0);
}

std::vector<int64_t> seedUtterances(SQLiteStore& store, int64_t segmentId, int count,
                                    double segmentStart)
{
    std::vector<int64_t> ids;
    for (int i = 0; i < count; ++i) {
        Utterance utterance;
        utterance.segmentId = segmentId;
        utterance.startSeconds = segmentStart + i * 2.0;
        utterance.endSeconds = utterance.startSeconds + 1.0;
        utterance.durationSeconds = 1.0;
        utterance.audioFileName = QStringLiteral("seg%1_%2.mp3").arg(segmentId).arg(i);
        utterance.minPitch = 200.0;
        utterance.maxPitch = 450.0;
        utterance.averagePitch = 310.0;
        utterance.pitchRange = 250.0;
        const auto id = store.insertUtterance(utterance);
        if (id.has_value()) {
            ids.push_back(*id);
        }
    }
    return ids;
}

UtteranceCode makeCode(int64_t utteranceId, int64_t coderId,
                       const QString& annotation, int total, int canonical,
                       int wordSyllables, int words)
{
    UtteranceCode code;
    code.utteranceId = utteranceId;
    code.coderId = coderId;
    code.annotation = annotation;
    code.totalSyllableCount = total;
    code.canonicalSyllableCount = canonical;
    code.wordSyllableCount = wordSyllables;
    code.wordCount = words;
    return code;
}

int64_t seedCoding(SQLiteStore& store, const UtteranceCode& code, double addedAt)
{
    const auto id = store.insertCoding(code);
    if (!id.has_value()) {
        return 0;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(store.rawDb(),
                           "UPDATE utterance_codings SET added_at = ?1 WHERE id = ?2",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    sqlite3_bind_double(stmt, 1, addedAt);
    sqlite3_bind_int64(stmt, 2, *id);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE ? *id : 0;
}

} // namespace vmc::test
