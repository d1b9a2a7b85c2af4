#include <QtTest/QtTest>
#include <QTemporaryDir>

#include "core/sampling/utterance_linker.h"
#include "core/store/sqlite_store.h"
#include "coding_fixture.h"

using vmc::LinkResult;
using vmc::UtteranceLinker;

class TestUtteranceLinker : public QObject {
    Q_OBJECT

private slots:
    void testLinksEventsInsideSelectedSegments();
    void testSegmentBoundaryIsHalfOpen();
    void testSecondLinkIsNoOp();
    void testRequiresSelectedSegments();
    void testUnknownRecording();
    void testAudioFileName();
};

namespace {

vmc::VocalEvent makeEvent(double start, double end)
{
    vmc::VocalEvent event;
    event.startSeconds = start;
    event.endSeconds = end;
    event.minPitch = 180.0;
    event.maxPitch = 420.0;
    event.averagePitch = 300.0;
    return event;
}

bool selectSegments(vmc::SQLiteStore& store, const std::vector<int64_t>& ids)
{
    std::vector<std::pair<int64_t, vmc::SelectionCriterion>> marks;
    for (int64_t id : ids) {
        marks.emplace_back(id, vmc::SelectionCriterion::HighVolubility);
    }
    return store.beginTransaction() && store.markSegmentsSelected(marks)
        && store.commitTransaction();
}

} // namespace

void TestUtteranceLinker::testLinksEventsInsideSelectedSegments()
{
    QTemporaryDir dir;
    auto store = vmc::SQLiteStore::open(dir.path() + "/test.db");
    QVERIFY(store.has_value());
    auto seeded = vmc::test::seedRecording(*store, QStringLiteral("A1"), 3);
    // Segments 0 and 2 are selected: [0, 300) and [600, 900).
    QVERIFY(selectSegments(*store, {seeded.segmentIds[0], seeded.segmentIds[2]}));

    UtteranceLinker linker(*store);
    const LinkResult result = linker.link(seeded.recordingId, {
        makeEvent(12.5, 13.75),
        makeEvent(310.0, 311.0),     // unselected segment
        makeEvent(650.12341, 651.0),
        makeEvent(950.0, 951.0),     // past the last segment
    });
    QVERIFY(result.isSuccess());
    QCOMPARE(result.status, LinkResult::Status::Linked);
    QCOMPARE(result.insertedCount, 2);
    QCOMPARE(store->utteranceCountForRecording(seeded.recordingId).value_or(-1), 2);

    auto first = store->getUtterance(1);
    QVERIFY(first.has_value());
    QCOMPARE(first->segmentId, seeded.segmentIds[0]);
    QCOMPARE(first->durationSeconds, 1.25);
    QCOMPARE(first->pitchRange, 240.0);

    auto second = store->getUtterance(2);
    QVERIFY(second.has_value());
    QCOMPARE(second->segmentId, seeded.segmentIds[2]);
    QCOMPARE(second->durationSeconds, 0.8766);
}

void TestUtteranceLinker::testSegmentBoundaryIsHalfOpen()
{
    QTemporaryDir dir;
    auto store = vmc::SQLiteStore::open(dir.path() + "/test.db");
    QVERIFY(store.has_value());
    auto seeded = vmc::test::seedRecording(*store, QStringLiteral("A1"), 2);
    QVERIFY(selectSegments(*store, {seeded.segmentIds[0]}));

    UtteranceLinker linker(*store);
    // Starts exactly at the segment end: belongs to the next segment.
    const LinkResult result = linker.link(seeded.recordingId, {
        makeEvent(0.0, 1.0),
        makeEvent(300.0, 301.0),
    });
    QCOMPARE(result.insertedCount, 1);
}

void TestUtteranceLinker::testSecondLinkIsNoOp()
{
    QTemporaryDir dir;
    auto store = vmc::SQLiteStore::open(dir.path() + "/test.db");
    QVERIFY(store.has_value());
    auto seeded = vmc::test::seedRecording(*store, QStringLiteral("A1"), 1);
    QVERIFY(selectSegments(*store, {seeded.segmentIds[0]}));

    UtteranceLinker linker(*store);
    QCOMPARE(linker.link(seeded.recordingId, {makeEvent(1.0, 2.0)}).insertedCount, 1);

    const LinkResult again = linker.link(seeded.recordingId, {makeEvent(5.0, 6.0)});
    QVERIFY(again.isSuccess());
    QCOMPARE(again.status, LinkResult::Status::AlreadyLinked);
    QCOMPARE(again.insertedCount, 0);
    QCOMPARE(store->utteranceCountForRecording(seeded.recordingId).value_or(-1), 1);
}

void TestUtteranceLinker::testRequiresSelectedSegments()
{
    QTemporaryDir dir;
    auto store = vmc::SQLiteStore::open(dir.path() + "/test.db");
    QVERIFY(store.has_value());
    auto seeded = vmc::test::seedRecording(*store, QStringLiteral("A1"), 2);

    UtteranceLinker linker(*store);
    const LinkResult result = linker.link(seeded.recordingId, {makeEvent(1.0, 2.0)});
    QVERIFY(!result.isSuccess());
    QCOMPARE(result.status, LinkResult::Status::NoSelectedSegments);
    QCOMPARE(store->utteranceCountForRecording(seeded.recordingId).value_or(-1), 0);
}

void TestUtteranceLinker::testUnknownRecording()
{
    QTemporaryDir dir;
    auto store = vmc::SQLiteStore::open(dir.path() + "/test.db");
    QVERIFY(store.has_value());

    UtteranceLinker linker(*store);
    QCOMPARE(linker.link(77, {}).status, LinkResult::Status::RecordingNotFound);
}

void TestUtteranceLinker::testAudioFileName()
{
    QCOMPARE(UtteranceLinker::audioFileNameFor(QStringLiteral("A17"), makeEvent(21.83, 23.5)),
             QStringLiteral("A17_21.83_23.5.mp3"));
}

QTEST_MAIN(TestUtteranceLinker)
#include "test_utterance_linker.moc"
