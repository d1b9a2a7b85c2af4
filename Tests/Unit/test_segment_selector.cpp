#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <QRandomGenerator>

#include "core/sampling/segment_selector.h"
#include "core/store/sqlite_store.h"
#include "coding_fixture.h"

#include <algorithm>
#include <climits>
#include <set>

using vmc::SegmentSelector;
using vmc::SelectionResult;

class TestSegmentSelector : public QObject {
    Q_OBJECT

private slots:
    void testChooseTakesTopByActivity();
    void testChooseRandomIsDistinctAndSeeded();
    void testChooseRejectsShortCandidateList();
    void testSelectPersistsCriteria();
    void testSelectIsIdempotent();
    void testExcludedSegmentsNeverSelected();
    void testInsufficientCandidatesSelectsNothing();
    void testUnknownRecording();
    void testNegativeCountsRejected();
    void testHugeCountsReportRequiredTotal();
};

namespace {

std::vector<vmc::Segment> makeCandidates(int count)
{
    std::vector<vmc::Segment> segments;
    for (int i = 0; i < count; ++i) {
        vmc::Segment segment;
        segment.id = i + 1;
        segment.activityCount = count - i;
        segments.push_back(segment);
    }
    return segments;
}

} // namespace

void TestSegmentSelector::testChooseTakesTopByActivity()
{
    QRandomGenerator rng(7);
    const auto choice = SegmentSelector::chooseSegments(makeCandidates(10), 3, 4, rng);
    QVERIFY(choice.has_value());
    QCOMPARE(choice->highVolubilityIds, (std::vector<int64_t>{1, 2, 3}));
    QCOMPARE(choice->randomSampleIds.size(), size_t(4));
    for (int64_t id : choice->randomSampleIds) {
        QVERIFY(id > 3);
        QVERIFY(id <= 10);
    }
}

void TestSegmentSelector::testChooseRandomIsDistinctAndSeeded()
{
    QRandomGenerator first(1234);
    QRandomGenerator second(1234);
    const auto a = SegmentSelector::chooseSegments(makeCandidates(40), 10, 20, first);
    const auto b = SegmentSelector::chooseSegments(makeCandidates(40), 10, 20, second);
    QVERIFY(a.has_value());
    QVERIFY(b.has_value());
    QCOMPARE(a->randomSampleIds, b->randomSampleIds);

    const std::set<int64_t> distinct(a->randomSampleIds.begin(), a->randomSampleIds.end());
    QCOMPARE(distinct.size(), size_t(20));

    // Drawing everything that is left yields the whole remainder.
    QRandomGenerator rng(5);
    const auto all = SegmentSelector::chooseSegments(makeCandidates(12), 2, 10, rng);
    QVERIFY(all.has_value());
    std::vector<int64_t> sorted = all->randomSampleIds;
    std::sort(sorted.begin(), sorted.end());
    QCOMPARE(sorted, (std::vector<int64_t>{3, 4, 5, 6, 7, 8, 9, 10, 11, 12}));
}

void TestSegmentSelector::testChooseRejectsShortCandidateList()
{
    QRandomGenerator rng(1);
    QVERIFY(!SegmentSelector::chooseSegments(makeCandidates(29), 10, 20, rng).has_value());
    QVERIFY(SegmentSelector::chooseSegments(makeCandidates(30), 10, 20, rng).has_value());
    QVERIFY(SegmentSelector::chooseSegments(makeCandidates(0), 0, 0, rng).has_value());
}

void TestSegmentSelector::testSelectPersistsCriteria()
{
    QTemporaryDir dir;
    auto store = vmc::SQLiteStore::open(dir.path() + "/test.db");
    QVERIFY(store.has_value());
    // Activity equals timeline index: the last ten segments are the busiest.
    auto seeded = vmc::test::seedRecording(*store, QStringLiteral("A1"), 35);

    QRandomGenerator rng(99);
    SegmentSelector selector(*store, &rng);
    const SelectionResult result = selector.select(seeded.recordingId);
    QVERIFY(result.isSuccess());
    QCOMPARE(result.status, SelectionResult::Status::Selected);
    QCOMPARE(result.highVolubilityIds.size(), size_t(10));
    QCOMPARE(result.randomSampleIds.size(), size_t(20));

    std::vector<int64_t> expectedHv(seeded.segmentIds.rbegin(), seeded.segmentIds.rbegin() + 10);
    QCOMPARE(result.highVolubilityIds, expectedHv);

    auto selected = store->selectedSegmentsForRecording(seeded.recordingId);
    QVERIFY(selected.has_value());
    QCOMPARE(selected->size(), size_t(30));
    int hv = 0;
    int rs = 0;
    for (const vmc::Segment& segment : *selected) {
        if (segment.criterion == vmc::SelectionCriterion::HighVolubility) ++hv;
        if (segment.criterion == vmc::SelectionCriterion::RandomSample) ++rs;
    }
    QCOMPARE(hv, 10);
    QCOMPARE(rs, 20);
}

void TestSegmentSelector::testSelectIsIdempotent()
{
    QTemporaryDir dir;
    auto store = vmc::SQLiteStore::open(dir.path() + "/test.db");
    QVERIFY(store.has_value());
    auto seeded = vmc::test::seedRecording(*store, QStringLiteral("A1"), 35);

    QRandomGenerator rng(3);
    SegmentSelector selector(*store, &rng);
    const SelectionResult first = selector.select(seeded.recordingId);
    QCOMPARE(first.status, SelectionResult::Status::Selected);

    const auto before = store->selectedSegmentsForRecording(seeded.recordingId);
    QVERIFY(before.has_value());

    const SelectionResult second = selector.select(seeded.recordingId);
    QVERIFY(second.isSuccess());
    QCOMPARE(second.status, SelectionResult::Status::AlreadySelected);

    const auto after = store->selectedSegmentsForRecording(seeded.recordingId);
    QVERIFY(after.has_value());
    QCOMPARE(after->size(), before->size());
    for (size_t i = 0; i < before->size(); ++i) {
        QCOMPARE((*after)[i].id, (*before)[i].id);
        QCOMPARE((*after)[i].criterion, (*before)[i].criterion);
    }

    std::vector<int64_t> firstRs = first.randomSampleIds;
    std::vector<int64_t> secondRs = second.randomSampleIds;
    std::sort(firstRs.begin(), firstRs.end());
    std::sort(secondRs.begin(), secondRs.end());
    QCOMPARE(secondRs, firstRs);
}

void TestSegmentSelector::testExcludedSegmentsNeverSelected()
{
    QTemporaryDir dir;
    auto store = vmc::SQLiteStore::open(dir.path() + "/test.db");
    QVERIFY(store.has_value());
    auto seeded = vmc::test::seedRecording(*store, QStringLiteral("A1"), 40);

    // Nap over the four busiest segments (36..39), clipping 35's last second.
    vmc::ExclusionWindow nap;
    nap.recordingId = seeded.recordingId;
    nap.startTime = vmc::test::kRecordingStart + 36 * vmc::test::kSegmentSeconds - 1.0;
    nap.endTime = vmc::test::kRecordingStart + 40 * vmc::test::kSegmentSeconds;
    QVERIFY(store->insertExclusion(nap).has_value());

    QRandomGenerator rng(11);
    SegmentSelector selector(*store, &rng);
    const SelectionResult result = selector.select(seeded.recordingId);
    QCOMPARE(result.status, SelectionResult::Status::Selected);

    const std::set<int64_t> excluded(seeded.segmentIds.begin() + 35, seeded.segmentIds.end());
    for (int64_t id : result.highVolubilityIds) {
        QVERIFY(!excluded.count(id));
    }
    for (int64_t id : result.randomSampleIds) {
        QVERIFY(!excluded.count(id));
    }
    // Next busiest after the nap.
    QCOMPARE(result.highVolubilityIds.front(), seeded.segmentIds[34]);
}

void TestSegmentSelector::testInsufficientCandidatesSelectsNothing()
{
    QTemporaryDir dir;
    auto store = vmc::SQLiteStore::open(dir.path() + "/test.db");
    QVERIFY(store.has_value());
    auto seeded = vmc::test::seedRecording(*store, QStringLiteral("A1"), 35);

    vmc::ExclusionWindow scrub;
    scrub.recordingId = seeded.recordingId;
    scrub.category = vmc::ExclusionCategory::Scrub;
    scrub.startTime = vmc::test::kRecordingStart;
    scrub.endTime = vmc::test::kRecordingStart + 10 * vmc::test::kSegmentSeconds;
    QVERIFY(store->insertExclusion(scrub).has_value());

    SegmentSelector selector(*store);
    const SelectionResult result = selector.select(seeded.recordingId);
    QVERIFY(!result.isSuccess());
    QCOMPARE(result.status, SelectionResult::Status::InsufficientCandidates);
    QVERIFY(result.errorMessage.has_value());

    auto selected = store->selectedSegmentsForRecording(seeded.recordingId);
    QVERIFY(selected.has_value());
    QVERIFY(selected->empty());

    // Smaller request fits in the 25 remaining segments.
    QVERIFY(selector.select(seeded.recordingId, 5, 20).isSuccess());
}

void TestSegmentSelector::testUnknownRecording()
{
    QTemporaryDir dir;
    auto store = vmc::SQLiteStore::open(dir.path() + "/test.db");
    QVERIFY(store.has_value());

    SegmentSelector selector(*store);
    const SelectionResult result = selector.select(4242);
    QVERIFY(!result.isSuccess());
    QCOMPARE(result.status, SelectionResult::Status::RecordingNotFound);
}

void TestSegmentSelector::testNegativeCountsRejected()
{
    QTemporaryDir dir;
    auto store = vmc::SQLiteStore::open(dir.path() + "/test.db");
    QVERIFY(store.has_value());
    auto seeded = vmc::test::seedRecording(*store, QStringLiteral("A1"), 5);

    SegmentSelector selector(*store);
    QCOMPARE(selector.select(seeded.recordingId, -1, 2).status,
             SelectionResult::Status::InvalidRequest);
    QVERIFY(store->selectedSegmentsForRecording(seeded.recordingId)->empty());
}

void TestSegmentSelector::testHugeCountsReportRequiredTotal()
{
    QTemporaryDir dir;
    auto store = vmc::SQLiteStore::open(dir.path() + "/test.db");
    QVERIFY(store.has_value());
    auto seeded = vmc::test::seedRecording(*store, QStringLiteral("A1"), 5);

    SegmentSelector selector(*store);
    const SelectionResult result = selector.select(seeded.recordingId, INT_MAX, INT_MAX);
    QCOMPARE(result.status, SelectionResult::Status::InsufficientCandidates);
    QVERIFY(result.errorMessage.has_value());
    QVERIFY(result.errorMessage->contains(QStringLiteral("4294967294 required")));
    QVERIFY(store->selectedSegmentsForRecording(seeded.recordingId)->empty());
}

QTEST_MAIN(TestSegmentSelector)
#include "test_segment_selector.moc"
