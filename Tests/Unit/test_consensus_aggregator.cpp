#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <QJsonObject>

#include "core/consensus/consensus_aggregator.h"
#include "core/store/sqlite_store.h"
#include "coding_fixture.h"

using vmc::ConsensusAggregator;
using vmc::ConsensusReport;

class TestConsensusAggregator : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testReduceThreeCodes();
    void testReduceNoAgreement();
    void testReduceRejectsWrongCodeCount();
    void testAggregateFailsOnMissingCode();
    void testAggregateFailsOnExtraCode();
    void testUnacceptableCodesAreIgnored();
    void testRecordToJson();
    void testReportSkipsBatchesInProcess();
    void testReportSkipsInvalidRecordings();

private:
    // Three coders code every utterance of one selected segment.
    std::vector<int64_t> seedCodedUtterances(const QString& assessmentId, int count);

    std::unique_ptr<QTemporaryDir> m_dir;
    std::optional<vmc::SQLiteStore> m_store;
    int64_t m_recordingId = 0;
    std::vector<int64_t> m_coders;
};

namespace {

vmc::CodingRow makeRow(int64_t coderId, const QString& type, const QString& annotation,
                       int total, int canonical, int wordSyllables, int words)
{
    vmc::CodingRow row;
    row.coderId = coderId;
    row.utteranceType = type;
    row.annotation = annotation;
    row.totalSyllableCount = total;
    row.canonicalSyllableCount = canonical;
    row.nonCanonicalSyllableCount = total - canonical;
    row.wordSyllableCount = wordSyllables;
    row.wordCount = words;
    return row;
}

} // namespace

void TestConsensusAggregator::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_store = vmc::SQLiteStore::open(m_dir->path() + "/test.db");
    QVERIFY(m_store.has_value());
    m_coders = {
        vmc::test::seedCoder(*m_store, QStringLiteral("Ann")),
        vmc::test::seedCoder(*m_store, QStringLiteral("Bob")),
        vmc::test::seedCoder(*m_store, QStringLiteral("Cat")),
    };
}

void TestConsensusAggregator::cleanup()
{
    m_store.reset();
    m_dir.reset();
}

std::vector<int64_t> TestConsensusAggregator::seedCodedUtterances(const QString& assessmentId,
                                                                  int count)
{
    auto seeded = vmc::test::seedRecording(*m_store, assessmentId, 2);
    m_recordingId = seeded.recordingId;
    if (!m_store->beginTransaction()
        || !m_store->markSegmentsSelected(
               {{seeded.segmentIds[0], vmc::SelectionCriterion::RandomSample}})
        || !m_store->commitTransaction()) {
        return {};
    }

    const auto utterances = vmc::test::seedUtterances(*m_store, seeded.segmentIds[0], count);
    for (int64_t utteranceId : utterances) {
        for (int64_t coderId : m_coders) {
            if (!m_store->insertCoding(vmc::test::makeCode(
                    utteranceId, coderId, QStringLiteral("Canonical"), 2, 2))) {
                return {};
            }
        }
    }
    return utterances;
}

void TestConsensusAggregator::testReduceThreeCodes()
{
    vmc::UtteranceMetadata metadata;
    metadata.utteranceId = 42;
    const std::vector<vmc::CodingRow> codes = {
        makeRow(1, QStringLiteral("Speech"), QStringLiteral("Canonical"), 3, 2, 0, 0),
        makeRow(2, QStringLiteral("Speech"), QStringLiteral("Canonical"), 3, 3, 2, 1),
        makeRow(3, QStringLiteral("Non-Speech"), QStringLiteral("Laughing"), 0, 0, 0, 0),
    };

    const auto record = ConsensusAggregator::reduce(metadata, codes, 3, QStringLiteral("Speech"));
    QVERIFY(record.has_value());
    QCOMPARE(record->metadata.utteranceId, int64_t(42));

    QCOMPARE(record->totalSyllableCount.consensus.value_or(-1), 3);
    QCOMPARE(record->totalSyllableCount.agreement, 0.67);
    QCOMPARE(record->totalSyllableCount.average.value_or(-1.0), 3.0);

    // 2, 3, 0: no value reaches a majority.
    QVERIFY(!record->canonicalSyllableCount.consensus.has_value());
    QCOMPARE(record->canonicalSyllableCount.agreement, 0.0);
    QCOMPARE(record->canonicalSyllableCount.average.value_or(-1.0), 2.5);

    QCOMPARE(record->nonCanonicalSyllableCount.consensus.value_or(-1), 0);
    QCOMPARE(record->nonCanonicalSyllableCount.agreement, 0.67);
    QCOMPARE(record->nonCanonicalSyllableCount.average.value_or(-1.0), 0.5);

    QCOMPARE(record->wordSyllableCount.consensus.value_or(-1), 0);
    QCOMPARE(record->wordSyllableCount.average.value_or(-1.0), 1.0);
    QCOMPARE(record->wordCount.consensus.value_or(-1), 0);
    QCOMPARE(record->wordCount.average.value_or(-1.0), 0.5);

    QCOMPARE(record->utteranceType.consensus.value_or(QString()), QStringLiteral("Speech"));
    QCOMPARE(record->utteranceType.agreement, 0.67);
    QCOMPARE(record->annotation.consensus.value_or(QString()), QStringLiteral("Canonical"));
}

void TestConsensusAggregator::testReduceNoAgreement()
{
    const std::vector<vmc::CodingRow> codes = {
        makeRow(1, QStringLiteral("Non-Speech"), QStringLiteral("Crying"), 0, 0, 0, 0),
        makeRow(2, QStringLiteral("Non-Speech"), QStringLiteral("Laughing"), 1, 0, 0, 0),
        makeRow(3, QStringLiteral("Non-Speech"), QStringLiteral("Other"), 2, 0, 0, 0),
    };

    const auto record = ConsensusAggregator::reduce({}, codes, 3, QStringLiteral("Speech"));
    QVERIFY(record.has_value());
    QVERIFY(!record->annotation.consensus.has_value());
    QCOMPARE(record->annotation.agreement, 0.0);
    QCOMPARE(record->utteranceType.agreement, 1.0);
    // No Speech codes: no average.
    QVERIFY(!record->totalSyllableCount.average.has_value());
    QVERIFY(!record->totalSyllableCount.consensus.has_value());
}

void TestConsensusAggregator::testReduceRejectsWrongCodeCount()
{
    const std::vector<vmc::CodingRow> two = {
        makeRow(1, QStringLiteral("Speech"), QStringLiteral("Word"), 1, 1, 1, 1),
        makeRow(2, QStringLiteral("Speech"), QStringLiteral("Word"), 1, 1, 1, 1),
    };
    QVERIFY(!ConsensusAggregator::reduce({}, two, 3, QStringLiteral("Speech")).has_value());
    QVERIFY(!ConsensusAggregator::reduce({}, two, 0, QStringLiteral("Speech")).has_value());
}

void TestConsensusAggregator::testAggregateFailsOnMissingCode()
{
    const auto utterances = seedCodedUtterances(QStringLiteral("A1"), 2);
    QCOMPARE(utterances.size(), size_t(2));

    // A third utterance with only two codes spoils the whole run.
    const auto extra = vmc::test::seedUtterances(
        *m_store, m_store->selectedSegmentsForRecording(m_recordingId)->front().id, 1, 100.0);
    QCOMPARE(extra.size(), size_t(1));
    QVERIFY(m_store->insertCoding(
        vmc::test::makeCode(extra[0], m_coders[0], QStringLiteral("Word"), 1, 1)));
    QVERIFY(m_store->insertCoding(
        vmc::test::makeCode(extra[0], m_coders[1], QStringLiteral("Word"), 1, 1)));

    ConsensusAggregator aggregator(*m_store);
    const ConsensusReport report = aggregator.aggregate({utterances[0], utterances[1], extra[0]});
    QCOMPARE(report.status, ConsensusReport::Status::ConsistencyError);
    QVERIFY(report.errorMessage.has_value());
    QVERIFY(report.records.empty());
}

void TestConsensusAggregator::testAggregateFailsOnExtraCode()
{
    const auto utterances = seedCodedUtterances(QStringLiteral("A1"), 1);
    const int64_t dana = vmc::test::seedCoder(*m_store, QStringLiteral("Dana"));
    QVERIFY(m_store->insertCoding(
        vmc::test::makeCode(utterances[0], dana, QStringLiteral("Canonical"), 2, 2)));

    ConsensusAggregator aggregator(*m_store);
    const ConsensusReport report = aggregator.aggregate(utterances);
    QCOMPARE(report.status, ConsensusReport::Status::ConsistencyError);
    QVERIFY(report.records.empty());

    // The same codes are consistent for a four-rater study.
    ConsensusAggregator fourRaters(*m_store, 4);
    const ConsensusReport ok = fourRaters.aggregate(utterances);
    QCOMPARE(ok.status, ConsensusReport::Status::Success);
    QCOMPARE(ok.records.size(), size_t(1));
    QCOMPARE(ok.records[0].annotation.agreement, 1.0);
}

void TestConsensusAggregator::testUnacceptableCodesAreIgnored()
{
    const auto utterances = seedCodedUtterances(QStringLiteral("A1"), 1);
    const int64_t dana = vmc::test::seedCoder(*m_store, QStringLiteral("Dana"));
    const auto rejected = m_store->insertCoding(
        vmc::test::makeCode(utterances[0], dana, QStringLiteral("Word"), 5, 0));
    QVERIFY(rejected.has_value());
    QVERIFY(m_store->setCodingAcceptable(*rejected, false));

    ConsensusAggregator aggregator(*m_store);
    const ConsensusReport report = aggregator.aggregate(utterances);
    QCOMPARE(report.status, ConsensusReport::Status::Success);
    QCOMPARE(report.records.size(), size_t(1));
    QCOMPARE(report.records[0].totalSyllableCount.consensus.value_or(-1), 2);
}

void TestConsensusAggregator::testRecordToJson()
{
    const auto utterances = seedCodedUtterances(QStringLiteral("A9"), 1);
    ConsensusAggregator aggregator(*m_store);
    const ConsensusReport report = aggregator.aggregate(utterances);
    QCOMPARE(report.status, ConsensusReport::Status::Success);
    QCOMPARE(report.records.size(), size_t(1));

    const QJsonObject json = report.records[0].toJson();
    QCOMPARE(json.value("assessmentId").toString(), QStringLiteral("A9"));
    QCOMPARE(json.value("childId").toString(), QStringLiteral("child-A9"));
    QCOMPARE(json.value("selectionCriterion").toString(),
             vmc::selectionCriterionToString(vmc::SelectionCriterion::RandomSample));

    const QJsonObject total = json.value("totalSyllableCount").toObject();
    QCOMPARE(total.value("consensus").toInt(), 2);
    QCOMPARE(total.value("agreement").toDouble(), 1.0);
    QCOMPARE(total.value("average").toDouble(), 2.0);

    const QJsonObject annotation = json.value("annotation").toObject();
    QCOMPARE(annotation.value("consensus").toString(), QStringLiteral("Canonical"));
    QVERIFY(!annotation.contains("average"));
}

void TestConsensusAggregator::testReportSkipsBatchesInProcess()
{
    const auto done = seedCodedUtterances(QStringLiteral("A1"), 2);
    const auto pending = seedCodedUtterances(QStringLiteral("A2"), 1);
    const int64_t pendingRecording = m_recordingId;

    // A2 sits in a batch whose pool still has unassigned entries.
    const auto group = m_store->createCodingBatch({pendingRecording});
    QVERIFY(group.has_value());
    QVERIFY(m_store->insertPoolEntries(*group, pending));

    ConsensusAggregator aggregator(*m_store);
    const ConsensusReport report = aggregator.generateReport();
    QCOMPARE(report.status, ConsensusReport::Status::Success);
    QCOMPARE(report.records.size(), done.size());
    for (const vmc::ConsensusRecord& record : report.records) {
        QCOMPARE(record.metadata.assessmentId, QStringLiteral("A1"));
    }
}

void TestConsensusAggregator::testReportSkipsInvalidRecordings()
{
    seedCodedUtterances(QStringLiteral("A1"), 2);
    QVERIFY(m_store->setRecordingValid(m_recordingId, false));

    ConsensusAggregator aggregator(*m_store);
    const ConsensusReport report = aggregator.generateReport();
    QCOMPARE(report.status, ConsensusReport::Status::Success);
    QVERIFY(report.records.empty());
}

QTEST_MAIN(TestConsensusAggregator)
#include "test_consensus_aggregator.moc"
