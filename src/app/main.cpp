#include "core/consensus/coding_rate.h"
#include "core/consensus/consensus_aggregator.h"
#include "core/pool/sample_pool_allocator.h"
#include "core/sampling/exclusion_filter.h"
#include "core/sampling/segment_selector.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"
#include "core/store/sqlite_store.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDate>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>

#include <vector>

namespace {

QTextStream& out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream& err()
{
    static QTextStream stream(stderr);
    return stream;
}

bool parseId(const QString& text, int64_t& id)
{
    bool ok = false;
    id = text.toLongLong(&ok);
    return ok && id > 0;
}

int runSelect(vmc::SQLiteStore& store, const vmc::Settings& settings, const QStringList& args)
{
    int64_t recordingId = 0;
    if (args.size() != 1 || !parseId(args.at(0), recordingId)) {
        err() << "usage: vmc-admin select <recording-id>\n";
        return 2;
    }

    vmc::SegmentSelector selector(store);
    const vmc::SelectionResult result =
        selector.select(recordingId, settings.highVolubilityCount, settings.randomCount);
    if (!result.isSuccess()) {
        err() << "selection failed: " << result.errorMessage.value_or(QStringLiteral("unknown"))
              << "\n";
        return 1;
    }

    out() << (result.status == vmc::SelectionResult::Status::AlreadySelected
                  ? "already selected: " : "selected: ")
          << result.highVolubilityIds.size() << " HV, "
          << result.randomSampleIds.size() << " RS\n";
    return 0;
}

int runExclude(vmc::SQLiteStore& store, const QStringList& args, const QString& categoryName)
{
    int64_t recordingId = 0;
    if (args.size() != 3 || !parseId(args.at(0), recordingId)) {
        err() << "usage: vmc-admin exclude <recording-id> <yyyy-MM-dd> \"<h:mm AP - h:mm AP>, ...\"\n";
        return 2;
    }

    const auto category = vmc::exclusionCategoryFromString(categoryName);
    if (!category.has_value()) {
        err() << "unknown exclusion category: " << categoryName << "\n";
        return 2;
    }

    const QDate date = QDate::fromString(args.at(1), Qt::ISODate);
    const auto windows =
        vmc::ExclusionFilter::parseExclusionWindows(date, args.at(2), *category, recordingId);
    if (!windows.has_value()) {
        err() << "could not parse exclusion ranges\n";
        return 1;
    }

    if (!store.beginImmediateTransaction()) {
        return 1;
    }
    for (const vmc::ExclusionWindow& window : *windows) {
        if (!store.insertExclusion(window).has_value()) {
            if (!store.rollbackTransaction()) {
                LOG_WARN(vmcCore, "exclude: rollback failed");
            }
            err() << "could not store exclusion window\n";
            return 1;
        }
    }
    if (!store.commitTransaction()) {
        return 1;
    }

    out() << "stored " << windows->size() << " exclusion windows\n";
    return 0;
}

int runBatch(vmc::SQLiteStore& store, const QStringList& args)
{
    std::vector<int64_t> recordingIds;
    for (const QString& arg : args) {
        int64_t id = 0;
        if (!parseId(arg, id)) {
            err() << "invalid recording id: " << arg << "\n";
            return 2;
        }
        recordingIds.push_back(id);
    }
    if (recordingIds.empty()) {
        err() << "usage: vmc-admin batch <recording-id>...\n";
        return 2;
    }

    vmc::SamplePoolAllocator allocator(store);
    const auto group = allocator.createBatch(recordingIds);
    if (!group.has_value()) {
        err() << "could not create batch\n";
        return 1;
    }
    out() << "batch group " << *group << "\n";
    return 0;
}

int runExpand(vmc::SQLiteStore& store, const vmc::Settings& settings, const QStringList& args)
{
    bool ok = false;
    const int group = args.size() == 1 ? args.at(0).toInt(&ok) : 0;
    if (!ok) {
        err() << "usage: vmc-admin expand <batch-group>\n";
        return 2;
    }

    vmc::SamplePoolAllocator allocator(store);
    if (!allocator.expand(group, settings.coderCount)) {
        err() << "could not expand batch group " << group << "\n";
        return 1;
    }
    out() << "expanded batch group " << group << "\n";
    return 0;
}

int runReleaseStale(vmc::SQLiteStore& store, int64_t olderThanSeconds)
{
    vmc::SamplePoolAllocator allocator(store);
    const auto released = allocator.releaseStaleClaims(olderThanSeconds);
    if (!released.has_value()) {
        err() << "could not release stale claims\n";
        return 1;
    }
    out() << "released " << *released << " claims\n";
    return 0;
}

int runStats(vmc::SQLiteStore& store, int group)
{
    vmc::SamplePoolAllocator allocator(store);
    const auto stats = allocator.stats(group);
    if (!stats.has_value()) {
        err() << "could not read pool statistics\n";
        return 1;
    }

    QJsonObject obj;
    obj[QStringLiteral("total")] = stats->total;
    obj[QStringLiteral("available")] = stats->available;
    obj[QStringLiteral("processing")] = stats->processing;
    obj[QStringLiteral("completed")] = stats->completed;
    obj[QStringLiteral("orphaned")] = stats->orphaned;
    out() << QJsonDocument(obj).toJson(QJsonDocument::Indented);
    return 0;
}

int runReport(vmc::SQLiteStore& store, const vmc::Settings& settings, const QString& outPath)
{
    vmc::ConsensusAggregator aggregator(store, settings.coderCount, settings.referenceCategory);
    const vmc::ConsensusReport report = aggregator.generateReport();
    if (report.status != vmc::ConsensusReport::Status::Success) {
        err() << "report failed: " << report.errorMessage.value_or(QStringLiteral("unknown")) << "\n";
        return 1;
    }

    QJsonArray rows;
    for (const vmc::ConsensusRecord& record : report.records) {
        rows.append(record.toJson());
    }
    const QByteArray json = QJsonDocument(rows).toJson(QJsonDocument::Indented);

    if (outPath.isEmpty()) {
        out() << json;
        return 0;
    }

    QFile file(outPath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        err() << "could not open " << outPath << " for writing\n";
        return 1;
    }
    if (file.write(json) < 0) {
        err() << "could not write " << outPath << "\n";
        return 1;
    }
    out() << "wrote " << report.records.size() << " rows to " << outPath << "\n";
    return 0;
}

int runCodingRate(vmc::SQLiteStore& store, const vmc::Settings& settings)
{
    vmc::CodingRateAnalyzer analyzer(store);
    const auto rates = analyzer.analyze(std::nullopt, std::nullopt, settings.maxSessionPauseSeconds);
    if (!rates.has_value()) {
        err() << "could not compute coding rates\n";
        return 1;
    }

    QJsonArray coders;
    for (const vmc::CoderRate& rate : *rates) {
        QJsonArray sessions;
        for (const vmc::CodingSession& session : rate.sessions) {
            QJsonObject s;
            s[QStringLiteral("durationSeconds")] = session.durationSeconds;
            s[QStringLiteral("codeCount")] = session.codeCount;
            sessions.append(s);
        }
        QJsonObject coder;
        coder[QStringLiteral("coder")] = rate.coderName;
        coder[QStringLiteral("totalCodes")] = rate.totalCodes();
        coder[QStringLiteral("codesPerHour")] = rate.codesPerHour();
        coder[QStringLiteral("sessions")] = sessions;
        coders.append(coder);
    }
    out() << QJsonDocument(coders).toJson(QJsonDocument::Indented);
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("vmc-admin"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Sampling and consensus administration"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"),
        QStringLiteral("select | exclude | batch | expand | release-stale | stats | report | coding-rate"));

    const QCommandLineOption dbOption(QStringLiteral("db"),
        QStringLiteral("Database file (overrides settings)."), QStringLiteral("path"));
    const QCommandLineOption settingsOption(QStringLiteral("settings"),
        QStringLiteral("Settings JSON file."), QStringLiteral("path"));
    const QCommandLineOption categoryOption(QStringLiteral("category"),
        QStringLiteral("Exclusion category: nap or scrub."), QStringLiteral("name"),
        QStringLiteral("nap"));
    const QCommandLineOption olderThanOption(QStringLiteral("older-than"),
        QStringLiteral("Age in seconds for release-stale."), QStringLiteral("seconds"),
        QString::number(vmc::kOrphanedClaimSeconds));
    const QCommandLineOption groupOption(QStringLiteral("group"),
        QStringLiteral("Batch group for stats (default: all)."), QStringLiteral("group"),
        QStringLiteral("-1"));
    const QCommandLineOption outOption(QStringLiteral("out"),
        QStringLiteral("Write the report to this file."), QStringLiteral("path"));
    parser.addOption(dbOption);
    parser.addOption(settingsOption);
    parser.addOption(categoryOption);
    parser.addOption(olderThanOption);
    parser.addOption(groupOption);
    parser.addOption(outOption);
    parser.process(app);

    QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(2);
    }
    const QString command = args.takeFirst();

    vmc::Settings settings;
    const auto loaded = parser.isSet(settingsOption)
        ? vmc::SettingsManager::loadFrom(parser.value(settingsOption))
        : vmc::SettingsManager::load();
    if (loaded.has_value()) {
        settings = *loaded;
    } else if (parser.isSet(settingsOption)) {
        err() << "could not load settings from " << parser.value(settingsOption) << "\n";
        return 2;
    }
    if (parser.isSet(dbOption)) {
        settings.dbPath = parser.value(dbOption);
    }
    if (settings.dbPath.isEmpty()) {
        err() << "no database: pass --db or set dbPath in the settings file\n";
        return 2;
    }

    auto store = vmc::SQLiteStore::open(settings.dbPath);
    if (!store.has_value()) {
        err() << "could not open database " << settings.dbPath << "\n";
        return 1;
    }

    if (command == QLatin1String("select")) {
        return runSelect(*store, settings, args);
    }
    if (command == QLatin1String("exclude")) {
        return runExclude(*store, args, parser.value(categoryOption));
    }
    if (command == QLatin1String("batch")) {
        return runBatch(*store, args);
    }
    if (command == QLatin1String("expand")) {
        return runExpand(*store, settings, args);
    }
    if (command == QLatin1String("release-stale")) {
        bool ok = false;
        const qint64 olderThan = parser.value(olderThanOption).toLongLong(&ok);
        if (!ok || olderThan < 0) {
            err() << "--older-than must be a non-negative number of seconds\n";
            return 2;
        }
        return runReleaseStale(*store, olderThan);
    }
    if (command == QLatin1String("stats")) {
        bool ok = false;
        const int group = parser.value(groupOption).toInt(&ok);
        if (!ok) {
            err() << "--group must be a number\n";
            return 2;
        }
        return runStats(*store, group);
    }
    if (command == QLatin1String("report")) {
        return runReport(*store, settings, parser.value(outOption));
    }
    if (command == QLatin1String("coding-rate")) {
        return runCodingRate(*store, settings);
    }

    err() << "unknown command: " << command << "\n";
    return 2;
}
