#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

namespace vmc {

std::optional<Settings> SettingsManager::load()
{
    return loadFrom(settingsFilePath());
}

std::optional<Settings> SettingsManager::loadFrom(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(vmcCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(vmcCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const Settings& settings)
{
    return saveTo(settings, settingsFilePath());
}

bool SettingsManager::saveTo(const Settings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(vmcCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(vmcCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(vmcCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/vmcoding/settings.json");
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("dbPath"), settings.dbPath);
    json.insert(QStringLiteral("highVolubilityCount"), settings.highVolubilityCount);
    json.insert(QStringLiteral("randomCount"), settings.randomCount);
    json.insert(QStringLiteral("coderCount"), settings.coderCount);
    json.insert(QStringLiteral("claimLeaseSeconds"), static_cast<qint64>(settings.claimLeaseSeconds));
    json.insert(QStringLiteral("referenceCategory"), settings.referenceCategory);
    json.insert(QStringLiteral("maxSessionPauseSeconds"),
                static_cast<qint64>(settings.maxSessionPauseSeconds));
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    settings.dbPath = json.value(QStringLiteral("dbPath")).toString(settings.dbPath);
    settings.referenceCategory =
        json.value(QStringLiteral("referenceCategory")).toString(settings.referenceCategory);

    // Negative counts would make selection meaningless; keep the defaults.
    const int hv = json.value(QStringLiteral("highVolubilityCount")).toInt(settings.highVolubilityCount);
    if (hv >= 0) {
        settings.highVolubilityCount = hv;
    } else {
        LOG_WARN(vmcCore, "Ignoring negative highVolubilityCount: %d", hv);
    }

    const int random = json.value(QStringLiteral("randomCount")).toInt(settings.randomCount);
    if (random >= 0) {
        settings.randomCount = random;
    } else {
        LOG_WARN(vmcCore, "Ignoring negative randomCount: %d", random);
    }

    const int coders = json.value(QStringLiteral("coderCount")).toInt(settings.coderCount);
    if (coders >= 1) {
        settings.coderCount = coders;
    } else {
        LOG_WARN(vmcCore, "Ignoring invalid coderCount: %d", coders);
    }

    if (json.contains(QStringLiteral("claimLeaseSeconds"))) {
        const qint64 lease = json.value(QStringLiteral("claimLeaseSeconds")).toInteger();
        settings.claimLeaseSeconds = lease > 0 ? lease : 0;
    }

    if (json.contains(QStringLiteral("maxSessionPauseSeconds"))) {
        const qint64 pause = json.value(QStringLiteral("maxSessionPauseSeconds")).toInteger();
        if (pause > 0) {
            settings.maxSessionPauseSeconds = pause;
        }
    }

    return settings;
}

} // namespace vmc
