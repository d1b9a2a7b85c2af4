#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace vmc {

// SettingsManager -- JSON save/load for engine settings.
//
// Settings are stored as a JSON file at:
//   <GenericDataLocation>/vmcoding/settings.json
// Tools may pass an explicit path instead.
class SettingsManager {
public:
    // Load settings from the default location. Returns nullopt if the file
    // doesn't exist or cannot be parsed.
    static std::optional<Settings> load();
    static std::optional<Settings> loadFrom(const QString& filePath);

    // Save settings. Creates the parent directory if it doesn't exist.
    static bool save(const Settings& settings);
    static bool saveTo(const Settings& settings, const QString& filePath);

    static QString settingsFilePath();

    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);
};

} // namespace vmc
