#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace qr {

// SettingsManager -- JSON save/load for pipeline settings.
//
// The default location is <GenericDataLocation>/quarry/settings.json.
class SettingsManager {
public:
    // Load settings from disk. Returns nullopt if the file doesn't exist
    // or cannot be parsed.
    static std::optional<Settings> load();
    static std::optional<Settings> load(const QString& filePath);

    // Save settings to disk. Creates the directory if it doesn't exist.
    static bool save(const Settings& settings);
    static bool save(const Settings& settings, const QString& filePath);

    static QString settingsFilePath();

    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);
};

} // namespace qr
