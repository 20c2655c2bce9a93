#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace hr {

// SettingsManager -- JSON save/load for recommender settings.
//
// Settings are stored as a JSON file at:
//   <GenericDataLocation>/hybridrec/settings.json
// HYBRIDREC_SETTINGS overrides the location.
class SettingsManager {
public:
    // Load settings from disk. Returns nullopt if file doesn't exist
    // or cannot be parsed.
    static std::optional<Settings> load();

    // Save settings to disk. Creates the directory if it doesn't exist.
    static bool save(const Settings& settings);

    static QString settingsFilePath();

    // Directory holding the default database, catalog and model files.
    static QString dataDirectory();

    // Fill empty storage paths with their defaults under dataDirectory().
    static void applyDefaultPaths(Settings& settings);

    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);
};

} // namespace hr
