#pragma once

#include "core/shared/settings.h"

#include <QString>
#include <QStringList>

struct sqlite3;

namespace hr {

class ResourceCatalog;
class UserProfileStore;

// Derives preferred authors from a user's recent positive interactions.
// Best effort: failures are logged and the stored list is left as is.
class PreferenceLearner {
public:
    PreferenceLearner(sqlite3* db,
                      UserProfileStore* profiles,
                      const ResourceCatalog* catalog,
                      const Settings& settings = {});

    // Returns the learned author list; empty on failure or without data.
    QStringList learn(const QString& userId);

    // Top `count` authors by frequency, ties alphabetical.
    static QStringList topAuthors(const QStringList& authorOccurrences, int count);

private:
    bool loadRecentPositiveResources(const QString& userId, QStringList* resourceIds) const;

    sqlite3* m_db = nullptr;
    UserProfileStore* m_profiles = nullptr;
    const ResourceCatalog* m_catalog = nullptr;
    int m_lookbackDays = 90;
    int m_maxRecords = 1000;
    int m_authorCount = 10;
};

} // namespace hr
