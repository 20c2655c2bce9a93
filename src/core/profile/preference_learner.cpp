#include "core/profile/preference_learner.h"
#include "core/catalog/resource_catalog.h"
#include "core/profile/user_profile_store.h"
#include "core/shared/logging.h"
#include "core/store/sql_util.h"

#include <QHash>

#include <algorithm>
#include <utility>
#include <vector>

#include <sqlite3.h>

namespace hr {

PreferenceLearner::PreferenceLearner(sqlite3* db,
                                     UserProfileStore* profiles,
                                     const ResourceCatalog* catalog,
                                     const Settings& settings)
    : m_db(db)
    , m_profiles(profiles)
    , m_catalog(catalog)
    , m_lookbackDays(settings.preferenceLookbackDays)
    , m_maxRecords(settings.preferenceMaxRecords)
    , m_authorCount(settings.preferredAuthorCount)
{
}

QStringList PreferenceLearner::learn(const QString& userId)
{
    if (!m_db || !m_profiles || !m_catalog) {
        LOG_WARN(hrProfile, "Preference learning skipped for %s: not configured",
                 qUtf8Printable(userId));
        return {};
    }

    QStringList resourceIds;
    if (!loadRecentPositiveResources(userId, &resourceIds)) {
        return {};
    }
    if (resourceIds.isEmpty()) {
        return {};
    }

    QStringList occurrences;
    for (const QString& resourceId : resourceIds) {
        const auto meta = m_catalog->metadata(resourceId);
        if (!meta) {
            continue;
        }
        for (const QString& author : meta->authors) {
            const QString trimmed = author.trimmed();
            if (!trimmed.isEmpty()) {
                occurrences.append(trimmed);
            }
        }
    }

    const QStringList authors = topAuthors(occurrences, m_authorCount);
    if (authors.isEmpty()) {
        return {};
    }
    if (!m_profiles->setPreferredAuthors(userId, authors)) {
        LOG_WARN(hrProfile, "Failed to store preferred authors for %s", qUtf8Printable(userId));
        return {};
    }

    LOG_DEBUG(hrProfile, "Learned %d preferred authors for %s from %d resources",
              static_cast<int>(authors.size()), qUtf8Printable(userId),
              static_cast<int>(resourceIds.size()));
    return authors;
}

QStringList PreferenceLearner::topAuthors(const QStringList& authorOccurrences, int count)
{
    QHash<QString, int> tally;
    for (const QString& author : authorOccurrences) {
        ++tally[author];
    }

    std::vector<std::pair<QString, int>> ranked;
    ranked.reserve(static_cast<size_t>(tally.size()));
    for (auto it = tally.constBegin(); it != tally.constEnd(); ++it) {
        ranked.emplace_back(it.key(), it.value());
    }
    std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) {
            return a.second > b.second;
        }
        return a.first < b.first;
    });

    QStringList out;
    for (const auto& entry : ranked) {
        if (out.size() >= count) {
            break;
        }
        out.append(entry.first);
    }
    return out;
}

bool PreferenceLearner::loadRecentPositiveResources(const QString& userId,
                                                    QStringList* resourceIds) const
{
    static constexpr const char* kSql = R"(
        SELECT resource_id FROM user_interactions
        WHERE user_id = ?1 AND is_positive = 1 AND updated_at >= ?2
        ORDER BY updated_at DESC, id DESC
        LIMIT ?3
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(hrProfile, "Preference learning query failed: %s", sqlite3_errmsg(m_db));
        return false;
    }

    const double since = sql::nowEpoch() - static_cast<double>(m_lookbackDays) * 86400.0;
    sql::bindText(stmt, 1, userId);
    sqlite3_bind_double(stmt, 2, since);
    sqlite3_bind_int(stmt, 3, m_maxRecords);

    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        resourceIds->append(sql::columnText(stmt, 0));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_WARN(hrProfile, "Preference learning read failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

} // namespace hr
