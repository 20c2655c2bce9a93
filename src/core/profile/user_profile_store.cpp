#include "core/profile/user_profile_store.h"
#include "core/shared/logging.h"
#include "core/store/sql_util.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QSet>

#include <cmath>

#include <sqlite3.h>

namespace hr {

namespace {

constexpr const char* kSelectProfileSql = R"(
    SELECT user_id, diversity_preference, novelty_preference, recency_bias,
           research_domains, active_domain, excluded_sources, preferred_authors,
           ranking_weights, total_interactions, last_active_at, created_at, updated_at
    FROM user_profiles
    WHERE user_id = ?1
)";

UserProfile readProfileRow(sqlite3_stmt* stmt)
{
    UserProfile profile;
    profile.userId = sql::columnText(stmt, 0);
    profile.diversityPreference = sqlite3_column_double(stmt, 1);
    profile.noveltyPreference = sqlite3_column_double(stmt, 2);
    profile.recencyBias = sqlite3_column_double(stmt, 3);
    profile.researchDomains = sql::decodeList(sql::columnText(stmt, 4));
    profile.activeDomain = sql::columnText(stmt, 5);
    profile.excludedSources = sql::decodeList(sql::columnText(stmt, 6));
    profile.preferredAuthors = sql::decodeList(sql::columnText(stmt, 7));

    const QString weightsJson = sql::columnText(stmt, 8);
    if (!weightsJson.isEmpty()) {
        const QJsonDocument doc = QJsonDocument::fromJson(weightsJson.toUtf8());
        if (doc.isObject()) {
            profile.rankingWeights = HybridWeights::fromJson(doc.object());
        }
    }

    profile.totalInteractions = sqlite3_column_int(stmt, 9);
    profile.lastActiveAt = sql::columnOptionalDouble(stmt, 10);
    profile.createdAt = sqlite3_column_double(stmt, 11);
    profile.updatedAt = sqlite3_column_double(stmt, 12);
    return profile;
}

bool checkUnitRange(const std::optional<double>& value, const char* field, Error* errorOut)
{
    if (!value.has_value()) {
        return true;
    }
    if (!std::isfinite(*value) || *value < 0.0 || *value > 1.0) {
        setError(errorOut, ErrorCode::InvalidPreferenceRange, QString::fromLatin1(field),
                 QStringLiteral("%1 must be within [0.0, 1.0]").arg(QString::fromLatin1(field)));
        return false;
    }
    return true;
}

} // namespace

QJsonObject UserProfile::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("userId")] = userId;
    json[QStringLiteral("diversityPreference")] = diversityPreference;
    json[QStringLiteral("noveltyPreference")] = noveltyPreference;
    json[QStringLiteral("recencyBias")] = recencyBias;
    json[QStringLiteral("researchDomains")] = QJsonArray::fromStringList(researchDomains);
    json[QStringLiteral("activeDomain")] = activeDomain;
    json[QStringLiteral("excludedSources")] = QJsonArray::fromStringList(excludedSources);
    json[QStringLiteral("preferredAuthors")] = QJsonArray::fromStringList(preferredAuthors);
    json[QStringLiteral("rankingWeights")] = rankingWeights.has_value()
        ? QJsonValue(rankingWeights->toJson())
        : QJsonValue(QJsonValue::Null);
    json[QStringLiteral("totalInteractions")] = totalInteractions;
    json[QStringLiteral("lastActiveAt")] = lastActiveAt.has_value()
        ? QJsonValue(*lastActiveAt)
        : QJsonValue(QJsonValue::Null);
    json[QStringLiteral("createdAt")] = createdAt;
    json[QStringLiteral("updatedAt")] = updatedAt;
    return json;
}

UserProfileStore::UserProfileStore(sqlite3* db)
    : m_db(db)
{
}

std::optional<UserProfile> UserProfileStore::getOrCreateProfile(const QString& userId, Error* errorOut)
{
    if (!m_db) {
        setError(errorOut, ErrorCode::StorageError, {}, QStringLiteral("database unavailable"));
        return std::nullopt;
    }
    if (userId.trimmed().isEmpty()) {
        setError(errorOut, ErrorCode::InvalidRequest, QStringLiteral("userId"),
                 QStringLiteral("userId must not be empty"));
        return std::nullopt;
    }

    static constexpr const char* kInsertSql = R"(
        INSERT OR IGNORE INTO user_profiles (user_id, created_at, updated_at)
        VALUES (?1, ?2, ?2)
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kInsertSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(hrProfile, "getOrCreateProfile prepare failed: %s", sqlite3_errmsg(m_db));
        setError(errorOut, ErrorCode::StorageError, {}, QString::fromUtf8(sqlite3_errmsg(m_db)));
        return std::nullopt;
    }
    sql::bindText(stmt, 1, userId);
    sqlite3_bind_double(stmt, 2, sql::nowEpoch());
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_WARN(hrProfile, "getOrCreateProfile insert failed: %s", sqlite3_errmsg(m_db));
        setError(errorOut, ErrorCode::StorageError, {}, QString::fromUtf8(sqlite3_errmsg(m_db)));
        return std::nullopt;
    }

    return getProfile(userId, errorOut);
}

std::optional<UserProfile> UserProfileStore::getProfile(const QString& userId, Error* errorOut) const
{
    if (!m_db) {
        setError(errorOut, ErrorCode::StorageError, {}, QStringLiteral("database unavailable"));
        return std::nullopt;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSelectProfileSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(hrProfile, "getProfile prepare failed: %s", sqlite3_errmsg(m_db));
        setError(errorOut, ErrorCode::StorageError, {}, QString::fromUtf8(sqlite3_errmsg(m_db)));
        return std::nullopt;
    }
    sql::bindText(stmt, 1, userId);

    std::optional<UserProfile> profile;
    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        profile = readProfileRow(stmt);
    } else if (rc != SQLITE_DONE) {
        setError(errorOut, ErrorCode::StorageError, {}, QString::fromUtf8(sqlite3_errmsg(m_db)));
    } else {
        setError(errorOut, ErrorCode::NotFound, QStringLiteral("userId"),
                 QStringLiteral("no profile for user %1").arg(userId));
    }
    sqlite3_finalize(stmt);
    return profile;
}

std::optional<QStringList> UserProfileStore::sanitizeList(const QStringList& entries,
                                                          bool lowercase,
                                                          const QString& field,
                                                          Error* errorOut)
{
    QStringList out;
    QSet<QString> seen;
    for (int i = 0; i < entries.size(); ++i) {
        QString entry = entries.at(i).trimmed();
        if (lowercase) {
            entry = entry.toLower();
        }

        QString problem;
        if (entry.isEmpty()) {
            problem = QStringLiteral("entry %1 is empty").arg(i);
        } else if (entry.size() > kMaxListEntryLength) {
            problem = QStringLiteral("entry %1 exceeds %2 characters").arg(i).arg(kMaxListEntryLength);
        } else {
            for (const QChar ch : entry) {
                if (ch.category() == QChar::Other_Control || ch.category() == QChar::Other_Format) {
                    problem = QStringLiteral("entry %1 contains control characters").arg(i);
                    break;
                }
            }
        }

        if (!problem.isEmpty()) {
            setError(errorOut, ErrorCode::InvalidInputList, field, problem);
            return std::nullopt;
        }

        if (!seen.contains(entry)) {
            seen.insert(entry);
            out.append(entry);
        }
    }
    return out;
}

bool UserProfileStore::validate(const ProfileUpdate& update, ProfileUpdate* sanitized, Error* errorOut) const
{
    *sanitized = update;

    if (!checkUnitRange(update.diversityPreference, "diversityPreference", errorOut)
        || !checkUnitRange(update.noveltyPreference, "noveltyPreference", errorOut)
        || !checkUnitRange(update.recencyBias, "recencyBias", errorOut)) {
        return false;
    }

    if (update.excludedSources.has_value()) {
        const auto cleaned = sanitizeList(*update.excludedSources, true,
                                          QStringLiteral("excludedSources"), errorOut);
        if (!cleaned) {
            return false;
        }
        sanitized->excludedSources = *cleaned;
    }

    if (update.researchDomains.has_value()) {
        const auto cleaned = sanitizeList(*update.researchDomains, false,
                                          QStringLiteral("researchDomains"), errorOut);
        if (!cleaned) {
            return false;
        }
        sanitized->researchDomains = *cleaned;
    }

    if (update.activeDomain.has_value() && !update.activeDomain->trimmed().isEmpty()) {
        const auto cleaned = sanitizeList({*update.activeDomain}, false,
                                          QStringLiteral("activeDomain"), errorOut);
        if (!cleaned) {
            return false;
        }
        sanitized->activeDomain = cleaned->constFirst();
    }

    if (update.rankingWeights.has_value() && !update.rankingWeights->validate(errorOut)) {
        return false;
    }

    return true;
}

std::optional<UserProfile> UserProfileStore::updateProfileSettings(const QString& userId,
                                                                   const ProfileUpdate& update,
                                                                   Error* errorOut)
{
    ProfileUpdate sanitized;
    if (!validate(update, &sanitized, errorOut)) {
        return std::nullopt;
    }

    auto current = getOrCreateProfile(userId, errorOut);
    if (!current) {
        return std::nullopt;
    }

    UserProfile next = *current;
    if (sanitized.diversityPreference) next.diversityPreference = *sanitized.diversityPreference;
    if (sanitized.noveltyPreference)   next.noveltyPreference = *sanitized.noveltyPreference;
    if (sanitized.recencyBias)         next.recencyBias = *sanitized.recencyBias;
    if (sanitized.excludedSources)     next.excludedSources = *sanitized.excludedSources;
    if (sanitized.researchDomains)     next.researchDomains = *sanitized.researchDomains;
    if (sanitized.activeDomain)        next.activeDomain = sanitized.activeDomain->trimmed();
    if (sanitized.clearRankingWeights) {
        next.rankingWeights.reset();
    } else if (sanitized.rankingWeights) {
        next.rankingWeights = sanitized.rankingWeights;
    }
    next.updatedAt = sql::nowEpoch();

    if (!writeProfile(next, errorOut)) {
        return std::nullopt;
    }
    return next;
}

bool UserProfileStore::writeProfile(const UserProfile& profile, Error* errorOut)
{
    static constexpr const char* kUpdateSql = R"(
        UPDATE user_profiles
        SET diversity_preference = ?2,
            novelty_preference = ?3,
            recency_bias = ?4,
            research_domains = ?5,
            active_domain = ?6,
            excluded_sources = ?7,
            ranking_weights = ?8,
            updated_at = ?9
        WHERE user_id = ?1
    )";

    if (!sql::begin(m_db)) {
        setError(errorOut, ErrorCode::StorageError, {}, QStringLiteral("failed to begin transaction"));
        return false;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kUpdateSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(hrProfile, "writeProfile prepare failed: %s", sqlite3_errmsg(m_db));
        setError(errorOut, ErrorCode::StorageError, {}, QString::fromUtf8(sqlite3_errmsg(m_db)));
        sql::rollback(m_db);
        return false;
    }

    sql::bindText(stmt, 1, profile.userId);
    sqlite3_bind_double(stmt, 2, profile.diversityPreference);
    sqlite3_bind_double(stmt, 3, profile.noveltyPreference);
    sqlite3_bind_double(stmt, 4, profile.recencyBias);
    sql::bindText(stmt, 5, sql::encodeList(profile.researchDomains));
    sql::bindOptionalText(stmt, 6, profile.activeDomain);
    sql::bindText(stmt, 7, sql::encodeList(profile.excludedSources));
    if (profile.rankingWeights.has_value()) {
        sql::bindText(stmt, 8, QString::fromUtf8(
            QJsonDocument(profile.rankingWeights->toJson()).toJson(QJsonDocument::Compact)));
    } else {
        sqlite3_bind_null(stmt, 8);
    }
    sqlite3_bind_double(stmt, 9, profile.updatedAt);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_WARN(hrProfile, "writeProfile step failed: %s", sqlite3_errmsg(m_db));
        setError(errorOut, ErrorCode::StorageError, {}, QString::fromUtf8(sqlite3_errmsg(m_db)));
        sql::rollback(m_db);
        return false;
    }

    if (!sql::commit(m_db)) {
        setError(errorOut, ErrorCode::StorageError, {}, QStringLiteral("failed to commit profile update"));
        sql::rollback(m_db);
        return false;
    }
    return true;
}

bool UserProfileStore::setPreferredAuthors(const QString& userId, const QStringList& authors)
{
    if (!m_db) {
        return false;
    }

    static constexpr const char* kSql = R"(
        UPDATE user_profiles SET preferred_authors = ?2, updated_at = ?3 WHERE user_id = ?1
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(hrProfile, "setPreferredAuthors prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    sql::bindText(stmt, 1, userId);
    sql::bindText(stmt, 2, sql::encodeList(authors));
    sqlite3_bind_double(stmt, 3, sql::nowEpoch());
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_WARN(hrProfile, "setPreferredAuthors step failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    return sqlite3_changes(m_db) > 0;
}

} // namespace hr
