#include "core/feedback/interaction_recorder.h"
#include "core/embedding/user_embedding_cache.h"
#include "core/profile/preference_learner.h"
#include "core/shared/logging.h"
#include "core/store/sql_util.h"

#include <QJsonValue>

#include <algorithm>
#include <cmath>

#include <sqlite3.h>

namespace hr {

namespace {

constexpr const char* kInteractionColumns =
    "id, user_id, resource_id, interaction_type, interaction_strength, is_positive, "
    "return_visits, dwell_time, scroll_depth, rating, session_id, confidence, "
    "timestamp, updated_at";

UserInteraction readInteractionRow(sqlite3_stmt* stmt)
{
    UserInteraction row;
    row.id = sqlite3_column_int64(stmt, 0);
    row.userId = sql::columnText(stmt, 1);
    row.resourceId = sql::columnText(stmt, 2);
    row.type = interactionTypeFromString(sql::columnText(stmt, 3)).value_or(InteractionType::View);
    row.strength = sqlite3_column_double(stmt, 4);
    row.isPositive = sqlite3_column_int(stmt, 5) != 0;
    row.returnVisits = sqlite3_column_int(stmt, 6);
    row.dwellTimeSeconds = sql::columnOptionalDouble(stmt, 7);
    row.scrollDepth = sql::columnOptionalDouble(stmt, 8);
    row.rating = sql::columnOptionalDouble(stmt, 9);
    row.sessionId = sql::columnText(stmt, 10);
    row.confidence = sqlite3_column_double(stmt, 11);
    row.timestamp = sqlite3_column_double(stmt, 12);
    row.updatedAt = sqlite3_column_double(stmt, 13);
    return row;
}

QJsonValue optionalToJson(const std::optional<double>& value)
{
    return value.has_value() ? QJsonValue(*value) : QJsonValue(QJsonValue::Null);
}

double clampUnit(double value)
{
    if (!std::isfinite(value)) {
        return 0.0;
    }
    return std::clamp(value, 0.0, 1.0);
}

} // namespace

QJsonObject UserInteraction::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("userId")] = userId;
    json[QStringLiteral("resourceId")] = resourceId;
    json[QStringLiteral("interactionType")] = interactionTypeToString(type);
    json[QStringLiteral("interactionStrength")] = strength;
    json[QStringLiteral("isPositive")] = isPositive;
    json[QStringLiteral("returnVisits")] = returnVisits;
    json[QStringLiteral("dwellTime")] = optionalToJson(dwellTimeSeconds);
    json[QStringLiteral("scrollDepth")] = optionalToJson(scrollDepth);
    json[QStringLiteral("rating")] = optionalToJson(rating);
    json[QStringLiteral("sessionId")] = sessionId;
    json[QStringLiteral("confidence")] = confidence;
    json[QStringLiteral("timestamp")] = timestamp;
    json[QStringLiteral("updatedAt")] = updatedAt;
    return json;
}

InteractionRecorder::InteractionRecorder(sqlite3* db)
    : m_db(db)
{
}

void InteractionRecorder::setPreferenceLearner(PreferenceLearner* learner, int learningInterval)
{
    m_preferenceLearner = learner;
    m_learningInterval = std::max(1, learningInterval);
}

double InteractionRecorder::computeStrength(InteractionType type, const InteractionContext& context)
{
    switch (type) {
    case InteractionType::Annotation:
        return 0.7;
    case InteractionType::CollectionAdd:
        return 0.8;
    case InteractionType::Export:
        return 0.9;
    case InteractionType::Rating: {
        const double stars = context.rating.value_or(kDefaultRatingStars);
        return clampUnit(stars / 5.0);
    }
    case InteractionType::View: {
        const double dwell = std::max(0.0, context.dwellTimeSeconds.value_or(0.0));
        const double scroll = clampUnit(context.scrollDepth.value_or(0.0));
        const double dwellTerm = std::isfinite(dwell) ? std::min(0.3, dwell / 1000.0) : 0.3;
        return std::min(0.5, 0.1 + dwellTerm + 0.1 * scroll);
    }
    }
    return 0.0;
}

double InteractionRecorder::computeConfidence(InteractionType type, const InteractionContext& context)
{
    if (type != InteractionType::View) {
        return 1.0;
    }
    if (!context.scrollDepth.has_value()) {
        return 0.3;
    }
    return std::min(1.0, 0.3 + 0.7 * clampUnit(*context.scrollDepth));
}

std::optional<UserInteraction> InteractionRecorder::trackInteraction(const QString& userId,
                                                                     const QString& resourceId,
                                                                     const QString& interactionType,
                                                                     const InteractionContext& context,
                                                                     Error* errorOut)
{
    const auto type = interactionTypeFromString(interactionType);
    if (!type) {
        setError(errorOut, ErrorCode::InvalidInteractionType, QStringLiteral("interactionType"),
                 QStringLiteral("unsupported interaction type '%1'").arg(interactionType));
        return std::nullopt;
    }
    if (userId.trimmed().isEmpty()) {
        setError(errorOut, ErrorCode::InvalidRequest, QStringLiteral("userId"),
                 QStringLiteral("userId must not be empty"));
        return std::nullopt;
    }
    if (resourceId.trimmed().isEmpty()) {
        setError(errorOut, ErrorCode::InvalidRequest, QStringLiteral("resourceId"),
                 QStringLiteral("resourceId must not be empty"));
        return std::nullopt;
    }
    if (!m_db) {
        setError(errorOut, ErrorCode::StorageError, {}, QStringLiteral("database unavailable"));
        return std::nullopt;
    }

    const double strength = computeStrength(*type, context);
    const double confidence = computeConfidence(*type, context);
    const bool positive = strength > kPositiveThreshold;
    const double timestamp = context.timestamp.value_or(sql::nowEpoch());
    const QString typeName = interactionTypeToString(*type);

    auto fail = [&](const char* step) -> std::optional<UserInteraction> {
        const QString message = QString::fromUtf8(sqlite3_errmsg(m_db));
        LOG_WARN(hrStore, "trackInteraction %s failed: %s", step, qUtf8Printable(message));
        sql::rollback(m_db);
        setError(errorOut, ErrorCode::StorageError, {}, message);
        return std::nullopt;
    };

    if (!sql::begin(m_db)) {
        return fail("begin");
    }

    // Upsert the interaction row. The existing row keeps the stronger type.
    static constexpr const char* kUpsertSql = R"(
        INSERT INTO user_interactions (
            user_id, resource_id, interaction_type, interaction_strength, is_positive,
            return_visits, dwell_time, scroll_depth, rating, session_id, confidence,
            timestamp, updated_at
        ) VALUES (?1, ?2, ?3, ?4, ?5, 0, ?6, ?7, ?8, ?9, ?10, ?11, ?11)
        ON CONFLICT(user_id, resource_id) DO UPDATE SET
            return_visits = return_visits + 1,
            interaction_type = CASE WHEN excluded.interaction_strength > interaction_strength
                                    THEN excluded.interaction_type ELSE interaction_type END,
            confidence = CASE WHEN excluded.interaction_strength > interaction_strength
                              THEN excluded.confidence ELSE confidence END,
            interaction_strength = MAX(interaction_strength, excluded.interaction_strength),
            is_positive = CASE WHEN MAX(interaction_strength, excluded.interaction_strength) > ?12
                               THEN 1 ELSE 0 END,
            dwell_time = CASE WHEN excluded.dwell_time IS NULL THEN dwell_time
                              ELSE MAX(COALESCE(dwell_time, 0), excluded.dwell_time) END,
            scroll_depth = CASE WHEN excluded.scroll_depth IS NULL THEN scroll_depth
                                ELSE MAX(COALESCE(scroll_depth, 0), excluded.scroll_depth) END,
            rating = COALESCE(excluded.rating, rating),
            session_id = COALESCE(excluded.session_id, session_id),
            updated_at = excluded.updated_at
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kUpsertSql, -1, &stmt, nullptr) != SQLITE_OK) {
        return fail("prepare upsert");
    }
    sql::bindText(stmt, 1, userId);
    sql::bindText(stmt, 2, resourceId);
    sql::bindText(stmt, 3, typeName);
    sqlite3_bind_double(stmt, 4, strength);
    sqlite3_bind_int(stmt, 5, positive ? 1 : 0);
    sql::bindOptionalDouble(stmt, 6, context.dwellTimeSeconds.has_value()
        ? std::optional<double>(std::max(0.0, *context.dwellTimeSeconds)) : std::nullopt);
    sql::bindOptionalDouble(stmt, 7, context.scrollDepth.has_value()
        ? std::optional<double>(clampUnit(*context.scrollDepth)) : std::nullopt);
    sql::bindOptionalDouble(stmt, 8, *type == InteractionType::Rating
        ? std::optional<double>(context.rating.value_or(kDefaultRatingStars)) : std::nullopt);
    sql::bindOptionalText(stmt, 9, context.sessionId);
    sqlite3_bind_double(stmt, 10, confidence);
    sqlite3_bind_double(stmt, 11, timestamp);
    sqlite3_bind_double(stmt, 12, kPositiveThreshold);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return fail("upsert");
    }

    static constexpr const char* kProfileSql = R"(
        INSERT INTO user_profiles (user_id, total_interactions, last_active_at, created_at, updated_at)
        VALUES (?1, 1, ?2, ?2, ?2)
        ON CONFLICT(user_id) DO UPDATE SET
            total_interactions = total_interactions + 1,
            last_active_at = excluded.last_active_at,
            updated_at = excluded.updated_at
    )";

    if (sqlite3_prepare_v2(m_db, kProfileSql, -1, &stmt, nullptr) != SQLITE_OK) {
        return fail("prepare profile");
    }
    sql::bindText(stmt, 1, userId);
    sqlite3_bind_double(stmt, 2, timestamp);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return fail("profile counters");
    }

    int total = 0;
    if (sqlite3_prepare_v2(m_db, "SELECT total_interactions FROM user_profiles WHERE user_id = ?1",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        return fail("prepare profile read");
    }
    sql::bindText(stmt, 1, userId);
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        total = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);

    const QString selectSql = QStringLiteral(
        "SELECT %1 FROM user_interactions WHERE user_id = ?1 AND resource_id = ?2")
        .arg(QString::fromLatin1(kInteractionColumns));
    if (sqlite3_prepare_v2(m_db, selectSql.toUtf8().constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        return fail("prepare interaction read");
    }
    sql::bindText(stmt, 1, userId);
    sql::bindText(stmt, 2, resourceId);
    std::optional<UserInteraction> stored;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        stored = readInteractionRow(stmt);
    }
    sqlite3_finalize(stmt);
    if (!stored) {
        return fail("interaction read");
    }

    if (!sql::commit(m_db)) {
        return fail("commit");
    }

    if (m_embeddingCache && stored->isPositive) {
        m_embeddingCache->invalidate(userId);
    }

    if (m_preferenceLearner && total > 0 && total % m_learningInterval == 0) {
        m_preferenceLearner->learn(userId);
    }

    return stored;
}

int InteractionRecorder::totalInteractions(const QString& userId) const
{
    if (!m_db) {
        return 0;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT total_interactions FROM user_profiles WHERE user_id = ?1",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(hrStore, "totalInteractions prepare failed: %s", sqlite3_errmsg(m_db));
        return 0;
    }
    sql::bindText(stmt, 1, userId);
    int total = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        total = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return total;
}

std::vector<UserInteraction> InteractionRecorder::positiveInteractions(const QString& userId,
                                                                       int limit,
                                                                       double sinceEpoch) const
{
    std::vector<UserInteraction> out;
    if (!m_db || limit <= 0) {
        return out;
    }

    const QString sqlText = QStringLiteral(
        "SELECT %1 FROM user_interactions "
        "WHERE user_id = ?1 AND is_positive = 1 AND updated_at >= ?2 "
        "ORDER BY updated_at DESC, id DESC LIMIT ?3")
        .arg(QString::fromLatin1(kInteractionColumns));

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sqlText.toUtf8().constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(hrStore, "positiveInteractions prepare failed: %s", sqlite3_errmsg(m_db));
        return out;
    }
    sql::bindText(stmt, 1, userId);
    sqlite3_bind_double(stmt, 2, sinceEpoch > 0.0 ? sinceEpoch : 0.0);
    sqlite3_bind_int(stmt, 3, limit);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        out.push_back(readInteractionRow(stmt));
    }
    sqlite3_finalize(stmt);
    return out;
}

QStringList InteractionRecorder::recentResourceIds(const QString& userId, int limit) const
{
    QStringList out;
    if (!m_db || limit <= 0) {
        return out;
    }

    static constexpr const char* kSql = R"(
        SELECT resource_id FROM user_interactions
        WHERE user_id = ?1
        ORDER BY updated_at DESC, id DESC
        LIMIT ?2
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(hrStore, "recentResourceIds prepare failed: %s", sqlite3_errmsg(m_db));
        return out;
    }
    sql::bindText(stmt, 1, userId);
    sqlite3_bind_int(stmt, 2, limit);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        out.append(sql::columnText(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return out;
}

QSet<QString> InteractionRecorder::seenResourceIds(const QString& userId) const
{
    QSet<QString> out;
    if (!m_db) {
        return out;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT resource_id FROM user_interactions WHERE user_id = ?1",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(hrStore, "seenResourceIds prepare failed: %s", sqlite3_errmsg(m_db));
        return out;
    }
    sql::bindText(stmt, 1, userId);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        out.insert(sql::columnText(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return out;
}

std::optional<UserInteraction> InteractionRecorder::interaction(const QString& userId,
                                                                const QString& resourceId) const
{
    if (!m_db) {
        return std::nullopt;
    }

    const QString sqlText = QStringLiteral(
        "SELECT %1 FROM user_interactions WHERE user_id = ?1 AND resource_id = ?2")
        .arg(QString::fromLatin1(kInteractionColumns));

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sqlText.toUtf8().constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(hrStore, "interaction prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    sql::bindText(stmt, 1, userId);
    sql::bindText(stmt, 2, resourceId);
    std::optional<UserInteraction> row;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        row = readInteractionRow(stmt);
    }
    sqlite3_finalize(stmt);
    return row;
}

std::vector<UserInteraction> InteractionRecorder::allPositiveInteractions() const
{
    std::vector<UserInteraction> out;
    if (!m_db) {
        return out;
    }

    const QString sqlText = QStringLiteral(
        "SELECT %1 FROM user_interactions WHERE is_positive = 1 ORDER BY id ASC")
        .arg(QString::fromLatin1(kInteractionColumns));

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sqlText.toUtf8().constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(hrStore, "allPositiveInteractions prepare failed: %s", sqlite3_errmsg(m_db));
        return out;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        out.push_back(readInteractionRow(stmt));
    }
    sqlite3_finalize(stmt);
    return out;
}

} // namespace hr
