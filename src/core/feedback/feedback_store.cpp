#include "core/feedback/feedback_store.h"
#include "core/shared/logging.h"
#include "core/store/sql_util.h"

#include <QJsonValue>

#include <algorithm>

#include <sqlite3.h>

namespace hr {

namespace {

constexpr const char* kFeedbackColumns =
    "id, user_id, resource_id, strategy, score, rank_position, was_clicked, was_useful, "
    "notes, recommended_at, feedback_at";

RecommendationFeedback readFeedbackRow(sqlite3_stmt* stmt)
{
    RecommendationFeedback row;
    row.id = sqlite3_column_int64(stmt, 0);
    row.userId = sql::columnText(stmt, 1);
    row.resourceId = sql::columnText(stmt, 2);
    row.strategy = sql::columnText(stmt, 3);
    row.score = sqlite3_column_double(stmt, 4);
    row.rankPosition = sqlite3_column_int(stmt, 5);
    row.wasClicked = sqlite3_column_int(stmt, 6) != 0;
    if (sqlite3_column_type(stmt, 7) != SQLITE_NULL) {
        row.wasUseful = sqlite3_column_int(stmt, 7) != 0;
    }
    row.notes = sql::columnText(stmt, 8);
    row.recommendedAt = sqlite3_column_double(stmt, 9);
    row.feedbackAt = sql::columnOptionalDouble(stmt, 10);
    return row;
}

double ratio(int clicks, int impressions)
{
    return impressions > 0 ? static_cast<double>(clicks) / static_cast<double>(impressions) : 0.0;
}

} // namespace

QJsonObject RecommendationFeedback::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("userId")] = userId;
    json[QStringLiteral("resourceId")] = resourceId;
    json[QStringLiteral("strategy")] = strategy;
    json[QStringLiteral("score")] = score;
    json[QStringLiteral("rankPosition")] = rankPosition;
    json[QStringLiteral("wasClicked")] = wasClicked;
    json[QStringLiteral("wasUseful")] = wasUseful.has_value() ? QJsonValue(*wasUseful)
                                                              : QJsonValue(QJsonValue::Null);
    json[QStringLiteral("notes")] = notes;
    json[QStringLiteral("recommendedAt")] = recommendedAt;
    json[QStringLiteral("feedbackAt")] = feedbackAt.has_value() ? QJsonValue(*feedbackAt)
                                                                : QJsonValue(QJsonValue::Null);
    return json;
}

QJsonObject CtrReport::toJson() const
{
    QJsonObject strategies;
    for (auto it = byStrategy.constBegin(); it != byStrategy.constEnd(); ++it) {
        QJsonObject entry;
        entry[QStringLiteral("impressions")] = it.value().impressions;
        entry[QStringLiteral("clicks")] = it.value().clicks;
        entry[QStringLiteral("ctr")] = it.value().ctr;
        strategies[it.key()] = entry;
    }

    QJsonObject json;
    json[QStringLiteral("impressions")] = impressions;
    json[QStringLiteral("clicks")] = clicks;
    json[QStringLiteral("ctr")] = overall;
    json[QStringLiteral("byStrategy")] = strategies;
    return json;
}

FeedbackStore::FeedbackStore(sqlite3* db)
    : m_db(db)
{
}

bool FeedbackStore::recordImpressions(const QString& userId,
                                      Strategy strategy,
                                      const std::vector<Candidate>& items)
{
    if (!m_db) {
        return false;
    }
    if (items.empty()) {
        return true;
    }

    static constexpr const char* kSql = R"(
        INSERT INTO recommendation_feedback (user_id, resource_id, strategy, score,
                                             rank_position, recommended_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6)
    )";

    if (!sql::begin(m_db)) {
        LOG_WARN(hrStore, "recordImpressions begin failed: %s", sqlite3_errmsg(m_db));
        return false;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(hrStore, "recordImpressions prepare failed: %s", sqlite3_errmsg(m_db));
        sql::rollback(m_db);
        return false;
    }

    const QString strategyName = strategyToString(strategy);
    const double now = sql::nowEpoch();
    int rank = 1;
    for (const Candidate& item : items) {
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        sql::bindText(stmt, 1, userId);
        sql::bindText(stmt, 2, item.resourceId);
        sql::bindText(stmt, 3, strategyName);
        sqlite3_bind_double(stmt, 4, item.hybridScore);
        sqlite3_bind_int(stmt, 5, rank++);
        sqlite3_bind_double(stmt, 6, now);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            LOG_WARN(hrStore, "recordImpressions insert failed: %s", sqlite3_errmsg(m_db));
            sqlite3_finalize(stmt);
            sql::rollback(m_db);
            return false;
        }
    }
    sqlite3_finalize(stmt);

    if (!sql::commit(m_db)) {
        LOG_WARN(hrStore, "recordImpressions commit failed: %s", sqlite3_errmsg(m_db));
        sql::rollback(m_db);
        return false;
    }
    return true;
}

std::optional<RecommendationFeedback> FeedbackStore::recordFeedback(const QString& userId,
                                                                    const QString& resourceId,
                                                                    std::optional<bool> wasClicked,
                                                                    std::optional<bool> wasUseful,
                                                                    const std::optional<QString>& notes,
                                                                    Error* errorOut)
{
    if (userId.trimmed().isEmpty() || resourceId.trimmed().isEmpty()) {
        setError(errorOut, ErrorCode::InvalidRequest,
                 userId.trimmed().isEmpty() ? QStringLiteral("userId") : QStringLiteral("resourceId"),
                 QStringLiteral("identifier must not be empty"));
        return std::nullopt;
    }
    if (!m_db) {
        setError(errorOut, ErrorCode::StorageError, {}, QStringLiteral("database unavailable"));
        return std::nullopt;
    }

    auto fail = [&](const char* step) -> std::optional<RecommendationFeedback> {
        const QString message = QString::fromUtf8(sqlite3_errmsg(m_db));
        LOG_WARN(hrStore, "recordFeedback %s failed: %s", step, qUtf8Printable(message));
        sql::rollback(m_db);
        setError(errorOut, ErrorCode::StorageError, {}, message);
        return std::nullopt;
    };

    if (!sql::begin(m_db)) {
        return fail("begin");
    }

    sqlite3_stmt* stmt = nullptr;
    static constexpr const char* kFindSql = R"(
        SELECT id FROM recommendation_feedback
        WHERE user_id = ?1 AND resource_id = ?2
        ORDER BY recommended_at DESC, id DESC
        LIMIT 1
    )";
    if (sqlite3_prepare_v2(m_db, kFindSql, -1, &stmt, nullptr) != SQLITE_OK) {
        return fail("prepare lookup");
    }
    sql::bindText(stmt, 1, userId);
    sql::bindText(stmt, 2, resourceId);
    int64_t rowId = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        rowId = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);

    const double now = sql::nowEpoch();
    if (rowId == 0) {
        static constexpr const char* kInsertSql = R"(
            INSERT INTO recommendation_feedback (user_id, resource_id, strategy, score,
                                                 rank_position, recommended_at)
            VALUES (?1, ?2, 'hybrid', 0.0, 0, ?3)
        )";
        if (sqlite3_prepare_v2(m_db, kInsertSql, -1, &stmt, nullptr) != SQLITE_OK) {
            return fail("prepare insert");
        }
        sql::bindText(stmt, 1, userId);
        sql::bindText(stmt, 2, resourceId);
        sqlite3_bind_double(stmt, 3, now);
        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return fail("insert");
        }
        rowId = sqlite3_last_insert_rowid(m_db);
    }

    static constexpr const char* kUpdateSql = R"(
        UPDATE recommendation_feedback SET
            was_clicked = COALESCE(?2, was_clicked),
            was_useful = COALESCE(?3, was_useful),
            notes = COALESCE(?4, notes),
            feedback_at = ?5
        WHERE id = ?1
    )";
    if (sqlite3_prepare_v2(m_db, kUpdateSql, -1, &stmt, nullptr) != SQLITE_OK) {
        return fail("prepare update");
    }
    sqlite3_bind_int64(stmt, 1, rowId);
    if (wasClicked.has_value()) {
        sqlite3_bind_int(stmt, 2, *wasClicked ? 1 : 0);
    } else {
        sqlite3_bind_null(stmt, 2);
    }
    if (wasUseful.has_value()) {
        sqlite3_bind_int(stmt, 3, *wasUseful ? 1 : 0);
    } else {
        sqlite3_bind_null(stmt, 3);
    }
    if (notes.has_value()) {
        sql::bindText(stmt, 4, *notes);
    } else {
        sqlite3_bind_null(stmt, 4);
    }
    sqlite3_bind_double(stmt, 5, now);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return fail("update");
    }

    if (!sql::commit(m_db)) {
        return fail("commit");
    }

    auto stored = latestFeedback(userId, resourceId);
    if (!stored) {
        setError(errorOut, ErrorCode::StorageError, {}, QStringLiteral("feedback row not readable"));
    }
    return stored;
}

std::optional<RecommendationFeedback> FeedbackStore::latestFeedback(const QString& userId,
                                                                    const QString& resourceId) const
{
    if (!m_db) {
        return std::nullopt;
    }

    const QString sqlText = QStringLiteral(
        "SELECT %1 FROM recommendation_feedback WHERE user_id = ?1 AND resource_id = ?2 "
        "ORDER BY recommended_at DESC, id DESC LIMIT 1")
        .arg(QString::fromLatin1(kFeedbackColumns));

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sqlText.toUtf8().constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(hrStore, "latestFeedback prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    sql::bindText(stmt, 1, userId);
    sql::bindText(stmt, 2, resourceId);
    std::optional<RecommendationFeedback> row;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        row = readFeedbackRow(stmt);
    }
    sqlite3_finalize(stmt);
    return row;
}

CtrReport FeedbackStore::computeCtr(const QString& userId, int windowDays) const
{
    CtrReport report;
    if (!m_db) {
        return report;
    }

    // Rows created by feedback on an item that was never served carry rank 0
    // and are not impressions.
    static constexpr const char* kSql = R"(
        SELECT strategy, COUNT(*), SUM(was_clicked)
        FROM recommendation_feedback
        WHERE user_id = ?1 AND recommended_at >= ?2 AND rank_position > 0
        GROUP BY strategy
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(hrStore, "computeCtr prepare failed: %s", sqlite3_errmsg(m_db));
        return report;
    }
    const double since = sql::nowEpoch() - static_cast<double>(std::max(windowDays, 0)) * 86400.0;
    sql::bindText(stmt, 1, userId);
    sqlite3_bind_double(stmt, 2, since);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        StrategyCtr entry;
        entry.impressions = sqlite3_column_int(stmt, 1);
        entry.clicks = sqlite3_column_int(stmt, 2);
        entry.ctr = ratio(entry.clicks, entry.impressions);
        report.impressions += entry.impressions;
        report.clicks += entry.clicks;
        report.byStrategy.insert(sql::columnText(stmt, 0), entry);
    }
    sqlite3_finalize(stmt);

    report.overall = ratio(report.clicks, report.impressions);
    return report;
}

bool FeedbackStore::cleanup(int retentionDays)
{
    if (!m_db) {
        return false;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "DELETE FROM recommendation_feedback WHERE recommended_at < ?1",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(hrStore, "Feedback cleanup prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    const double cutoff = sql::nowEpoch() - static_cast<double>(std::max(retentionDays, 0)) * 86400.0;
    sqlite3_bind_double(stmt, 1, cutoff);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_WARN(hrStore, "Feedback cleanup failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

} // namespace hr
