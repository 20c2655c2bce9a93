#pragma once

#include "core/ranking/candidate.h"
#include "core/shared/errors.h"
#include "core/shared/types.h"

#include <QHash>
#include <QJsonObject>
#include <QString>

#include <cstdint>
#include <optional>
#include <vector>

struct sqlite3;

namespace hr {

struct RecommendationFeedback {
    int64_t id = 0;
    QString userId;
    QString resourceId;
    QString strategy;
    double score = 0.0;
    int rankPosition = 0;
    bool wasClicked = false;
    std::optional<bool> wasUseful;
    QString notes;
    double recommendedAt = 0.0;
    std::optional<double> feedbackAt;

    QJsonObject toJson() const;
};

struct StrategyCtr {
    int impressions = 0;
    int clicks = 0;
    double ctr = 0.0;
};

struct CtrReport {
    int impressions = 0;
    int clicks = 0;
    double overall = 0.0;
    QHash<QString, StrategyCtr> byStrategy;

    QJsonObject toJson() const;
};

// Impression log and click/usefulness feedback for served recommendations.
class FeedbackStore {
public:
    explicit FeedbackStore(sqlite3* db);

    // One row per served item; rank positions are 1-based in list order.
    bool recordImpressions(const QString& userId,
                           Strategy strategy,
                           const std::vector<Candidate>& items);

    // Updates the latest impression of (user, resource). Without one, a
    // hybrid row with score 0 and rank 0 is created.
    std::optional<RecommendationFeedback> recordFeedback(const QString& userId,
                                                         const QString& resourceId,
                                                         std::optional<bool> wasClicked,
                                                         std::optional<bool> wasUseful,
                                                         const std::optional<QString>& notes,
                                                         Error* errorOut = nullptr);

    std::optional<RecommendationFeedback> latestFeedback(const QString& userId,
                                                         const QString& resourceId) const;

    // CTR over impressions served in the trailing window.
    CtrReport computeCtr(const QString& userId, int windowDays = 30) const;

    bool cleanup(int retentionDays = 180);

private:
    sqlite3* m_db = nullptr;
};

} // namespace hr
