#pragma once

#include "core/feedback/interaction_types.h"
#include "core/shared/errors.h"

#include <QSet>
#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

struct sqlite3;

namespace hr {

class PreferenceLearner;
class UserEmbeddingCache;

// Persists user-resource engagement, one row per (user, resource). Repeat
// events bump return_visits and keep the strongest interaction seen.
class InteractionRecorder {
public:
    static constexpr double kPositiveThreshold = 0.4;
    static constexpr double kDefaultRatingStars = 3.0;
    static constexpr int kDefaultLearningInterval = 10;

    explicit InteractionRecorder(sqlite3* db);

    // Optional collaborators, not owned. The cache entry of a user is dropped
    // after a positive interaction; the learner runs every learningInterval
    // interactions.
    void setEmbeddingCache(UserEmbeddingCache* cache) { m_embeddingCache = cache; }
    void setPreferenceLearner(PreferenceLearner* learner, int learningInterval = kDefaultLearningInterval);

    std::optional<UserInteraction> trackInteraction(const QString& userId,
                                                    const QString& resourceId,
                                                    const QString& interactionType,
                                                    const InteractionContext& context = {},
                                                    Error* errorOut = nullptr);

    static double computeStrength(InteractionType type, const InteractionContext& context);
    static double computeConfidence(InteractionType type, const InteractionContext& context);

    // Value of the profile counter; 0 for users without a profile.
    int totalInteractions(const QString& userId) const;

    // Positive interactions, most recently touched first. sinceEpoch <= 0
    // disables the time filter.
    std::vector<UserInteraction> positiveInteractions(const QString& userId,
                                                      int limit,
                                                      double sinceEpoch = 0.0) const;

    QStringList recentResourceIds(const QString& userId, int limit) const;
    QSet<QString> seenResourceIds(const QString& userId) const;
    std::optional<UserInteraction> interaction(const QString& userId, const QString& resourceId) const;

    // Every positive (user, resource) pair, for offline training.
    std::vector<UserInteraction> allPositiveInteractions() const;

private:
    sqlite3* m_db = nullptr;
    UserEmbeddingCache* m_embeddingCache = nullptr;
    PreferenceLearner* m_preferenceLearner = nullptr;
    int m_learningInterval = kDefaultLearningInterval;
};

} // namespace hr
