#pragma once

#include "core/ranking/candidate.h"
#include "core/shared/errors.h"
#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <memory>
#include <optional>
#include <vector>

namespace hr {

class CandidateGenerator;
class FeedbackStore;
class InteractionRecorder;
class ResourceCatalog;
class UserProfileStore;

struct RecommendationRequest {
    static constexpr int kDefaultLimit = 20;
    static constexpr int kMaxLimit = 100;

    QString userId;
    int limit = kDefaultLimit;
    QString strategy = QStringLiteral("hybrid");
    std::optional<double> diversity;     // request-scoped override of diversity_preference
    std::optional<double> minQuality;

    // Missing keys take their defaults; type errors are reported as
    // InvalidRequest naming the key.
    static std::optional<RecommendationRequest> fromJson(const QJsonObject& params,
                                                         Error* errorOut = nullptr);
};

struct RecommendationMetadata {
    int count = 0;
    double giniCoefficient = 0.0;
    double noveltyRatio = 0.0;
    bool coldStart = false;
    QString strategy;
    int interactionCount = 0;
    bool diversityApplied = false;
    bool noveltyApplied = false;
    double diversityPreference = 0.0;
    double noveltyPreference = 0.0;
    QStringList timedOutSources;

    QJsonObject toJson() const;
};

struct RecommendationResponse {
    std::vector<Candidate> recommendations;
    RecommendationMetadata metadata;

    QJsonObject toJson() const;
};

// Runs one request through candidate generation, hydration, filtering,
// hybrid ranking, MMR and novelty promotion.
class RecommendationEngine {
public:
    RecommendationEngine(UserProfileStore* profiles,
                         const InteractionRecorder* recorder,
                         const CandidateGenerator* generator,
                         std::shared_ptr<const ResourceCatalog> catalog,
                         FeedbackStore* feedback,
                         const Settings& settings = {});

    std::optional<RecommendationResponse> generateRecommendations(const RecommendationRequest& request,
                                                                  Error* errorOut = nullptr);

    static bool validateRequest(const RecommendationRequest& request,
                                Strategy* strategyOut,
                                Error* errorOut = nullptr);

private:
    std::vector<Candidate> hydrate(std::vector<Candidate> candidates) const;
    static std::vector<Candidate> applyFilters(std::vector<Candidate> candidates,
                                               const std::optional<double>& minQuality,
                                               const QStringList& excludedSources);

    UserProfileStore* m_profiles = nullptr;
    const InteractionRecorder* m_recorder = nullptr;
    const CandidateGenerator* m_generator = nullptr;
    std::shared_ptr<const ResourceCatalog> m_catalog;
    FeedbackStore* m_feedback = nullptr;
    Settings m_settings;
};

} // namespace hr
