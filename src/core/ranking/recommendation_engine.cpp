#include "core/ranking/recommendation_engine.h"
#include "core/catalog/resource_catalog.h"
#include "core/feedback/feedback_store.h"
#include "core/feedback/interaction_recorder.h"
#include "core/feedback/recommendation_metrics.h"
#include "core/profile/user_profile_store.h"
#include "core/ranking/candidate_generator.h"
#include "core/ranking/diversity_optimizer.h"
#include "core/ranking/hybrid_ranker.h"
#include "core/ranking/novelty_booster.h"
#include "core/shared/logging.h"

#include <QJsonArray>
#include <QSet>

#include <algorithm>
#include <cmath>

namespace hr {

namespace {

bool readOptionalNumber(const QJsonObject& params, const QString& key,
                        std::optional<double>* out, Error* errorOut)
{
    const QJsonValue value = params.value(key);
    if (value.isUndefined() || value.isNull()) {
        return true;
    }
    if (!value.isDouble()) {
        setError(errorOut, ErrorCode::InvalidRequest, key,
                 QStringLiteral("%1 must be a number").arg(key));
        return false;
    }
    *out = value.toDouble();
    return true;
}

double unit(double value)
{
    return std::isfinite(value) ? std::clamp(value, 0.0, 1.0) : 0.0;
}

QJsonObject candidateToJson(const Candidate& c, int rank)
{
    QJsonObject scores;
    scores[QStringLiteral("collaborative")] = c.scores.collaborative;
    scores[QStringLiteral("content")] = c.scores.content;
    scores[QStringLiteral("graph")] = c.scores.graph;
    scores[QStringLiteral("quality")] = c.scores.quality;
    scores[QStringLiteral("recency")] = c.scores.recency;

    QJsonArray strategies;
    for (CandidateSource source : c.sources) {
        strategies.append(strategyToString(strategyForSource(source)));
    }

    QJsonObject json;
    json[QStringLiteral("resourceId")] = c.resourceId;
    json[QStringLiteral("title")] = c.title;
    json[QStringLiteral("score")] = c.hybridScore;
    json[QStringLiteral("rank")] = rank;
    json[QStringLiteral("scores")] = scores;
    json[QStringLiteral("strategies")] = strategies;
    json[QStringLiteral("noveltyScore")] = c.noveltyScore;
    json[QStringLiteral("viewCount")] = static_cast<qint64>(c.viewCount);
    return json;
}

} // namespace

std::optional<RecommendationRequest> RecommendationRequest::fromJson(const QJsonObject& params,
                                                                     Error* errorOut)
{
    RecommendationRequest request;

    const QJsonValue userId = params.value(QStringLiteral("userId"));
    if (!userId.isString()) {
        setError(errorOut, ErrorCode::InvalidRequest, QStringLiteral("userId"),
                 QStringLiteral("userId must be a string"));
        return std::nullopt;
    }
    request.userId = userId.toString().trimmed();

    const QJsonValue limit = params.value(QStringLiteral("limit"));
    if (!limit.isUndefined() && !limit.isNull()) {
        const double raw = limit.toDouble(std::nan(""));
        if (!limit.isDouble() || !std::isfinite(raw) || std::floor(raw) != raw) {
            setError(errorOut, ErrorCode::InvalidRequest, QStringLiteral("limit"),
                     QStringLiteral("limit must be an integer"));
            return std::nullopt;
        }
        request.limit = raw > 1e6 ? 1000001 : (raw < -1e6 ? -1 : static_cast<int>(raw));
    }

    const QJsonValue strategy = params.value(QStringLiteral("strategy"));
    if (!strategy.isUndefined() && !strategy.isNull()) {
        if (!strategy.isString()) {
            setError(errorOut, ErrorCode::InvalidRequest, QStringLiteral("strategy"),
                     QStringLiteral("strategy must be a string"));
            return std::nullopt;
        }
        request.strategy = strategy.toString();
    }

    if (!readOptionalNumber(params, QStringLiteral("diversity"), &request.diversity, errorOut)
        || !readOptionalNumber(params, QStringLiteral("minQuality"), &request.minQuality, errorOut)) {
        return std::nullopt;
    }
    return request;
}

QJsonObject RecommendationMetadata::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("count")] = count;
    json[QStringLiteral("giniCoefficient")] = giniCoefficient;
    json[QStringLiteral("noveltyRatio")] = noveltyRatio;
    json[QStringLiteral("coldStart")] = coldStart;
    json[QStringLiteral("strategy")] = strategy;
    json[QStringLiteral("interactionCount")] = interactionCount;
    json[QStringLiteral("diversityApplied")] = diversityApplied;
    json[QStringLiteral("noveltyApplied")] = noveltyApplied;
    json[QStringLiteral("diversityPreference")] = diversityPreference;
    json[QStringLiteral("noveltyPreference")] = noveltyPreference;
    json[QStringLiteral("timedOutSources")] = QJsonArray::fromStringList(timedOutSources);
    return json;
}

QJsonObject RecommendationResponse::toJson() const
{
    QJsonArray items;
    int rank = 1;
    for (const Candidate& c : recommendations) {
        items.append(candidateToJson(c, rank++));
    }

    QJsonObject json;
    json[QStringLiteral("recommendations")] = items;
    json[QStringLiteral("metadata")] = metadata.toJson();
    return json;
}

RecommendationEngine::RecommendationEngine(UserProfileStore* profiles,
                                           const InteractionRecorder* recorder,
                                           const CandidateGenerator* generator,
                                           std::shared_ptr<const ResourceCatalog> catalog,
                                           FeedbackStore* feedback,
                                           const Settings& settings)
    : m_profiles(profiles)
    , m_recorder(recorder)
    , m_generator(generator)
    , m_catalog(std::move(catalog))
    , m_feedback(feedback)
    , m_settings(settings)
{
}

bool RecommendationEngine::validateRequest(const RecommendationRequest& request,
                                           Strategy* strategyOut,
                                           Error* errorOut)
{
    if (request.userId.trimmed().isEmpty()) {
        setError(errorOut, ErrorCode::InvalidRequest, QStringLiteral("userId"),
                 QStringLiteral("userId must not be empty"));
        return false;
    }
    if (request.limit < 1 || request.limit > RecommendationRequest::kMaxLimit) {
        setError(errorOut, ErrorCode::InvalidRequest, QStringLiteral("limit"),
                 QStringLiteral("limit must be within [1, %1]").arg(RecommendationRequest::kMaxLimit));
        return false;
    }
    const auto strategy = strategyFromString(request.strategy);
    if (!strategy) {
        setError(errorOut, ErrorCode::InvalidRequest, QStringLiteral("strategy"),
                 QStringLiteral("unsupported strategy '%1'").arg(request.strategy));
        return false;
    }
    if (request.diversity.has_value()
        && (!std::isfinite(*request.diversity) || *request.diversity < 0.0 || *request.diversity > 1.0)) {
        setError(errorOut, ErrorCode::InvalidPreferenceRange, QStringLiteral("diversity"),
                 QStringLiteral("diversity must be within [0.0, 1.0]"));
        return false;
    }
    if (request.minQuality.has_value()
        && (!std::isfinite(*request.minQuality) || *request.minQuality < 0.0 || *request.minQuality > 1.0)) {
        setError(errorOut, ErrorCode::InvalidRequest, QStringLiteral("minQuality"),
                 QStringLiteral("minQuality must be within [0.0, 1.0]"));
        return false;
    }
    if (strategyOut) {
        *strategyOut = *strategy;
    }
    return true;
}

std::optional<RecommendationResponse> RecommendationEngine::generateRecommendations(
    const RecommendationRequest& request,
    Error* errorOut)
{
    Strategy strategy = Strategy::Hybrid;
    if (!validateRequest(request, &strategy, errorOut)) {
        return std::nullopt;
    }
    if (!m_profiles || !m_recorder || !m_generator) {
        setError(errorOut, ErrorCode::StorageError, {}, QStringLiteral("engine not initialized"));
        return std::nullopt;
    }

    const QString userId = request.userId.trimmed();
    const auto profile = m_profiles->getOrCreateProfile(userId, errorOut);
    if (!profile) {
        return std::nullopt;
    }

    const int interactionCount = m_recorder->totalInteractions(userId);
    if (strategy == Strategy::Collaborative
        && interactionCount < m_settings.collaborativeMinInteractions) {
        LOG_DEBUG(hrRanking, "User %s has %d interactions, collaborative falls back to hybrid",
                  qUtf8Printable(userId), interactionCount);
        strategy = Strategy::Hybrid;
    } else if (strategy == Strategy::Collaborative && !m_generator->hasCollaborativeSignal(userId)) {
        LOG_INFO(hrRanking, "No collaborative signal for %s, falling back to hybrid",
                 qUtf8Printable(userId));
        strategy = Strategy::Hybrid;
    }

    CandidateRequest candidateRequest;
    candidateRequest.userId = userId;
    candidateRequest.enabledSources = CandidateRequest::sourcesForStrategy(strategy);
    CandidatePool pool = m_generator->generateCandidates(candidateRequest);

    std::vector<Candidate> candidates = hydrate(std::move(pool.candidates));
    candidates = applyFilters(std::move(candidates), request.minQuality, profile->excludedSources);

    const HybridWeights weights = profile->rankingWeights.value_or(m_settings.defaultWeights);
    HybridRanker::rank(candidates, weights);

    const double lambda = request.diversity.value_or(profile->diversityPreference);
    const int window = request.limit * std::max(1, m_settings.mmrWindowMultiplier);

    RecommendationResponse response;
    response.metadata.strategy = strategyToString(strategy);
    response.metadata.interactionCount = interactionCount;
    response.metadata.coldStart = interactionCount == 0;
    response.metadata.diversityPreference = lambda;
    response.metadata.noveltyPreference = profile->noveltyPreference;
    response.metadata.timedOutSources = pool.timedOutSources;

    if (!candidates.empty()) {
        std::vector<Candidate> diversified = DiversityOptimizer::select(std::move(candidates), lambda, window);
        response.metadata.diversityApplied = diversified.size() > 1;

        const NoveltyBooster booster(m_settings.noveltyBoostFactor, m_settings.noveltyFloorFraction);
        response.recommendations = booster.apply(std::move(diversified), profile->noveltyPreference,
                                                 request.limit);
        response.metadata.noveltyApplied = !response.recommendations.empty();
    }

    response.metadata.count = static_cast<int>(response.recommendations.size());
    response.metadata.giniCoefficient = RecommendationMetrics::giniCoefficient(response.recommendations);
    response.metadata.noveltyRatio = RecommendationMetrics::noveltyRatio(response.recommendations);

    if (m_feedback && !response.recommendations.empty()
        && !m_feedback->recordImpressions(userId, strategy, response.recommendations)) {
        LOG_WARN(hrRanking, "Failed to record impressions for %s", qUtf8Printable(userId));
    }

    LOG_DEBUG(hrRanking, "Served %d recommendations to %s (strategy=%s, gini=%.3f)",
              response.metadata.count, qUtf8Printable(userId),
              qUtf8Printable(response.metadata.strategy), response.metadata.giniCoefficient);
    return response;
}

std::vector<Candidate> RecommendationEngine::hydrate(std::vector<Candidate> candidates) const
{
    std::vector<Candidate> out;
    if (!m_catalog) {
        return out;
    }
    out.reserve(candidates.size());

    for (Candidate& c : candidates) {
        const auto meta = m_catalog->metadata(c.resourceId);
        if (!meta) {
            LOG_DEBUG(hrRanking, "Dropping %s: no metadata", qUtf8Printable(c.resourceId));
            continue;
        }
        c.title = meta->title;
        c.source = meta->source;
        c.isQualityOutlier = meta->isQualityOutlier;
        c.viewCount = std::max<int64_t>(0, meta->viewCount);
        c.scores.quality = unit(meta->qualityScore);
        c.scores.recency = unit(meta->recencyScore);

        Error error;
        if (auto embedding = EmbeddingVector::fromValues(meta->embedding, m_settings.embeddingDim, &error)) {
            c.embedding = std::move(*embedding);
        } else if (!meta->embedding.empty()) {
            LOG_WARN(hrEmbedding, "Malformed embedding for %s: %s",
                     qUtf8Printable(c.resourceId), qUtf8Printable(error.message));
        }
        out.push_back(std::move(c));
    }
    return out;
}

std::vector<Candidate> RecommendationEngine::applyFilters(std::vector<Candidate> candidates,
                                                          const std::optional<double>& minQuality,
                                                          const QStringList& excludedSources)
{
    QSet<QString> excluded;
    for (const QString& source : excludedSources) {
        excluded.insert(source.trimmed().toLower());
    }

    candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
        [&](const Candidate& c) {
            if (!excluded.isEmpty() && excluded.contains(c.source.toLower())) {
                return true;
            }
            if (minQuality.has_value()
                && (c.isQualityOutlier || c.scores.quality < *minQuality)) {
                return true;
            }
            return false;
        }), candidates.end());
    return candidates;
}

} // namespace hr
