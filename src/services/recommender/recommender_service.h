#pragma once

#include "core/ipc/service_base.h"
#include "core/shared/errors.h"
#include "core/shared/settings.h"
#include "core/store/sqlite_store.h"

#include <memory>
#include <optional>

namespace hr {

class CandidateGenerator;
class CollaborativeScorer;
class FeedbackStore;
class HnswContentIndex;
class InMemoryResourceGraph;
class InMemoryUserEmbeddingCache;
class InteractionRecorder;
class JsonResourceCatalog;
class PreferenceLearner;
class RecommendationEngine;
class UserEmbeddingComputer;
class UserProfileStore;

class RecommenderService : public ServiceBase {
    Q_OBJECT
public:
    explicit RecommenderService(const Settings& settings, QObject* parent = nullptr);
    ~RecommenderService() override;

    // Opens the database and loads the catalog, graph and model. A missing
    // catalog, graph or model degrades the service; a database failure is fatal.
    bool initialize(QString* errorOut = nullptr);

private:
    void registerMethods();

    QJsonObject handleGetRecommendations(uint64_t id, const QJsonObject& params);
    QJsonObject handleTrackInteraction(uint64_t id, const QJsonObject& params);
    QJsonObject handleGetProfile(uint64_t id, const QJsonObject& params);
    QJsonObject handleUpdateProfile(uint64_t id, const QJsonObject& params);
    QJsonObject handleSubmitFeedback(uint64_t id, const QJsonObject& params);
    QJsonObject handleGetMetrics(uint64_t id, const QJsonObject& params);
    QJsonObject handleReloadModel(uint64_t id);

    Settings m_settings;
    std::optional<SQLiteStore> m_store;
    std::shared_ptr<JsonResourceCatalog> m_catalog;
    std::shared_ptr<HnswContentIndex> m_contentIndex;
    std::shared_ptr<InMemoryResourceGraph> m_graph;
    std::shared_ptr<CollaborativeScorer> m_scorer;
    std::unique_ptr<InMemoryUserEmbeddingCache> m_embeddingCache;
    std::unique_ptr<UserProfileStore> m_profiles;
    std::unique_ptr<PreferenceLearner> m_preferenceLearner;
    std::unique_ptr<InteractionRecorder> m_recorder;
    std::unique_ptr<FeedbackStore> m_feedback;
    std::unique_ptr<UserEmbeddingComputer> m_embeddings;
    std::unique_ptr<CandidateGenerator> m_generator;
    std::unique_ptr<RecommendationEngine> m_engine;
};

} // namespace hr
