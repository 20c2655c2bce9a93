#include "recommender_service.h"
#include "core/catalog/hnsw_content_index.h"
#include "core/catalog/in_memory_resource_graph.h"
#include "core/catalog/json_resource_catalog.h"
#include "core/embedding/user_embedding_cache.h"
#include "core/embedding/user_embedding_computer.h"
#include "core/feedback/feedback_store.h"
#include "core/feedback/interaction_recorder.h"
#include "core/ipc/message.h"
#include "core/learning/collaborative_scorer.h"
#include "core/profile/preference_learner.h"
#include "core/profile/user_profile_store.h"
#include "core/ranking/candidate_generator.h"
#include "core/ranking/recommendation_engine.h"
#include "core/shared/logging.h"

#include <QFileInfo>
#include <QJsonArray>

#include <utility>

namespace hr {

namespace {

// Reads an optional numeric parameter. Returns false when the key is present
// with a non-numeric value.
bool optionalNumber(const QJsonObject& params, const char* key, std::optional<double>* out)
{
    const QJsonValue value = params.value(QLatin1String(key));
    if (value.isUndefined() || value.isNull()) {
        return true;
    }
    if (!value.isDouble()) {
        return false;
    }
    *out = value.toDouble();
    return true;
}

bool optionalBool(const QJsonObject& params, const char* key, std::optional<bool>* out)
{
    const QJsonValue value = params.value(QLatin1String(key));
    if (value.isUndefined() || value.isNull()) {
        return true;
    }
    if (!value.isBool()) {
        return false;
    }
    *out = value.toBool();
    return true;
}

bool optionalStringList(const QJsonObject& params, const char* key, std::optional<QStringList>* out)
{
    const QJsonValue value = params.value(QLatin1String(key));
    if (value.isUndefined() || value.isNull()) {
        return true;
    }
    if (!value.isArray()) {
        return false;
    }
    QStringList list;
    for (const QJsonValue& entry : value.toArray()) {
        if (!entry.isString()) {
            return false;
        }
        list.append(entry.toString());
    }
    *out = list;
    return true;
}

QJsonObject invalidParam(uint64_t id, const char* key, const QString& detail)
{
    return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                 QStringLiteral("%1: %2").arg(QLatin1String(key), detail));
}

QString requiredString(const QJsonObject& params, const char* key)
{
    return params.value(QLatin1String(key)).toString().trimmed();
}

} // namespace

RecommenderService::RecommenderService(const Settings& settings, QObject* parent)
    : ServiceBase(QStringLiteral("recommender"), parent)
    , m_settings(settings)
{
}

RecommenderService::~RecommenderService() = default;

bool RecommenderService::initialize(QString* errorOut)
{
    m_store = SQLiteStore::open(m_settings.dbPath);
    if (!m_store) {
        const QString err = QStringLiteral("Failed to open database at %1").arg(m_settings.dbPath);
        LOG_ERROR(hrCore, "%s", qUtf8Printable(err));
        if (errorOut) {
            *errorOut = err;
        }
        return false;
    }
    sqlite3* db = m_store->rawDb();

    m_catalog = std::make_shared<JsonResourceCatalog>();
    if (!m_settings.catalogPath.isEmpty() && QFileInfo::exists(m_settings.catalogPath)) {
        if (!m_catalog->loadFromFile(m_settings.catalogPath)) {
            LOG_WARN(hrCore, "Failed to load catalog %s", qUtf8Printable(m_settings.catalogPath));
        }
    } else {
        LOG_WARN(hrCore, "No resource catalog at %s", qUtf8Printable(m_settings.catalogPath));
    }

    m_graph = std::make_shared<InMemoryResourceGraph>();
    if (!m_settings.graphPath.isEmpty() && QFileInfo::exists(m_settings.graphPath)
        && !m_graph->loadFromFile(m_settings.graphPath)) {
        LOG_WARN(hrCore, "Failed to load resource graph %s", qUtf8Printable(m_settings.graphPath));
    }

    m_contentIndex = std::make_shared<HnswContentIndex>(m_settings.embeddingDim);
    const int indexed = m_contentIndex->build(*m_catalog);

    m_scorer = std::make_shared<CollaborativeScorer>(m_settings.modelPath);
    m_scorer->load();

    UserEmbeddingCacheConfig cacheConfig;
    cacheConfig.ttlSeconds = m_settings.userEmbeddingTtlSeconds;
    m_embeddingCache = std::make_unique<InMemoryUserEmbeddingCache>(cacheConfig);

    m_profiles = std::make_unique<UserProfileStore>(db);
    m_preferenceLearner = std::make_unique<PreferenceLearner>(db, m_profiles.get(), m_catalog.get(), m_settings);
    m_recorder = std::make_unique<InteractionRecorder>(db);
    m_recorder->setEmbeddingCache(m_embeddingCache.get());
    m_recorder->setPreferenceLearner(m_preferenceLearner.get(), m_settings.preferenceLearningInterval);
    m_feedback = std::make_unique<FeedbackStore>(db);
    m_embeddings = std::make_unique<UserEmbeddingComputer>(m_recorder.get(), m_catalog.get(),
                                                           m_embeddingCache.get(),
                                                           m_settings.embeddingDim,
                                                           m_settings.userEmbeddingMaxInteractions);
    m_generator = std::make_unique<CandidateGenerator>(m_catalog, m_contentIndex, m_graph, m_scorer,
                                                       m_recorder.get(), m_embeddings.get(), m_settings);
    m_engine = std::make_unique<RecommendationEngine>(m_profiles.get(), m_recorder.get(), m_generator.get(),
                                                      m_catalog, m_feedback.get(), m_settings);

    if (!m_feedback->cleanup(m_settings.feedbackRetentionDays)) {
        LOG_WARN(hrCore, "Feedback retention cleanup failed");
    }

    registerMethods();

    LOG_INFO(hrCore, "Recommender initialized: %d resources (%d indexed), %d graph edges, model %s",
             m_catalog->size(), indexed, m_graph->edgeCount(),
             m_scorer->hasModel() ? qUtf8Printable(m_scorer->modelVersion()) : "unavailable");
    return true;
}

void RecommenderService::registerMethods()
{
    using Handler = QJsonObject (RecommenderService::*)(uint64_t, const QJsonObject&);
    const std::pair<const char*, Handler> methods[] = {
        {"getRecommendations", &RecommenderService::handleGetRecommendations},
        {"trackInteraction", &RecommenderService::handleTrackInteraction},
        {"getProfile", &RecommenderService::handleGetProfile},
        {"updateProfile", &RecommenderService::handleUpdateProfile},
        {"submitFeedback", &RecommenderService::handleSubmitFeedback},
        {"getMetrics", &RecommenderService::handleGetMetrics},
    };
    for (const auto& method : methods) {
        const Handler handler = method.second;
        registerMethod(QLatin1String(method.first), [this, handler](uint64_t id, const QJsonObject& params) {
            return (this->*handler)(id, params);
        });
    }
    registerMethod(QStringLiteral("reloadModel"), [this](uint64_t id, const QJsonObject&) {
        return handleReloadModel(id);
    });
}

QJsonObject RecommenderService::handleGetRecommendations(uint64_t id, const QJsonObject& params)
{
    Error error;
    const auto request = RecommendationRequest::fromJson(params, &error);
    if (!request) {
        return IpcMessage::makeError(id, error);
    }
    const auto response = m_engine->generateRecommendations(*request, &error);
    if (!response) {
        return IpcMessage::makeError(id, error);
    }
    return IpcMessage::makeResponse(id, response->toJson());
}

QJsonObject RecommenderService::handleTrackInteraction(uint64_t id, const QJsonObject& params)
{
    InteractionContext context;
    if (!optionalNumber(params, "dwellTime", &context.dwellTimeSeconds)) {
        return invalidParam(id, "dwellTime", QStringLiteral("must be a number"));
    }
    if (!optionalNumber(params, "scrollDepth", &context.scrollDepth)) {
        return invalidParam(id, "scrollDepth", QStringLiteral("must be a number"));
    }
    if (!optionalNumber(params, "rating", &context.rating)) {
        return invalidParam(id, "rating", QStringLiteral("must be a number"));
    }
    context.sessionId = params.value(QStringLiteral("sessionId")).toString();

    Error error;
    const auto interaction = m_recorder->trackInteraction(requiredString(params, "userId"),
                                                          requiredString(params, "resourceId"),
                                                          params.value(QStringLiteral("interactionType")).toString(),
                                                          context, &error);
    if (!interaction) {
        return IpcMessage::makeError(id, error);
    }
    return IpcMessage::makeResponse(id, interaction->toJson());
}

QJsonObject RecommenderService::handleGetProfile(uint64_t id, const QJsonObject& params)
{
    Error error;
    const auto profile = m_profiles->getOrCreateProfile(requiredString(params, "userId"), &error);
    if (!profile) {
        return IpcMessage::makeError(id, error);
    }
    return IpcMessage::makeResponse(id, profile->toJson());
}

QJsonObject RecommenderService::handleUpdateProfile(uint64_t id, const QJsonObject& params)
{
    ProfileUpdate update;
    if (!optionalNumber(params, "diversityPreference", &update.diversityPreference)) {
        return invalidParam(id, "diversityPreference", QStringLiteral("must be a number"));
    }
    if (!optionalNumber(params, "noveltyPreference", &update.noveltyPreference)) {
        return invalidParam(id, "noveltyPreference", QStringLiteral("must be a number"));
    }
    if (!optionalNumber(params, "recencyBias", &update.recencyBias)) {
        return invalidParam(id, "recencyBias", QStringLiteral("must be a number"));
    }
    if (!optionalStringList(params, "excludedSources", &update.excludedSources)) {
        return invalidParam(id, "excludedSources", QStringLiteral("must be an array of strings"));
    }
    if (!optionalStringList(params, "researchDomains", &update.researchDomains)) {
        return invalidParam(id, "researchDomains", QStringLiteral("must be an array of strings"));
    }

    const QJsonValue activeDomain = params.value(QStringLiteral("activeDomain"));
    if (activeDomain.isString()) {
        update.activeDomain = activeDomain.toString();
    } else if (!activeDomain.isUndefined() && !activeDomain.isNull()) {
        return invalidParam(id, "activeDomain", QStringLiteral("must be a string"));
    }

    Error error;
    const QJsonValue weights = params.value(QStringLiteral("rankingWeights"));
    if (weights.isNull()) {
        update.clearRankingWeights = true;
    } else if (weights.isObject()) {
        update.rankingWeights = HybridWeights::fromJson(weights.toObject(), &error);
        if (!update.rankingWeights) {
            return IpcMessage::makeError(id, error);
        }
    } else if (!weights.isUndefined()) {
        return invalidParam(id, "rankingWeights", QStringLiteral("must be an object"));
    }

    const auto profile = m_profiles->updateProfileSettings(requiredString(params, "userId"), update, &error);
    if (!profile) {
        return IpcMessage::makeError(id, error);
    }
    return IpcMessage::makeResponse(id, profile->toJson());
}

QJsonObject RecommenderService::handleSubmitFeedback(uint64_t id, const QJsonObject& params)
{
    const QString userId = requiredString(params, "userId");
    const QString resourceId = requiredString(params, "resourceId");

    std::optional<bool> wasClicked;
    std::optional<bool> wasUseful;
    if (!optionalBool(params, "wasClicked", &wasClicked)) {
        return invalidParam(id, "wasClicked", QStringLiteral("must be a boolean"));
    }
    if (!optionalBool(params, "wasUseful", &wasUseful)) {
        return invalidParam(id, "wasUseful", QStringLiteral("must be a boolean"));
    }
    std::optional<QString> notes;
    const QJsonValue notesValue = params.value(QStringLiteral("notes"));
    if (notesValue.isString()) {
        notes = notesValue.toString();
    } else if (!notesValue.isUndefined() && !notesValue.isNull()) {
        return invalidParam(id, "notes", QStringLiteral("must be a string"));
    }

    if (!resourceId.isEmpty() && !m_catalog->metadata(resourceId)) {
        Error error{ErrorCode::NotFound, QStringLiteral("resourceId"),
                    QStringLiteral("unknown resource '%1'").arg(resourceId)};
        return IpcMessage::makeError(id, error);
    }

    Error error;
    const auto feedback = m_feedback->recordFeedback(userId, resourceId, wasClicked, wasUseful, notes, &error);
    if (!feedback) {
        return IpcMessage::makeError(id, error);
    }
    return IpcMessage::makeResponse(id, feedback->toJson());
}

QJsonObject RecommenderService::handleGetMetrics(uint64_t id, const QJsonObject& params)
{
    const QString userId = requiredString(params, "userId");
    if (userId.isEmpty()) {
        return invalidParam(id, "userId", QStringLiteral("must not be empty"));
    }
    const QJsonValue window = params.value(QStringLiteral("windowDays"));
    if (!window.isUndefined() && !window.isNull() && (!window.isDouble() || window.toDouble() < 0.0)) {
        return invalidParam(id, "windowDays", QStringLiteral("must be a non-negative number"));
    }
    const int windowDays = window.isDouble() ? window.toInt(30) : 30;

    const UserEmbeddingCache::Stats stats = m_embeddingCache->stats();
    QJsonObject cache;
    cache[QStringLiteral("hits")] = static_cast<qint64>(stats.hits);
    cache[QStringLiteral("misses")] = static_cast<qint64>(stats.misses);
    cache[QStringLiteral("evictions")] = static_cast<qint64>(stats.evictions);
    cache[QStringLiteral("size")] = stats.currentSize;

    QJsonArray popular;
    for (const auto& entry : m_scorer->popularItems(10)) {
        QJsonObject item;
        item[QStringLiteral("resourceId")] = entry.first;
        item[QStringLiteral("interactions")] = entry.second;
        popular.append(item);
    }

    QJsonObject model;
    model[QStringLiteral("available")] = m_scorer->hasModel();
    model[QStringLiteral("version")] = m_scorer->modelVersion();
    model[QStringLiteral("popularItems")] = popular;

    QJsonObject result;
    result[QStringLiteral("ctr")] = m_feedback->computeCtr(userId, windowDays).toJson();
    result[QStringLiteral("windowDays")] = windowDays;
    result[QStringLiteral("interactionCount")] = m_recorder->totalInteractions(userId);
    result[QStringLiteral("embeddingCache")] = cache;
    result[QStringLiteral("model")] = model;
    return IpcMessage::makeResponse(id, result);
}

QJsonObject RecommenderService::handleReloadModel(uint64_t id)
{
    QString error;
    const bool loaded = m_scorer->load(&error);

    QJsonObject result;
    result[QStringLiteral("available")] = m_scorer->hasModel();
    result[QStringLiteral("version")] = m_scorer->modelVersion();
    result[QStringLiteral("reloaded")] = loaded;
    if (!loaded) {
        result[QStringLiteral("error")] = error;
    }
    return IpcMessage::makeResponse(id, result);
}

} // namespace hr
