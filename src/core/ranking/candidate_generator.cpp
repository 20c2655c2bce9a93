#include "core/ranking/candidate_generator.h"
#include "core/catalog/content_similarity_index.h"
#include "core/catalog/graph_neighbor_service.h"
#include "core/catalog/resource_catalog.h"
#include "core/embedding/user_embedding_computer.h"
#include "core/feedback/interaction_recorder.h"
#include "core/learning/collaborative_scorer.h"
#include "core/shared/logging.h"

#include <QHash>

#include <algorithm>
#include <chrono>
#include <future>
#include <limits>
#include <thread>

namespace hr {

namespace {

struct SourceTask {
    CandidateSource source = CandidateSource::Content;
    std::shared_ptr<std::promise<std::vector<Candidate>>> promise;
    std::future<std::vector<Candidate>> future;
};

bool byScoreThenId(const Candidate& a, const Candidate& b, double sa, double sb)
{
    if (sa != sb) {
        return sa > sb;
    }
    return a.resourceId < b.resourceId;
}

// A source may return seen resources, so ask for enough to still fill
// `limit` after every seen one is dropped.
int fetchSize(int limit, const QSet<QString>& seen)
{
    const qint64 wanted = static_cast<qint64>(limit) + static_cast<qint64>(seen.size());
    return static_cast<int>(std::min<qint64>(wanted, std::numeric_limits<int>::max()));
}

std::vector<Candidate> collaborativeSource(const std::shared_ptr<const CollaborativeModel>& model,
                                           const std::shared_ptr<const ResourceCatalog>& catalog,
                                           const QString& userId,
                                           const QSet<QString>& seen,
                                           int limit)
{
    std::vector<Candidate> out;
    const int userIdx = model->userIndex(userId);
    if (userIdx < 0) {
        return out;
    }

    for (const QString& resourceId : catalog->allResourceIds()) {
        if (seen.contains(resourceId)) {
            continue;
        }
        const int itemIdx = model->itemIndex(resourceId);
        if (itemIdx < 0) {
            continue;
        }
        Candidate c;
        c.resourceId = resourceId;
        c.scores.collaborative = model->predict(userIdx, itemIdx);
        c.sources.insert(CandidateSource::Collaborative);
        out.push_back(std::move(c));
    }

    std::sort(out.begin(), out.end(), [](const Candidate& a, const Candidate& b) {
        return byScoreThenId(a, b, a.scores.collaborative, b.scores.collaborative);
    });
    if (out.size() > static_cast<size_t>(limit)) {
        out.resize(static_cast<size_t>(limit));
    }
    return out;
}

std::vector<Candidate> contentSource(const std::shared_ptr<const ContentSimilarityIndex>& index,
                                     const EmbeddingVector& userEmbedding,
                                     const QSet<QString>& seen,
                                     int limit,
                                     double threshold)
{
    std::vector<Candidate> out;
    const int k = fetchSize(limit, seen);
    for (const SimilarResource& hit : index->search(userEmbedding, k, threshold)) {
        if (seen.contains(hit.resourceId) || hit.similarity <= threshold) {
            continue;
        }
        Candidate c;
        c.resourceId = hit.resourceId;
        c.scores.content = std::clamp(hit.similarity, 0.0, 1.0);
        c.sources.insert(CandidateSource::Content);
        out.push_back(std::move(c));
        if (static_cast<int>(out.size()) >= limit) {
            break;
        }
    }
    return out;
}

std::vector<Candidate> graphSource(const std::shared_ptr<const GraphNeighborService>& graph,
                                   const QStringList& seeds,
                                   const QSet<QString>& seen,
                                   int maxHops,
                                   int limit)
{
    std::vector<Candidate> out;
    const int k = fetchSize(limit, seen);
    for (const GraphNeighbor& neighbor : graph->neighbors(seeds, maxHops, k)) {
        if (seen.contains(neighbor.resourceId)) {
            continue;
        }
        Candidate c;
        c.resourceId = neighbor.resourceId;
        c.scores.graph = std::clamp(neighbor.score, 0.0, 1.0);
        c.sources.insert(CandidateSource::Graph);
        out.push_back(std::move(c));
        if (static_cast<int>(out.size()) >= limit) {
            break;
        }
    }
    return out;
}

template <typename Fn>
SourceTask launchSource(CandidateSource source, Fn&& fn)
{
    SourceTask task;
    task.source = source;
    task.promise = std::make_shared<std::promise<std::vector<Candidate>>>();
    task.future = task.promise->get_future();

    // The worker owns the promise and everything it captured, so it can
    // outlive a request that stopped waiting for it.
    std::thread([promise = task.promise, fn = std::forward<Fn>(fn)]() mutable {
        try {
            promise->set_value(fn());
        } catch (const std::exception& e) {
            LOG_WARN(hrRanking, "Candidate source failed: %s", e.what());
            promise->set_value(std::vector<Candidate>());
        }
    }).detach();
    return task;
}

} // namespace

std::set<CandidateSource> CandidateRequest::sourcesForStrategy(Strategy strategy)
{
    switch (strategy) {
    case Strategy::Collaborative: return {CandidateSource::Collaborative};
    case Strategy::Content:       return {CandidateSource::Content};
    case Strategy::Graph:         return {CandidateSource::Graph};
    case Strategy::Hybrid:        break;
    }
    return {CandidateSource::Collaborative, CandidateSource::Content, CandidateSource::Graph};
}

CandidateGenerator::CandidateGenerator(std::shared_ptr<const ResourceCatalog> catalog,
                                       std::shared_ptr<const ContentSimilarityIndex> contentIndex,
                                       std::shared_ptr<const GraphNeighborService> graph,
                                       std::shared_ptr<const CollaborativeScorer> scorer,
                                       const InteractionRecorder* recorder,
                                       UserEmbeddingComputer* embeddings,
                                       const Settings& settings)
    : m_catalog(std::move(catalog))
    , m_contentIndex(std::move(contentIndex))
    , m_graph(std::move(graph))
    , m_scorer(std::move(scorer))
    , m_recorder(recorder)
    , m_embeddings(embeddings)
    , m_settings(settings)
{
}

bool CandidateGenerator::hasCollaborativeSignal(const QString& userId) const
{
    const auto model = m_scorer ? m_scorer->snapshot() : nullptr;
    return model && model->userIndex(userId) >= 0;
}

CandidatePool CandidateGenerator::generateCandidates(const CandidateRequest& request) const
{
    CandidatePool pool;
    if (!m_recorder || request.userId.isEmpty()) {
        return pool;
    }

    // Everything touching SQLite or the embedding cache stays on this thread.
    pool.interactionCount = m_recorder->totalInteractions(request.userId);
    const QSet<QString> seen = m_recorder->seenResourceIds(request.userId);
    const int limit = std::max(1, m_settings.perSourceLimit);

    std::vector<SourceTask> tasks;

    if (request.enabledSources.count(CandidateSource::Collaborative) > 0) {
        const auto model = m_scorer ? m_scorer->snapshot() : nullptr;
        if (!model) {
            LOG_INFO(hrRanking, "Collaborative source skipped: model unavailable");
        } else if (pool.interactionCount < m_settings.collaborativeMinInteractions) {
            LOG_DEBUG(hrRanking, "Collaborative source skipped: %d interactions",
                      pool.interactionCount);
        } else if (m_catalog) {
            tasks.push_back(launchSource(CandidateSource::Collaborative,
                [model, catalog = m_catalog, userId = request.userId, seen, limit]() {
                    return collaborativeSource(model, catalog, userId, seen, limit);
                }));
        }
    }

    if (request.enabledSources.count(CandidateSource::Content) > 0 && m_contentIndex && m_embeddings) {
        const EmbeddingVector userEmbedding = m_embeddings->userEmbedding(request.userId);
        if (userEmbedding.isZero()) {
            LOG_DEBUG(hrRanking, "Content source skipped: no user embedding");
        } else {
            const double threshold = m_settings.contentSimilarityThreshold;
            tasks.push_back(launchSource(CandidateSource::Content,
                [index = m_contentIndex, userEmbedding, seen, limit, threshold]() {
                    return contentSource(index, userEmbedding, seen, limit, threshold);
                }));
        }
    }

    if (request.enabledSources.count(CandidateSource::Graph) > 0 && m_graph) {
        const QStringList seeds = m_recorder->recentResourceIds(request.userId,
                                                                m_settings.graphSeedCount);
        if (!seeds.isEmpty()) {
            const int maxHops = m_settings.graphMaxHops;
            tasks.push_back(launchSource(CandidateSource::Graph,
                [graph = m_graph, seeds, seen, maxHops, limit]() {
                    return graphSource(graph, seeds, seen, maxHops, limit);
                }));
        }
    }

    const auto deadline = std::chrono::steady_clock::now()
        + std::chrono::milliseconds(std::max(1, m_settings.sourceTimeoutMs));

    std::vector<std::vector<Candidate>> results;
    for (SourceTask& task : tasks) {
        if (task.future.wait_until(deadline) == std::future_status::ready) {
            results.push_back(task.future.get());
            continue;
        }
        const QString name = strategyToString(strategyForSource(task.source));
        LOG_INFO(hrRanking, "Candidate source %s timed out after %d ms",
                 qUtf8Printable(name), m_settings.sourceTimeoutMs);
        pool.timedOutSources.append(name);
    }

    pool.candidates = mergeSources(results, seen, m_settings.mergedCandidateLimit);
    return pool;
}

std::vector<Candidate> CandidateGenerator::mergeSources(const std::vector<std::vector<Candidate>>& sources,
                                                        const QSet<QString>& seen,
                                                        int limit)
{
    QHash<QString, size_t> positions;
    std::vector<Candidate> merged;

    for (const std::vector<Candidate>& list : sources) {
        for (const Candidate& c : list) {
            if (seen.contains(c.resourceId)) {
                continue;
            }
            auto it = positions.constFind(c.resourceId);
            if (it == positions.constEnd()) {
                positions.insert(c.resourceId, merged.size());
                merged.push_back(c);
                continue;
            }
            Candidate& existing = merged[it.value()];
            existing.scores.collaborative = std::max(existing.scores.collaborative, c.scores.collaborative);
            existing.scores.content = std::max(existing.scores.content, c.scores.content);
            existing.scores.graph = std::max(existing.scores.graph, c.scores.graph);
            existing.sources.insert(c.sources.begin(), c.sources.end());
        }
    }

    std::sort(merged.begin(), merged.end(), [](const Candidate& a, const Candidate& b) {
        return byScoreThenId(a, b, a.scores.maxRetrievalScore(), b.scores.maxRetrievalScore());
    });
    if (limit > 0 && merged.size() > static_cast<size_t>(limit)) {
        merged.resize(static_cast<size_t>(limit));
    }
    return merged;
}

} // namespace hr
