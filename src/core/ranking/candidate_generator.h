#pragma once

#include "core/ranking/candidate.h"
#include "core/shared/settings.h"

#include <QSet>
#include <QString>
#include <QStringList>

#include <memory>
#include <set>
#include <vector>

namespace hr {

class CollaborativeScorer;
class ContentSimilarityIndex;
class GraphNeighborService;
class InteractionRecorder;
class ResourceCatalog;
class UserEmbeddingComputer;

struct CandidateRequest {
    QString userId;
    std::set<CandidateSource> enabledSources = {CandidateSource::Collaborative,
                                                CandidateSource::Content,
                                                CandidateSource::Graph};

    static std::set<CandidateSource> sourcesForStrategy(Strategy strategy);
};

struct CandidatePool {
    std::vector<Candidate> candidates;
    QStringList timedOutSources;
    int interactionCount = 0;
};

// Collects candidates from the collaborative, content and graph sources in
// parallel. Each source gets its own deadline; a late source is abandoned and
// contributes nothing.
class CandidateGenerator {
public:
    CandidateGenerator(std::shared_ptr<const ResourceCatalog> catalog,
                       std::shared_ptr<const ContentSimilarityIndex> contentIndex,
                       std::shared_ptr<const GraphNeighborService> graph,
                       std::shared_ptr<const CollaborativeScorer> scorer,
                       const InteractionRecorder* recorder,
                       UserEmbeddingComputer* embeddings,
                       const Settings& settings = {});

    CandidatePool generateCandidates(const CandidateRequest& request) const;

    // True when a model snapshot is loaded and it was trained on this user.
    bool hasCollaborativeSignal(const QString& userId) const;

    // Merges per-source lists by resource id, drops seen resources and caps
    // the result by the best component score (ties: id ascending).
    static std::vector<Candidate> mergeSources(const std::vector<std::vector<Candidate>>& sources,
                                               const QSet<QString>& seen,
                                               int limit);

private:
    std::shared_ptr<const ResourceCatalog> m_catalog;
    std::shared_ptr<const ContentSimilarityIndex> m_contentIndex;
    std::shared_ptr<const GraphNeighborService> m_graph;
    std::shared_ptr<const CollaborativeScorer> m_scorer;
    const InteractionRecorder* m_recorder = nullptr;
    UserEmbeddingComputer* m_embeddings = nullptr;
    Settings m_settings;
};

} // namespace hr
