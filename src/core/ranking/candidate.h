#pragma once

#include "core/embedding/embedding_vector.h"
#include "core/shared/types.h"

#include <QString>

#include <cstdint>
#include <set>
#include <vector>

namespace hr {

enum class CandidateSource {
    Collaborative,
    Content,
    Graph,
};

inline Strategy strategyForSource(CandidateSource source)
{
    switch (source) {
    case CandidateSource::Collaborative: return Strategy::Collaborative;
    case CandidateSource::Content:       return Strategy::Content;
    case CandidateSource::Graph:         return Strategy::Graph;
    }
    return Strategy::Hybrid;
}

// Per-component scores in [0,1]. A component a candidate was not produced by
// stays 0.0.
struct ComponentScores {
    double collaborative = 0.0;
    double content = 0.0;
    double graph = 0.0;
    double quality = 0.0;
    double recency = 0.0;

    double maxRetrievalScore() const;
};

struct Candidate {
    QString resourceId;
    ComponentScores scores;
    std::set<CandidateSource> sources;
    double hybridScore = 0.0;

    // Filled by metadata hydration and the novelty step.
    QString title;
    QString source;
    bool isQualityOutlier = false;
    int64_t viewCount = 0;
    double noveltyScore = 0.0;
    bool inTopViewedQuartile = false;
    EmbeddingVector embedding;

    bool hasSource(CandidateSource s) const { return sources.count(s) > 0; }
};

inline double ComponentScores::maxRetrievalScore() const
{
    double best = collaborative;
    if (content > best) best = content;
    if (graph > best) best = graph;
    return best;
}

} // namespace hr
