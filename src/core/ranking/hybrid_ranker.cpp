#include "core/ranking/hybrid_ranker.h"

#include <algorithm>
#include <cmath>

namespace hr {

namespace {

double component(double value)
{
    if (!std::isfinite(value)) {
        return 0.0;
    }
    return std::clamp(value, 0.0, 1.0);
}

} // namespace

HybridRanker::HybridRanker(const HybridWeights& weights)
    : m_weights(weights)
{
}

double HybridRanker::computeHybridScore(const ComponentScores& scores, const HybridWeights& weights)
{
    return weights.collaborative * component(scores.collaborative)
         + weights.content * component(scores.content)
         + weights.graph * component(scores.graph)
         + weights.quality * component(scores.quality)
         + weights.recency * component(scores.recency);
}

void HybridRanker::rank(std::vector<Candidate>& candidates) const
{
    rank(candidates, m_weights);
}

void HybridRanker::rank(std::vector<Candidate>& candidates, const HybridWeights& weights)
{
    for (Candidate& c : candidates) {
        c.hybridScore = computeHybridScore(c.scores, weights);
    }
    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        if (a.hybridScore != b.hybridScore) {
            return a.hybridScore > b.hybridScore;
        }
        return a.resourceId < b.resourceId;
    });
}

} // namespace hr
