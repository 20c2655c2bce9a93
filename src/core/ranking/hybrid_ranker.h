#pragma once

#include "core/ranking/candidate.h"
#include "core/shared/scoring_types.h"

#include <vector>

namespace hr {

class HybridRanker {
public:
    explicit HybridRanker(const HybridWeights& weights = {});

    // Weighted sum of the five components.
    static double computeHybridScore(const ComponentScores& scores, const HybridWeights& weights);

    // Fills hybridScore and sorts by (hybridScore DESC, resourceId ASC).
    void rank(std::vector<Candidate>& candidates) const;
    static void rank(std::vector<Candidate>& candidates, const HybridWeights& weights);

    const HybridWeights& weights() const { return m_weights; }

private:
    HybridWeights m_weights;
};

} // namespace hr
