#pragma once

#include "core/ranking/candidate.h"

#include <vector>

namespace hr {

// Read-only list-level metrics. Never fail; degenerate input gives 0.0.
class RecommendationMetrics {
public:
    // Gini over non-negative values (negatives clamp to 0). 0 is perfectly
    // even, values near 1 mean one item carries all the score.
    static double giniCoefficient(const std::vector<double>& scores);
    static double giniCoefficient(const std::vector<Candidate>& items);

    // Fraction of items outside the top-viewed quartile.
    static double noveltyRatio(const std::vector<Candidate>& items);
};

} // namespace hr
