#pragma once

#include "core/ranking/candidate.h"

#include <vector>

namespace hr {

// Maximal Marginal Relevance re-ranking:
//   MMR(c) = lambda * rel(c) - (1 - lambda) * max_sim(c, selected)
// rel is the hybrid score min-max normalized over the input; similarity is
// the cosine of the candidates' embeddings (0 when either is missing).
class DiversityOptimizer {
public:
    static std::vector<Candidate> select(std::vector<Candidate> ranked, double lambda, int limit);

    static double similarity(const Candidate& a, const Candidate& b);
};

} // namespace hr
