#include "core/ranking/diversity_optimizer.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace hr {

double DiversityOptimizer::similarity(const Candidate& a, const Candidate& b)
{
    if (a.embedding.isEmpty() || b.embedding.isEmpty()) {
        return 0.0;
    }
    const double sim = EmbeddingVector::cosine(a.embedding, b.embedding);
    return std::isfinite(sim) ? sim : 0.0;
}

std::vector<Candidate> DiversityOptimizer::select(std::vector<Candidate> ranked, double lambda, int limit)
{
    std::vector<Candidate> selected;
    if (ranked.empty() || limit <= 0) {
        return selected;
    }
    if (!std::isfinite(lambda)) {
        lambda = 1.0;
    }
    lambda = std::clamp(lambda, 0.0, 1.0);

    double lo = std::numeric_limits<double>::max();
    double hi = std::numeric_limits<double>::lowest();
    for (const Candidate& c : ranked) {
        lo = std::min(lo, c.hybridScore);
        hi = std::max(hi, c.hybridScore);
    }
    const double range = hi - lo;

    const size_t n = ranked.size();
    std::vector<double> relevance(n, 1.0);
    if (range > 0.0) {
        for (size_t i = 0; i < n; ++i) {
            relevance[i] = (ranked[i].hybridScore - lo) / range;
        }
    }

    // Running max similarity of each remaining candidate to the selected set.
    std::vector<double> maxSim(n, std::numeric_limits<double>::lowest());
    std::vector<bool> taken(n, false);
    const size_t target = std::min(n, static_cast<size_t>(limit));
    selected.reserve(target);

    while (selected.size() < target) {
        size_t best = n;
        double bestScore = 0.0;
        for (size_t i = 0; i < n; ++i) {
            if (taken[i]) {
                continue;
            }
            const double sim = selected.empty() ? 0.0 : maxSim[i];
            const double mmr = lambda * relevance[i] - (1.0 - lambda) * sim;
            if (best == n || mmr > bestScore) {
                best = i;
                bestScore = mmr;
                continue;
            }
            if (mmr == bestScore) {
                const Candidate& c = ranked[i];
                const Candidate& b = ranked[best];
                if (c.hybridScore > b.hybridScore
                    || (c.hybridScore == b.hybridScore && c.resourceId < b.resourceId)) {
                    best = i;
                }
            }
        }
        if (best == n) {
            break;
        }

        taken[best] = true;
        for (size_t i = 0; i < n; ++i) {
            if (!taken[i]) {
                maxSim[i] = std::max(maxSim[i], similarity(ranked[i], ranked[best]));
            }
        }
        selected.push_back(std::move(ranked[best]));
    }
    return selected;
}

} // namespace hr
