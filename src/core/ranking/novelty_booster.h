#pragma once

#include "core/ranking/candidate.h"

#include <vector>

namespace hr {

// Promotes less-viewed resources and guarantees a minimum share of the final
// list comes from outside the most-viewed quartile of the pool.
class NoveltyBooster {
public:
    static constexpr double kDefaultBoostFactor = 0.2;
    static constexpr double kDefaultFloorFraction = 0.2;

    explicit NoveltyBooster(double boostFactor = kDefaultBoostFactor,
                            double floorFraction = kDefaultFloorFraction);

    // pool is the MMR-ordered window; the result holds at most `limit` items
    // ordered by (boosted) hybrid score.
    std::vector<Candidate> apply(std::vector<Candidate> pool, double noveltyPreference, int limit) const;

    static double medianViews(const std::vector<Candidate>& pool);
    static double noveltyScore(int64_t views, double median);

    // Flags the first ceil(n/4) candidates by view count (desc, id asc).
    static void markTopViewedQuartile(std::vector<Candidate>& pool);

private:
    double m_boostFactor = kDefaultBoostFactor;
    double m_floorFraction = kDefaultFloorFraction;
};

} // namespace hr
