#include "core/ranking/novelty_booster.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace hr {

namespace {

void sortByScore(std::vector<Candidate>& items)
{
    std::stable_sort(items.begin(), items.end(), [](const Candidate& a, const Candidate& b) {
        return a.hybridScore > b.hybridScore;
    });
}

} // namespace

NoveltyBooster::NoveltyBooster(double boostFactor, double floorFraction)
    : m_boostFactor(std::max(0.0, boostFactor))
    , m_floorFraction(std::clamp(floorFraction, 0.0, 1.0))
{
}

double NoveltyBooster::medianViews(const std::vector<Candidate>& pool)
{
    if (pool.empty()) {
        return 0.0;
    }
    std::vector<double> views;
    views.reserve(pool.size());
    for (const Candidate& c : pool) {
        views.push_back(static_cast<double>(std::max<int64_t>(0, c.viewCount)));
    }
    std::sort(views.begin(), views.end());
    const size_t mid = views.size() / 2;
    if (views.size() % 2 == 1) {
        return views[mid];
    }
    return (views[mid - 1] + views[mid]) / 2.0;
}

double NoveltyBooster::noveltyScore(int64_t views, double median)
{
    const double v = static_cast<double>(std::max<int64_t>(0, views));
    if (median <= 0.0) {
        return v == 0.0 ? 1.0 : 0.0;
    }
    return std::clamp(1.0 - v / median, 0.0, 1.0);
}

void NoveltyBooster::markTopViewedQuartile(std::vector<Candidate>& pool)
{
    std::vector<size_t> order(pool.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&pool](size_t a, size_t b) {
        if (pool[a].viewCount != pool[b].viewCount) {
            return pool[a].viewCount > pool[b].viewCount;
        }
        return pool[a].resourceId < pool[b].resourceId;
    });

    const size_t quartile = (pool.size() + 3) / 4;
    for (size_t rank = 0; rank < order.size(); ++rank) {
        pool[order[rank]].inTopViewedQuartile = rank < quartile;
    }
}

std::vector<Candidate> NoveltyBooster::apply(std::vector<Candidate> pool,
                                             double noveltyPreference,
                                             int limit) const
{
    if (pool.empty() || limit <= 0) {
        return {};
    }

    const double median = medianViews(pool);
    for (Candidate& c : pool) {
        c.noveltyScore = noveltyScore(c.viewCount, median);
        if (c.noveltyScore > noveltyPreference) {
            c.hybridScore *= 1.0 + m_boostFactor * c.noveltyScore;
        }
    }
    markTopViewedQuartile(pool);
    sortByScore(pool);

    const size_t keep = std::min(pool.size(), static_cast<size_t>(limit));
    std::vector<Candidate> selected(std::make_move_iterator(pool.begin()),
                                    std::make_move_iterator(pool.begin() + static_cast<long>(keep)));
    std::vector<Candidate> rest(std::make_move_iterator(pool.begin() + static_cast<long>(keep)),
                                std::make_move_iterator(pool.end()));

    const int floor = static_cast<int>(std::ceil(m_floorFraction * static_cast<double>(selected.size())));
    int outside = static_cast<int>(std::count_if(selected.begin(), selected.end(),
                                                 [](const Candidate& c) { return !c.inTopViewedQuartile; }));

    // selected and rest are both score-descending, so the best replacement is
    // the first unflagged entry of rest and the weakest quartile entry is the
    // last flagged one in selected.
    size_t nextReplacement = 0;
    while (outside < floor) {
        while (nextReplacement < rest.size() && rest[nextReplacement].inTopViewedQuartile) {
            ++nextReplacement;
        }
        if (nextReplacement >= rest.size()) {
            break;
        }
        auto victim = std::find_if(selected.rbegin(), selected.rend(),
                                   [](const Candidate& c) { return c.inTopViewedQuartile; });
        if (victim == selected.rend()) {
            break;
        }
        *victim = std::move(rest[nextReplacement]);
        ++nextReplacement;
        ++outside;
    }

    sortByScore(selected);
    return selected;
}

} // namespace hr
