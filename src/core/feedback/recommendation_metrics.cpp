#include "core/feedback/recommendation_metrics.h"

#include <algorithm>
#include <cmath>

namespace hr {

double RecommendationMetrics::giniCoefficient(const std::vector<double>& scores)
{
    if (scores.empty()) {
        return 0.0;
    }

    std::vector<double> sorted;
    sorted.reserve(scores.size());
    for (double v : scores) {
        sorted.push_back(std::isfinite(v) ? std::max(0.0, v) : 0.0);
    }
    std::sort(sorted.begin(), sorted.end());

    double sum = 0.0;
    double weighted = 0.0;
    for (size_t i = 0; i < sorted.size(); ++i) {
        sum += sorted[i];
        weighted += static_cast<double>(i + 1) * sorted[i];
    }
    if (sum <= 0.0) {
        return 0.0;
    }

    const double n = static_cast<double>(sorted.size());
    const double gini = (2.0 * weighted) / (n * sum) - (n + 1.0) / n;
    return std::clamp(gini, 0.0, 1.0);
}

double RecommendationMetrics::giniCoefficient(const std::vector<Candidate>& items)
{
    std::vector<double> scores;
    scores.reserve(items.size());
    for (const Candidate& c : items) {
        scores.push_back(c.hybridScore);
    }
    return giniCoefficient(scores);
}

double RecommendationMetrics::noveltyRatio(const std::vector<Candidate>& items)
{
    if (items.empty()) {
        return 0.0;
    }
    const auto outside = std::count_if(items.begin(), items.end(),
                                       [](const Candidate& c) { return !c.inTopViewedQuartile; });
    return static_cast<double>(outside) / static_cast<double>(items.size());
}

} // namespace hr
