#pragma once

#include "core/shared/errors.h"

#include <QJsonObject>
#include <optional>

namespace hr {

// Weights of the five hybrid score components.
struct HybridWeights {
    double collaborative = 0.35;
    double content = 0.30;
    double graph = 0.20;
    double quality = 0.10;
    double recency = 0.05;

    static constexpr double kSumTolerance = 1e-6;

    double sum() const { return collaborative + content + graph + quality + recency; }

    // Every component in [0,1] and the total equal to 1.0.
    bool validate(Error* errorOut = nullptr) const;

    QJsonObject toJson() const;

    // Requires all five keys to be present and numeric. Missing keys fail with
    // InvalidWeights rather than falling back to defaults.
    static std::optional<HybridWeights> fromJson(const QJsonObject& json, Error* errorOut = nullptr);
};

} // namespace hr
