#include "core/shared/scoring_types.h"

#include <QStringList>

#include <cmath>

namespace hr {

namespace {

const QStringList& componentKeys()
{
    static const QStringList keys = {
        QStringLiteral("collaborative"),
        QStringLiteral("content"),
        QStringLiteral("graph"),
        QStringLiteral("quality"),
        QStringLiteral("recency"),
    };
    return keys;
}

} // namespace

bool HybridWeights::validate(Error* errorOut) const
{
    const double values[] = {collaborative, content, graph, quality, recency};
    for (int i = 0; i < 5; ++i) {
        if (!std::isfinite(values[i]) || values[i] < 0.0 || values[i] > 1.0) {
            setError(errorOut, ErrorCode::InvalidWeights,
                     QStringLiteral("rankingWeights.%1").arg(componentKeys().at(i)),
                     QStringLiteral("weight must be within [0, 1]"));
            return false;
        }
    }

    if (std::abs(sum() - 1.0) > kSumTolerance) {
        setError(errorOut, ErrorCode::InvalidWeights, QStringLiteral("rankingWeights"),
                 QStringLiteral("weights must sum to 1.0 (got %1)").arg(sum(), 0, 'f', 6));
        return false;
    }
    return true;
}

QJsonObject HybridWeights::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("collaborative")] = collaborative;
    json[QStringLiteral("content")] = content;
    json[QStringLiteral("graph")] = graph;
    json[QStringLiteral("quality")] = quality;
    json[QStringLiteral("recency")] = recency;
    return json;
}

std::optional<HybridWeights> HybridWeights::fromJson(const QJsonObject& json, Error* errorOut)
{
    for (const QString& key : componentKeys()) {
        if (!json.value(key).isDouble()) {
            setError(errorOut, ErrorCode::InvalidWeights,
                     QStringLiteral("rankingWeights.%1").arg(key),
                     QStringLiteral("all five components must be supplied as numbers"));
            return std::nullopt;
        }
    }

    HybridWeights weights;
    weights.collaborative = json.value(QStringLiteral("collaborative")).toDouble();
    weights.content = json.value(QStringLiteral("content")).toDouble();
    weights.graph = json.value(QStringLiteral("graph")).toDouble();
    weights.quality = json.value(QStringLiteral("quality")).toDouble();
    weights.recency = json.value(QStringLiteral("recency")).toDouble();
    if (!weights.validate(errorOut)) {
        return std::nullopt;
    }
    return weights;
}

} // namespace hr
