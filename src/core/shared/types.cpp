#include "core/shared/types.h"

namespace hr {

QString interactionTypeToString(InteractionType type)
{
    switch (type) {
    case InteractionType::View:          return QStringLiteral("view");
    case InteractionType::Annotation:    return QStringLiteral("annotation");
    case InteractionType::CollectionAdd: return QStringLiteral("collection_add");
    case InteractionType::Export:        return QStringLiteral("export");
    case InteractionType::Rating:        return QStringLiteral("rating");
    }
    return QStringLiteral("view");
}

std::optional<InteractionType> interactionTypeFromString(const QString& str)
{
    const QString normalized = str.trimmed().toLower();
    if (normalized == QLatin1String("view"))           return InteractionType::View;
    if (normalized == QLatin1String("annotation"))     return InteractionType::Annotation;
    if (normalized == QLatin1String("collection_add")) return InteractionType::CollectionAdd;
    if (normalized == QLatin1String("export"))         return InteractionType::Export;
    if (normalized == QLatin1String("rating"))         return InteractionType::Rating;
    return std::nullopt;
}

QString strategyToString(Strategy strategy)
{
    switch (strategy) {
    case Strategy::Collaborative: return QStringLiteral("collaborative");
    case Strategy::Content:       return QStringLiteral("content");
    case Strategy::Graph:         return QStringLiteral("graph");
    case Strategy::Hybrid:        return QStringLiteral("hybrid");
    }
    return QStringLiteral("hybrid");
}

std::optional<Strategy> strategyFromString(const QString& str)
{
    const QString normalized = str.trimmed().toLower();
    if (normalized == QLatin1String("collaborative")) return Strategy::Collaborative;
    if (normalized == QLatin1String("content"))       return Strategy::Content;
    if (normalized == QLatin1String("graph"))         return Strategy::Graph;
    if (normalized == QLatin1String("hybrid"))        return Strategy::Hybrid;
    return std::nullopt;
}

} // namespace hr
