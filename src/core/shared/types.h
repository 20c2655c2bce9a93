#pragma once

#include <QString>
#include <optional>

namespace hr {

// Engagement events accepted by the interaction recorder.
enum class InteractionType {
    View,
    Annotation,
    CollectionAdd,
    Export,
    Rating,
};

QString interactionTypeToString(InteractionType type);
std::optional<InteractionType> interactionTypeFromString(const QString& str);

// Retrieval strategies. Hybrid is only valid as a request strategy;
// candidates are tagged with one of the three concrete sources.
enum class Strategy {
    Collaborative,
    Content,
    Graph,
    Hybrid,
};

QString strategyToString(Strategy strategy);
std::optional<Strategy> strategyFromString(const QString& str);

} // namespace hr
