#pragma once

#include "core/shared/types.h"

#include <QJsonObject>
#include <QString>

#include <cstdint>
#include <optional>

namespace hr {

// Caller-supplied context for one tracked event.
struct InteractionContext {
    std::optional<double> dwellTimeSeconds;
    std::optional<double> scrollDepth;   // fraction of the resource scrolled, [0,1]
    std::optional<double> rating;        // 1-5 stars
    QString sessionId;
    std::optional<double> timestamp;     // epoch seconds; defaults to now
};

struct UserInteraction {
    int64_t id = 0;
    QString userId;
    QString resourceId;
    InteractionType type = InteractionType::View;
    double strength = 0.0;
    bool isPositive = false;
    int returnVisits = 0;
    std::optional<double> dwellTimeSeconds;
    std::optional<double> scrollDepth;
    std::optional<double> rating;
    QString sessionId;
    double confidence = 1.0;
    double timestamp = 0.0;
    double updatedAt = 0.0;

    QJsonObject toJson() const;
};

} // namespace hr
