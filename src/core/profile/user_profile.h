#pragma once

#include "core/shared/scoring_types.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <optional>

namespace hr {

struct UserProfile {
    QString userId;
    double diversityPreference = 0.5;
    double noveltyPreference = 0.3;
    double recencyBias = 0.5;
    QStringList researchDomains;
    QString activeDomain;
    QStringList excludedSources;
    QStringList preferredAuthors;
    std::optional<HybridWeights> rankingWeights;
    int totalInteractions = 0;
    std::optional<double> lastActiveAt;
    double createdAt = 0.0;
    double updatedAt = 0.0;

    QJsonObject toJson() const;
};

// Partial update of the user-editable profile settings. Unset fields keep
// their stored value.
struct ProfileUpdate {
    std::optional<double> diversityPreference;
    std::optional<double> noveltyPreference;
    std::optional<double> recencyBias;
    std::optional<QStringList> excludedSources;
    std::optional<QStringList> researchDomains;
    std::optional<QString> activeDomain;
    std::optional<HybridWeights> rankingWeights;
    bool clearRankingWeights = false;
};

} // namespace hr
