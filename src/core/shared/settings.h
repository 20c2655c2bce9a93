#pragma once

#include "core/shared/scoring_types.h"

#include <QString>

namespace hr {

struct Settings {
    // Storage
    QString dbPath;
    QString catalogPath;      // JSON array of resource metadata
    QString graphPath;        // JSON edge list
    QString modelPath;        // collaborative model weights

    // Embeddings
    int embeddingDim = 768;
    int userEmbeddingTtlSeconds = 300;
    int userEmbeddingMaxInteractions = 100;

    // Candidate generation
    int sourceTimeoutMs = 120;
    int perSourceLimit = 100;
    int mergedCandidateLimit = 100;
    double contentSimilarityThreshold = 0.3;
    int graphMaxHops = 2;
    int graphSeedCount = 10;
    int collaborativeMinInteractions = 5;

    // Ranking
    HybridWeights defaultWeights;
    double noveltyBoostFactor = 0.2;
    double noveltyFloorFraction = 0.2;
    int mmrWindowMultiplier = 2;

    // Preference learning
    int preferenceLearningInterval = 10;
    int preferenceLookbackDays = 90;
    int preferenceMaxRecords = 1000;
    int preferredAuthorCount = 10;

    // Retention
    int feedbackRetentionDays = 180;
};

} // namespace hr
