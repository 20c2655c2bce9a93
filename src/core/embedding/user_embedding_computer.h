#pragma once

#include "core/embedding/embedding_vector.h"

#include <QString>

namespace hr {

class InteractionRecorder;
class ResourceCatalog;
class UserEmbeddingCache;

// Strength-weighted average of the embeddings of a user's recent positive
// interactions. Results are memoized in the injected cache.
class UserEmbeddingComputer {
public:
    static constexpr int kDefaultMaxInteractions = 100;

    UserEmbeddingComputer(const InteractionRecorder* recorder,
                          const ResourceCatalog* catalog,
                          UserEmbeddingCache* cache,
                          int dimensions,
                          int maxInteractions = kDefaultMaxInteractions);

    // Always returns a vector of dimensions(); zeros when nothing usable.
    EmbeddingVector userEmbedding(const QString& userId);

    // Bypasses the cache.
    EmbeddingVector compute(const QString& userId) const;

    int dimensions() const { return m_dimensions; }

private:
    const InteractionRecorder* m_recorder = nullptr;
    const ResourceCatalog* m_catalog = nullptr;
    UserEmbeddingCache* m_cache = nullptr;
    int m_dimensions = 0;
    int m_maxInteractions = kDefaultMaxInteractions;
};

} // namespace hr
