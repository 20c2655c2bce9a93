#include "core/embedding/user_embedding_computer.h"
#include "core/catalog/resource_catalog.h"
#include "core/embedding/user_embedding_cache.h"
#include "core/feedback/interaction_recorder.h"
#include "core/shared/logging.h"

#include <vector>

namespace hr {

UserEmbeddingComputer::UserEmbeddingComputer(const InteractionRecorder* recorder,
                                             const ResourceCatalog* catalog,
                                             UserEmbeddingCache* cache,
                                             int dimensions,
                                             int maxInteractions)
    : m_recorder(recorder)
    , m_catalog(catalog)
    , m_cache(cache)
    , m_dimensions(dimensions)
    , m_maxInteractions(maxInteractions)
{
}

EmbeddingVector UserEmbeddingComputer::userEmbedding(const QString& userId)
{
    if (m_cache) {
        if (auto cached = m_cache->get(userId)) {
            if (cached->dimensions() == m_dimensions) {
                return *cached;
            }
        }
    }

    EmbeddingVector embedding = compute(userId);
    if (m_cache) {
        m_cache->put(userId, embedding);
    }
    return embedding;
}

EmbeddingVector UserEmbeddingComputer::compute(const QString& userId) const
{
    if (!m_recorder || !m_catalog || m_dimensions <= 0) {
        return EmbeddingVector::zeros(m_dimensions);
    }

    const std::vector<UserInteraction> interactions =
        m_recorder->positiveInteractions(userId, m_maxInteractions);

    std::vector<double> sum(static_cast<size_t>(m_dimensions), 0.0);
    double totalWeight = 0.0;
    int used = 0;

    for (const UserInteraction& interaction : interactions) {
        const auto meta = m_catalog->metadata(interaction.resourceId);
        if (!meta) {
            LOG_WARN(hrEmbedding, "No metadata for %s, skipping",
                     qUtf8Printable(interaction.resourceId));
            continue;
        }

        Error error;
        const auto vec = EmbeddingVector::fromValues(meta->embedding, m_dimensions, &error);
        if (!vec) {
            LOG_WARN(hrEmbedding, "Skipping malformed embedding for %s: %s",
                     qUtf8Printable(interaction.resourceId), qUtf8Printable(error.message));
            continue;
        }

        const double weight = interaction.strength;
        if (weight <= 0.0) {
            continue;
        }
        const std::vector<float>& values = vec->values();
        for (int i = 0; i < m_dimensions; ++i) {
            sum[static_cast<size_t>(i)] += weight * static_cast<double>(values[static_cast<size_t>(i)]);
        }
        totalWeight += weight;
        ++used;
    }

    if (used == 0 || totalWeight <= 0.0) {
        return EmbeddingVector::zeros(m_dimensions);
    }

    for (double& v : sum) {
        v /= totalWeight;
    }
    auto averaged = EmbeddingVector::fromValues(sum, m_dimensions);
    if (!averaged) {
        return EmbeddingVector::zeros(m_dimensions);
    }
    LOG_DEBUG(hrEmbedding, "User embedding for %s from %d interactions",
              qUtf8Printable(userId), used);
    return *averaged;
}

} // namespace hr
