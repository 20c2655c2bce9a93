#pragma once

#include "core/embedding/embedding_vector.h"

#include <QString>
#include <vector>

namespace hr {

struct SimilarResource {
    QString resourceId;
    double similarity = 0.0;
};

// Top-K lookup of resources by embedding cosine similarity.
class ContentSimilarityIndex {
public:
    virtual ~ContentSimilarityIndex() = default;

    // Results are ordered by similarity descending and only include entries
    // strictly above minSimilarity.
    virtual std::vector<SimilarResource> search(const EmbeddingVector& query,
                                                int k,
                                                double minSimilarity) const = 0;
};

} // namespace hr
