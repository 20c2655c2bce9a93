#pragma once

#include "core/catalog/content_similarity_index.h"

#include <QString>

#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace hnswlib {
class InnerProductSpace;

template <typename dist_t>
class HierarchicalNSW;
} // namespace hnswlib

namespace hr {

class ResourceCatalog;

// Approximate nearest-neighbour index over L2-normalized resource embeddings.
// Inner-product distance on unit vectors gives similarity = 1 - distance.
class HnswContentIndex : public ContentSimilarityIndex {
public:
    static constexpr int kM = 16;
    static constexpr int kEfConstruction = 200;
    static constexpr int kEfSearch = 64;

    explicit HnswContentIndex(int dimensions);
    ~HnswContentIndex() override;

    HnswContentIndex(const HnswContentIndex&) = delete;
    HnswContentIndex& operator=(const HnswContentIndex&) = delete;

    // Indexes every catalog resource with a valid embedding. Returns the number
    // of vectors added; resources with malformed embeddings are skipped.
    int build(const ResourceCatalog& catalog);

    bool addResource(const QString& resourceId, const EmbeddingVector& embedding);

    std::vector<SimilarResource> search(const EmbeddingVector& query,
                                        int k,
                                        double minSimilarity) const override;

    int totalElements() const;
    int dimensions() const { return m_dimensions; }
    bool isAvailable() const { return m_index != nullptr; }

private:
    bool create(int capacity);
    bool ensureCapacityForOneMore();

    int m_dimensions = 0;
    std::unique_ptr<hnswlib::InnerProductSpace> m_space;
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> m_index;
    std::vector<QString> m_labels;   // hnsw label -> resource id
    mutable std::mutex m_mutex;
};

} // namespace hr
