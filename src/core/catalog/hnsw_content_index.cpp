#include "core/catalog/hnsw_content_index.h"
#include "core/catalog/resource_catalog.h"
#include "core/shared/logging.h"

#include "hnswlib/hnswlib.h"

#include <algorithm>

namespace hr {

HnswContentIndex::HnswContentIndex(int dimensions)
    : m_dimensions(dimensions)
{
}

HnswContentIndex::~HnswContentIndex() = default;

bool HnswContentIndex::create(int capacity)
{
    if (m_dimensions <= 0) {
        LOG_ERROR(hrEmbedding, "HnswContentIndex requires a positive dimension");
        return false;
    }

    try {
        m_space = std::make_unique<hnswlib::InnerProductSpace>(static_cast<size_t>(m_dimensions));
        m_index = std::make_unique<hnswlib::HierarchicalNSW<float>>(
            m_space.get(),
            static_cast<size_t>(std::max(capacity, 1)),
            static_cast<size_t>(kM),
            static_cast<size_t>(kEfConstruction));
        m_index->setEf(static_cast<size_t>(kEfSearch));
        m_labels.clear();
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(hrEmbedding, "HnswContentIndex create failed: %s", e.what());
        m_index.reset();
        m_space.reset();
        return false;
    }
}

int HnswContentIndex::build(const ResourceCatalog& catalog)
{
    const QStringList ids = catalog.allResourceIds();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!create(std::max(static_cast<int>(ids.size()), 16))) {
            return 0;
        }
    }

    int added = 0;
    int skipped = 0;
    for (const QString& id : ids) {
        const auto meta = catalog.metadata(id);
        if (!meta || meta->embedding.empty()) {
            continue;
        }
        Error error;
        const auto embedding = EmbeddingVector::fromValues(meta->embedding, m_dimensions, &error);
        if (!embedding) {
            ++skipped;
            LOG_DEBUG(hrEmbedding, "Skipping resource %s: %s",
                      qUtf8Printable(id), qUtf8Printable(error.message));
            continue;
        }
        if (addResource(id, *embedding)) {
            ++added;
        }
    }

    LOG_INFO(hrEmbedding, "Content index built: %d vectors (%d malformed skipped)", added, skipped);
    return added;
}

bool HnswContentIndex::addResource(const QString& resourceId, const EmbeddingVector& embedding)
{
    if (embedding.dimensions() != m_dimensions || embedding.isZero()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_index && !create(16)) {
        return false;
    }
    if (!ensureCapacityForOneMore()) {
        return false;
    }

    const EmbeddingVector unit = embedding.normalized();
    const size_t label = m_labels.size();
    try {
        m_index->addPoint(unit.data(), static_cast<hnswlib::labeltype>(label));
        m_labels.push_back(resourceId);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(hrEmbedding, "HnswContentIndex addResource failed: %s", e.what());
        return false;
    }
}

std::vector<SimilarResource> HnswContentIndex::search(const EmbeddingVector& query,
                                                      int k,
                                                      double minSimilarity) const
{
    std::vector<SimilarResource> results;
    if (k <= 0 || query.dimensions() != m_dimensions || query.isZero()) {
        return results;
    }

    const EmbeddingVector unit = query.normalized();

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_index || m_labels.empty()) {
        return results;
    }

    try {
        const size_t wanted = std::min(static_cast<size_t>(k), m_labels.size());
        m_index->setEf(std::max(static_cast<size_t>(kEfSearch), wanted));
        auto queue = m_index->searchKnn(unit.data(), wanted);
        results.reserve(queue.size());
        while (!queue.empty()) {
            const auto entry = queue.top();
            queue.pop();
            const double similarity = 1.0 - static_cast<double>(entry.first);
            const size_t label = static_cast<size_t>(entry.second);
            if (similarity > minSimilarity && label < m_labels.size()) {
                results.push_back(SimilarResource{m_labels[label], similarity});
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR(hrEmbedding, "HnswContentIndex search failed: %s", e.what());
        return {};
    }

    std::sort(results.begin(), results.end(), [](const SimilarResource& a, const SimilarResource& b) {
        if (a.similarity != b.similarity) {
            return a.similarity > b.similarity;
        }
        return a.resourceId < b.resourceId;
    });
    return results;
}

int HnswContentIndex::totalElements() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index ? static_cast<int>(m_index->getCurrentElementCount()) : 0;
}

bool HnswContentIndex::ensureCapacityForOneMore()
{
    const size_t current = m_index->getCurrentElementCount();
    const size_t capacity = m_index->getMaxElements();
    if (current < capacity) {
        return true;
    }
    try {
        m_index->resizeIndex(std::max(capacity * 2, capacity + 16));
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(hrEmbedding, "HnswContentIndex resize failed: %s", e.what());
        return false;
    }
}

} // namespace hr
