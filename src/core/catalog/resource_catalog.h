#pragma once

#include <QString>
#include <QStringList>

#include <cstdint>
#include <optional>
#include <vector>

namespace hr {

// Metadata the recommendation core reads about a resource. The embedding is
// carried raw; consumers validate it through EmbeddingVector before use.
struct ResourceMetadata {
    QString resourceId;
    QString title;
    QString source;
    QStringList authors;
    double qualityScore = 0.0;
    double recencyScore = 0.0;
    bool isQualityOutlier = false;
    int64_t viewCount = 0;
    std::vector<double> embedding;
};

// Resource metadata lookup. Implementations must be safe to call from
// concurrent candidate-generation workers.
class ResourceCatalog {
public:
    virtual ~ResourceCatalog() = default;

    virtual std::optional<ResourceMetadata> metadata(const QString& resourceId) const = 0;
    virtual QStringList allResourceIds() const = 0;
};

} // namespace hr
