#pragma once

#include "core/catalog/resource_catalog.h"

#include <QHash>
#include <QJsonArray>

namespace hr {

// Immutable catalog loaded from a JSON array of resource objects:
//   {"id", "title", "source", "authors": [], "qualityScore", "recencyScore",
//    "isQualityOutlier", "viewCount", "embedding": []}
class JsonResourceCatalog : public ResourceCatalog {
public:
    JsonResourceCatalog() = default;

    bool loadFromFile(const QString& path);
    void loadFromJson(const QJsonArray& resources);

    std::optional<ResourceMetadata> metadata(const QString& resourceId) const override;
    QStringList allResourceIds() const override;
    int size() const { return m_resources.size(); }

private:
    QHash<QString, ResourceMetadata> m_resources;
    QStringList m_ids;
};

} // namespace hr
