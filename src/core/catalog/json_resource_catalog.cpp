#include "core/catalog/json_resource_catalog.h"
#include "core/shared/logging.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>

#include <algorithm>
#include <limits>

namespace hr {

namespace {

ResourceMetadata parseResource(const QJsonObject& obj)
{
    ResourceMetadata meta;
    meta.resourceId = obj.value(QStringLiteral("id")).toString().trimmed();
    meta.title = obj.value(QStringLiteral("title")).toString();
    meta.source = obj.value(QStringLiteral("source")).toString().trimmed().toLower();
    for (const QJsonValue& author : obj.value(QStringLiteral("authors")).toArray()) {
        const QString name = author.toString().trimmed();
        if (!name.isEmpty()) {
            meta.authors.append(name);
        }
    }
    meta.qualityScore = std::clamp(obj.value(QStringLiteral("qualityScore")).toDouble(0.0), 0.0, 1.0);
    meta.recencyScore = std::clamp(obj.value(QStringLiteral("recencyScore")).toDouble(0.0), 0.0, 1.0);
    meta.isQualityOutlier = obj.value(QStringLiteral("isQualityOutlier")).toBool(false);
    meta.viewCount = std::max<int64_t>(
        0, static_cast<int64_t>(obj.value(QStringLiteral("viewCount")).toDouble(0.0)));

    // Non-numeric entries become NaN so EmbeddingVector rejects the vector later.
    const QJsonArray embedding = obj.value(QStringLiteral("embedding")).toArray();
    meta.embedding.reserve(static_cast<size_t>(embedding.size()));
    for (const QJsonValue& value : embedding) {
        meta.embedding.push_back(value.isDouble()
            ? value.toDouble()
            : std::numeric_limits<double>::quiet_NaN());
    }
    return meta;
}

} // namespace

bool JsonResourceCatalog::loadFromFile(const QString& path)
{
    QFile file(path);
    if (!file.exists() || !file.open(QIODevice::ReadOnly)) {
        LOG_WARN(hrCore, "Resource catalog not readable: %s", qUtf8Printable(path));
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();
    if (parseError.error != QJsonParseError::NoError || !doc.isArray()) {
        LOG_WARN(hrCore, "Resource catalog JSON invalid (%s): %s",
                 qUtf8Printable(path), qUtf8Printable(parseError.errorString()));
        return false;
    }

    loadFromJson(doc.array());
    LOG_INFO(hrCore, "Loaded %d resources from %s", size(), qUtf8Printable(path));
    return true;
}

void JsonResourceCatalog::loadFromJson(const QJsonArray& resources)
{
    m_resources.clear();
    m_ids.clear();

    for (const QJsonValue& value : resources) {
        if (!value.isObject()) {
            continue;
        }
        ResourceMetadata meta = parseResource(value.toObject());
        if (meta.resourceId.isEmpty()) {
            continue;
        }
        if (!m_resources.contains(meta.resourceId)) {
            m_ids.append(meta.resourceId);
        }
        m_resources.insert(meta.resourceId, std::move(meta));
    }
    std::sort(m_ids.begin(), m_ids.end());
}

std::optional<ResourceMetadata> JsonResourceCatalog::metadata(const QString& resourceId) const
{
    const auto it = m_resources.constFind(resourceId);
    if (it == m_resources.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

QStringList JsonResourceCatalog::allResourceIds() const
{
    return m_ids;
}

} // namespace hr
