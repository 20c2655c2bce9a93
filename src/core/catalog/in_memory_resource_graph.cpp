#include "core/catalog/in_memory_resource_graph.h"
#include "core/shared/logging.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSet>

#include <algorithm>
#include <cmath>

namespace hr {

bool InMemoryResourceGraph::loadFromFile(const QString& path)
{
    QFile file(path);
    if (!file.exists() || !file.open(QIODevice::ReadOnly)) {
        LOG_WARN(hrCore, "Resource graph not readable: %s", qUtf8Printable(path));
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();
    if (parseError.error != QJsonParseError::NoError || !doc.isArray()) {
        LOG_WARN(hrCore, "Resource graph JSON invalid (%s): %s",
                 qUtf8Printable(path), qUtf8Printable(parseError.errorString()));
        return false;
    }

    loadFromJson(doc.array());
    LOG_INFO(hrCore, "Loaded %d graph edges from %s", m_edgeCount, qUtf8Printable(path));
    return true;
}

void InMemoryResourceGraph::loadFromJson(const QJsonArray& edges)
{
    m_adjacency.clear();
    m_edgeCount = 0;
    for (const QJsonValue& value : edges) {
        const QJsonObject edge = value.toObject();
        addEdge(edge.value(QStringLiteral("source")).toString().trimmed(),
                edge.value(QStringLiteral("target")).toString().trimmed(),
                edge.value(QStringLiteral("weight")).toDouble(1.0));
    }
}

void InMemoryResourceGraph::addEdge(const QString& a, const QString& b, double weight)
{
    if (a.isEmpty() || b.isEmpty() || a == b || !std::isfinite(weight)) {
        return;
    }
    const double w = std::clamp(weight, 0.0, 1.0);
    if (w <= 0.0) {
        return;
    }
    m_adjacency[a].push_back(Edge{b, w});
    m_adjacency[b].push_back(Edge{a, w});
    ++m_edgeCount;
}

std::vector<GraphNeighbor> InMemoryResourceGraph::neighbors(const QStringList& seeds,
                                                            int maxHops,
                                                            int limit) const
{
    std::vector<GraphNeighbor> out;
    if (seeds.isEmpty() || maxHops <= 0 || limit <= 0) {
        return out;
    }

    const QSet<QString> seedSet(seeds.begin(), seeds.end());
    QHash<QString, GraphNeighbor> best;

    // Frontier carries the best path score reaching each node at the current depth.
    QHash<QString, double> frontier;
    for (const QString& seed : seedSet) {
        frontier.insert(seed, 1.0);
    }

    for (int hop = 1; hop <= maxHops && !frontier.isEmpty(); ++hop) {
        const double decay = hop == 1 ? 1.0 : std::pow(kHopDecay, hop - 1);
        QHash<QString, double> next;
        for (auto it = frontier.constBegin(); it != frontier.constEnd(); ++it) {
            const auto adjacency = m_adjacency.constFind(it.key());
            if (adjacency == m_adjacency.constEnd()) {
                continue;
            }
            for (const Edge& edge : adjacency.value()) {
                if (seedSet.contains(edge.target)) {
                    continue;
                }
                const double pathWeight = it.value() * edge.weight;
                if (pathWeight > next.value(edge.target, 0.0)) {
                    next.insert(edge.target, pathWeight);
                }
                const double score = pathWeight * decay;
                auto existing = best.find(edge.target);
                if (existing == best.end()) {
                    best.insert(edge.target, GraphNeighbor{edge.target, score, hop});
                } else if (score > existing->score) {
                    existing->score = score;
                    existing->hops = hop;
                }
            }
        }
        frontier = std::move(next);
    }

    out.reserve(static_cast<size_t>(best.size()));
    for (auto it = best.constBegin(); it != best.constEnd(); ++it) {
        out.push_back(it.value());
    }
    std::sort(out.begin(), out.end(), [](const GraphNeighbor& a, const GraphNeighbor& b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        return a.resourceId < b.resourceId;
    });
    if (static_cast<int>(out.size()) > limit) {
        out.resize(static_cast<size_t>(limit));
    }
    return out;
}

} // namespace hr
