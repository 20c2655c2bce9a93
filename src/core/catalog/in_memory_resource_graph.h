#pragma once

#include "core/catalog/graph_neighbor_service.h"

#include <QHash>
#include <QJsonArray>
#include <QVector>

namespace hr {

// Undirected weighted resource graph (citations, shared authors, links) held
// in memory. Loaded from a JSON array of {"source", "target", "weight"} edges.
class InMemoryResourceGraph : public GraphNeighborService {
public:
    static constexpr double kHopDecay = 0.5;

    InMemoryResourceGraph() = default;

    bool loadFromFile(const QString& path);
    void loadFromJson(const QJsonArray& edges);
    void addEdge(const QString& a, const QString& b, double weight);

    // Score of a path is the product of its edge weights, decayed by kHopDecay
    // per hop beyond the first. A resource keeps its best-scoring path.
    std::vector<GraphNeighbor> neighbors(const QStringList& seeds,
                                         int maxHops,
                                         int limit) const override;

    int edgeCount() const { return m_edgeCount; }

private:
    struct Edge {
        QString target;
        double weight = 0.0;
    };

    QHash<QString, QVector<Edge>> m_adjacency;
    int m_edgeCount = 0;
};

} // namespace hr
