#pragma once

#include <QString>
#include <QStringList>
#include <vector>

namespace hr {

struct GraphNeighbor {
    QString resourceId;
    double score = 0.0;   // in [0,1]
    int hops = 0;
};

// Resources reachable within N hops of a seed set. Seeds themselves are not
// returned.
class GraphNeighborService {
public:
    virtual ~GraphNeighborService() = default;

    virtual std::vector<GraphNeighbor> neighbors(const QStringList& seeds,
                                                 int maxHops,
                                                 int limit) const = 0;
};

} // namespace hr
