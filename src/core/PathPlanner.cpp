#include "PathPlanner.hpp"
#include <algorithm>
#include <functional>
#include <queue>
#include <stdexcept>
#include <utility>

namespace cavern {

void PathPlanner::dijkstra(const Cavern& cav, int from, int stop, std::vector<int>& dist, std::vector<int>& prev) {
    const int n = cav.nodeCount();
    dist.assign(static_cast<size_t>(n), -1);
    prev.assign(static_cast<size_t>(n), -1);
    std::vector<uint8_t> done(static_cast<size_t>(n), 0);

    using Item = std::pair<int,int>; // (distância, índice)
    std::priority_queue<Item, std::vector<Item>, std::greater<Item>> pq;
    dist[static_cast<size_t>(from)] = 0;
    pq.push({0, from});

    while (!pq.empty()) {
        const auto [d, u] = pq.top();
        pq.pop();
        if (done[static_cast<size_t>(u)]) continue;
        done[static_cast<size_t>(u)] = 1;
        if (u == stop) break;
        for (int e : cav.node(u).edges()) {
            const Edge& ed = cav.edge(e);
            const int v = ed.other(u);
            if (done[static_cast<size_t>(v)]) continue;
            const int nd = d + ed.length;
            int& dv = dist[static_cast<size_t>(v)];
            // só substitui em melhora estrita: empates ficam com o primeiro predecessor
            if (dv < 0 || nd < dv) {
                dv = nd;
                prev[static_cast<size_t>(v)] = u;
                pq.push({nd, v});
            }
        }
    }
}

std::optional<std::vector<const Node*>> PathPlanner::shortestPath(const Cavern& cav, const Node& from, const Node& to) {
    if (from.index() == to.index()) return std::vector<const Node*>{&cav.node(from.index())};
    std::vector<int> dist, prev;
    dijkstra(cav, from.index(), to.index(), dist, prev);
    if (dist[static_cast<size_t>(to.index())] < 0) return std::nullopt;
    std::vector<const Node*> path;
    for (int cur = to.index(); cur != -1; cur = prev[static_cast<size_t>(cur)]) {
        path.push_back(&cav.node(cur));
        if (cur == from.index()) break;
    }
    std::reverse(path.begin(), path.end()); // reconstrói de `to` até `from`
    return path;
}

int PathPlanner::pathWeight(const Cavern& cav, const std::vector<const Node*>& path) {
    int sum = 0;
    for (size_t i = 1; i < path.size(); ++i) {
        const Edge* e = cav.edgeBetween(path[i-1]->index(), path[i]->index());
        if (!e) throw std::invalid_argument("pathWeight: consecutive nodes are not adjacent");
        sum += e->length;
    }
    return sum;
}

std::optional<int> PathPlanner::minDistance(const Cavern& cav, const Node& from, const Node& to) {
    std::vector<int> dist, prev;
    dijkstra(cav, from.index(), to.index(), dist, prev);
    const int d = dist[static_cast<size_t>(to.index())];
    if (d < 0) return std::nullopt;
    return d;
}

std::optional<int> PathPlanner::minPathLengthToTarget(const Cavern& cav, const Node& from) {
    return minDistance(cav, from, cav.target());
}

std::vector<int> PathPlanner::distancesFrom(const Cavern& cav, const Node& from) {
    std::vector<int> dist, prev;
    dijkstra(cav, from.index(), -1, dist, prev);
    return dist;
}

} // namespace cavern
