#include "GreedySolver.hpp"
#include "core/PathPlanner.hpp"
#include <algorithm>
#include <unordered_set>

namespace cavern {

void GreedySolver::exploreForTarget(FindView& view) {
    std::unordered_set<NodeId> visited;
    std::vector<NodeId> trail;
    visited.insert(view.currentLocation());
    while (view.distanceToTarget() != 0) {
        auto nbs = view.neighbors();
        std::sort(nbs.begin(), nbs.end());
        bool advanced = false;
        for (const NodeStatus& n : nbs) {
            if (visited.count(n.id)) continue;
            trail.push_back(view.currentLocation());
            visited.insert(n.id);
            view.moveTo(n.id);
            advanced = true;
            break;
        }
        if (advanced) continue;
        // beco: volta um passo
        if (trail.empty()) return;
        const NodeId back = trail.back();
        trail.pop_back();
        view.moveTo(back);
    }
}

void GreedySolver::walk(ScramView& view, const Node& to) {
    auto path = PathPlanner::shortestPath(view.cavern(), view.currentNode(), to);
    if (!path) return;
    for (size_t i = 1; i < path->size(); ++i) {
        view.moveTo(*(*path)[i]);
    }
}

void GreedySolver::scramToExit(ScramView& view) {
    const Cavern& cav = view.cavern();
    const Node& exit = view.exitNode();
    const std::vector<int> toExit = PathPlanner::distancesFrom(cav, exit);

    for (;;) {
        const std::vector<int> fromHere = PathPlanner::distancesFrom(cav, view.currentNode());
        const Node* best = nullptr;
        double bestRatio = 0.0;
        for (const Node& n : cav.nodes()) {
            const int gold = n.tile().gold();
            if (gold <= 0 || n == view.currentNode()) continue;
            const int d = fromHere[static_cast<size_t>(n.index())];
            const int back = toExit[static_cast<size_t>(n.index())];
            if (d <= 0 || back < 0 || d + back > view.stepsRemaining()) continue;
            const double ratio = static_cast<double>(gold) / d;
            if (ratio > bestRatio) {
                bestRatio = ratio;
                best = &n;
            }
        }
        if (!best) break;
        walk(view, *best);
    }
    walk(view, exit);
}

} // namespace cavern
