#include "Views.hpp"

namespace cavern {

NodeId FindView::currentLocation() const {
    return run_.position().id();
}

std::vector<NodeStatus> FindView::neighbors() const {
    std::vector<NodeStatus> out;
    const Cavern& cav = run_.findCavern();
    for (int n : cav.neighbors(run_.position().index())) {
        const Node& nb = cav.node(n);
        out.push_back(NodeStatus{nb.id(), run_.manhattanToTarget(nb.tile().row(), nb.tile().column())});
    }
    return out;
}

int FindView::distanceToTarget() const {
    const Tile& t = run_.position().tile();
    return run_.manhattanToTarget(t.row(), t.column());
}

void FindView::moveTo(NodeId id) {
    run_.findMoveTo(id);
    sink_.send(PhaseMessage{PhaseMessage::Kind::Move, id, {}});
}

std::vector<const Node*> ScramView::allNodes() const {
    std::vector<const Node*> out;
    out.reserve(run_.scramCavern().nodes().size());
    for (const Node& n : run_.scramCavern().nodes()) out.push_back(&n);
    return out;
}

void ScramView::moveTo(const Node& n) {
    try {
        run_.scramMoveTo(n.id());
    } catch (const OutOfStepsError&) {
        sink_.send(PhaseMessage{PhaseMessage::Kind::OutOfSteps, n.id(), {}});
        throw;
    }
    sink_.send(PhaseMessage{PhaseMessage::Kind::Move, n.id(), {}});
}

} // namespace cavern
