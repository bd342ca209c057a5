#include "GameRun.hpp"
#include "PathPlanner.hpp"
#include "Scoring.hpp"
#include <climits>
#include <cstdlib>
#include <utility>

namespace cavern {

const char* phaseName(Phase p) {
    return p == Phase::Find ? "find" : "scram";
}

static int required_distance(const Cavern& cav, const Node& from, const char* what) {
    auto d = PathPlanner::minPathLengthToTarget(cav, from);
    if (!d) throw std::invalid_argument(std::string("GameRun: ") + what + " target is unreachable");
    return *d;
}

GameRun::GameRun(Cavern find, Cavern scram)
    : find_(std::move(find)), scram_(std::move(scram)) {
    minStepsToFind_ = required_distance(find_, find_.entrance(), "find");
    (void)required_distance(scram_, scram_.entrance(), "scram");
    position_ = find_.entranceIndex();
    stepsRemaining_ = INT_MAX;
}

void GameRun::beginFind() {
    phase_ = Phase::Find;
    position_ = find_.entranceIndex();
    stepsTaken_ = 0;
    stepsRemaining_ = INT_MAX;
}

void GameRun::beginScram() {
    phase_ = Phase::Scram;
    position_ = scram_.entranceIndex();
    const int min_scram = required_distance(scram_, scram_.entrance(), "scram");
    stepsRemaining_ = computeStepsToScram(min_scram, scram_.numOpenTiles());
    collectGold();
}

void GameRun::findMoveTo(NodeId id) {
    if (phase_ != Phase::Find) {
        throw PhaseError("moveTo(id) can only be called while finding");
    }
    for (int n : find_.neighbors(position_)) {
        if (find_.node(n).id() == id) {
            position_ = n;
            ++stepsTaken_;
            return;
        }
    }
    throw IllegalMoveError("moveTo: node must be adjacent to the current position");
}

int GameRun::scramMoveTo(NodeId id) {
    if (phase_ != Phase::Scram) {
        throw PhaseError("moveTo(node) can only be called while scramming");
    }
    auto dest = scram_.indexOf(id);
    const Edge* e = dest ? scram_.edgeBetween(position_, *dest) : nullptr;
    if (!e) {
        throw IllegalMoveError("moveTo: node must be adjacent to the current position");
    }
    if (e->length > stepsRemaining_) {
        throw OutOfStepsError();
    }
    position_ = *dest;
    stepsRemaining_ -= e->length;
    return collectGold();
}

int GameRun::collectGold() {
    Tile& t = scram_.node(position_).tile();
    if (t.gold() <= 0) return 0;
    const int g = t.takeGold();
    goldCollected_ += g;
    return g;
}

int GameRun::manhattanToTarget(int row, int col) const {
    const Tile& t = find_.target().tile();
    return std::abs(row - t.row()) + std::abs(col - t.column());
}

double GameRun::bonusFactor() const {
    return computeBonusFactor(stepsTaken_, minStepsToFind_);
}

int GameRun::score() const {
    return computeScore(bonusFactor(), goldCollected_);
}

} // namespace cavern
