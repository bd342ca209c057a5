/**
 * @file Game.cpp
 * @brief Condução das fases, verificação de chegada e relatório de pontuação.
 */
#include "Game.hpp"
#include "CavernDigger.hpp"
#include "PathPlanner.hpp"
#include <random>
#include <utility>

namespace cavern {

namespace {

NullDisplay g_null_display;

int distance_or_unknown(const Cavern& cav, const Node& from) {
    auto d = PathPlanner::minPathLengthToTarget(cav, from);
    return d ? *d : -1;
}

} // namespace

GameRun Game::generate(uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<int> rows_dist(MIN_ROWS, MAX_ROWS);
    std::uniform_int_distribution<int> cols_dist(MIN_COLS, MAX_COLS);
    const int rows = rows_dist(rng);
    const int cols = cols_dist(rng);
    Cavern find = CavernDigger::dig(rows, cols, rng);
    const int tr = find.target().tile().row();
    const int tc = find.target().tile().column();
    Cavern scram = CavernDigger::dig(rows, cols, tr, tc, rng);
    return GameRun(std::move(find), std::move(scram));
}

Game::Game(uint64_t seed, Solver& solver, const GameConfig& cfg, Logger& log, Display* display)
    : run_(generate(seed)), solver_(solver), cfg_(cfg), log_(log),
      display_(display ? display : &g_null_display), seed_(seed) {}

Game::Game(Cavern find, Cavern scram, Solver& solver, const GameConfig& cfg, Logger& log, Display* display)
    : run_(std::move(find), std::move(scram)), solver_(solver), cfg_(cfg), log_(log),
      display_(display ? display : &g_null_display) {}

void Game::run() {
    find();
    if (!find_.succeeded) {
        findDistanceLeft_ = distance_or_unknown(run_.findCavern(), run_.position());
        scramDistanceLeft_ = distance_or_unknown(run_.scramCavern(), run_.scramCavern().entrance());
    } else {
        scram();
        if (!scram_.succeeded) {
            scramDistanceLeft_ = distance_or_unknown(run_.scramCavern(), run_.position());
        }
    }
    report();
}

void Game::runFindOnly() {
    find();
    if (!find_.succeeded) {
        findDistanceLeft_ = distance_or_unknown(run_.findCavern(), run_.position());
    }
    report();
}

void Game::runScramOnly() {
    scram();
    if (!scram_.succeeded) {
        scramDistanceLeft_ = distance_or_unknown(run_.scramCavern(), run_.position());
    }
    report();
}

ExecResult Game::execute(const BoundedExecutor::Body& body, std::chrono::milliseconds deadline,
                         const BoundedExecutor::Handler& handler) {
    try {
        if (cfg_.timeLimited) return BoundedExecutor::runIsolated(body, deadline, handler);
        return BoundedExecutor::runInline(body, handler);
    } catch (const std::exception& e) {
        // falha do próprio motor (fork, pipe ou reaplicação divergente)
        return ExecResult{ExecStatus::Faulted, std::string("engine: ") + e.what()};
    }
}

void Game::fail(Phase phase, const char* what, const std::string& detail) {
    if (detail.empty()) {
        log_.error("Your solution to %s %s.", phaseName(phase), what);
    } else {
        log_.error("Your solution to %s %s: %s", phaseName(phase), what, detail.c_str());
    }
    display_->errorShown(std::string("Your solution to ") + phaseName(phase) + " " + what + ".");
}

void Game::find() {
    run_.beginFind();
    find_ = PhaseOutcome{};
    minFindDistance_ = run_.minStepsToFind();
    display_->cavernChanged(run_.findCavern(), Phase::Find, 0);
    display_->positionChanged(run_.position());
    display_->phaseChanged("Finding");

    auto body = [this](MessageSink& sink) {
        GameRun sandbox = run_;
        FindView view(sandbox, sink);
        solver_.exploreForTarget(view);
    };
    auto handler = [this](const PhaseMessage& m) {
        if (m.kind != PhaseMessage::Kind::Move) return;
        run_.findMoveTo(m.node);
        display_->positionChanged(run_.position());
        display_->bonusChanged(run_.bonusFactor());
    };

    const ExecResult r = execute(body, cfg_.findTimeout, handler);
    switch (r.status) {
        case ExecStatus::TimedOut:
            find_.timedOut = true;
            fail(Phase::Find, "timed out", r.detail);
            break;
        case ExecStatus::Faulted:
            find_.errored = true;
            fail(Phase::Find, "errored", r.detail);
            break;
        case ExecStatus::Completed:
            if (run_.atTarget()) {
                find_.succeeded = true;
            } else {
                fail(Phase::Find, "returned at the wrong location", "");
            }
            break;
    }
    log_.debug("find: %s after %d steps (optimal %d)", execStatusName(r.status), run_.stepsTaken(), minFindDistance_);
}

void Game::scram() {
    run_.beginScram();
    scram_ = PhaseOutcome{};
    minScramDistance_ = distance_or_unknown(run_.scramCavern(), run_.position());
    display_->cavernChanged(run_.scramCavern(), Phase::Scram, run_.stepsRemaining());
    display_->positionChanged(run_.position());
    display_->goldChanged(run_.goldCollected(), run_.score());
    display_->phaseChanged("Scramming");

    auto body = [this](MessageSink& sink) {
        GameRun sandbox = run_;
        ScramView view(sandbox, sink);
        try {
            solver_.scramToExit(view);
        } catch (const OutOfStepsError&) {
            // já relatado pelo sink como OutOfSteps; a fase termina aqui
        }
    };
    auto handler = [this](const PhaseMessage& m) {
        if (m.kind == PhaseMessage::Kind::OutOfSteps) {
            scram_.outOfSteps = true;
            return;
        }
        if (m.kind != PhaseMessage::Kind::Move) return;
        const int gold = run_.scramMoveTo(m.node);
        display_->stepsRemainingChanged(run_.stepsRemaining());
        display_->positionChanged(run_.position());
        if (gold > 0) display_->goldChanged(run_.goldCollected(), run_.score());
    };

    const ExecResult r = execute(body, cfg_.scramTimeout, handler);
    switch (r.status) {
        case ExecStatus::TimedOut:
            scram_.timedOut = true;
            fail(Phase::Scram, "timed out", r.detail);
            break;
        case ExecStatus::Faulted:
            scram_.errored = true;
            fail(Phase::Scram, "errored", r.detail);
            break;
        case ExecStatus::Completed:
            if (scram_.outOfSteps) {
                fail(Phase::Scram, "ran out of steps before returning", "");
            } else if (run_.atTarget()) {
                scram_.succeeded = true;
                display_->phaseChanged("Scram succeeded");
            } else {
                fail(Phase::Scram, "returned at the wrong location", "");
            }
            break;
    }
}

void Game::report() const {
    log_.report("Gold collected   : %d", run_.goldCollected());
    log_.report("Bonus multiplier : %.2f", run_.bonusFactor());
    log_.report("Score            : %d", run_.score());
}

} // namespace cavern
