#include "Session.hpp"
#include "CavernIO.hpp"
#include "Game.hpp"
#include <memory>
#include <random>

namespace cavern {

uint64_t nextSeed(uint64_t seed) {
    std::mt19937_64 rng(seed);
    const uint64_t next = rng();
    return next == 0 ? 1 : next;
}

uint64_t randomSeed() {
    std::random_device rd;
    uint64_t s = (static_cast<uint64_t>(rd()) << 32) ^ rd();
    return s == 0 ? 1 : s;
}

SessionResult runSession(const RunOptions& opt, Solver& solver, Logger& log, Display* display) {
    GameConfig cfg;
    cfg.timeLimited = opt.timeLimited;

    SessionResult res;
    long long total = 0;
    uint64_t seed = opt.seed;
    for (int i = 0; i < opt.repeat; ++i) {
        std::unique_ptr<Game> game;
        if (opt.hasCavernFiles()) {
            game = std::make_unique<Game>(CavernIO::loadFile(opt.findCavernPath),
                                          CavernIO::loadFile(opt.scramCavernPath),
                                          solver, cfg, log, display);
            log.report("Caverns : %s, %s", opt.findCavernPath.c_str(), opt.scramCavernPath.c_str());
        } else {
            const uint64_t s = seed != 0 ? seed : randomSeed();
            game = std::make_unique<Game>(s, solver, cfg, log, display);
            log.report("Seed : %llu", static_cast<unsigned long long>(s));
        }
        game->run();
        res.seeds.push_back(game->seed());
        res.scores.push_back(game->score());
        total += game->score();
        if (seed != 0) seed = nextSeed(seed);
        log.report("%s", "");
    }
    res.averageScore = static_cast<int>(total / opt.repeat);
    log.report("Average score : %d", res.averageScore);
    return res;
}

} // namespace cavern
