/**
 * Testes da máquina de fases: sucesso, local errado, falha, prazo e falta de passos.
 *
 * Como executar: ctest -R test_game
 */
#include "unity.h"
#include "core/Game.hpp"
#include "core/Scoring.hpp"
#include "solver/GreedySolver.hpp"
#include "TestCaverns.hpp"
#include <chrono>
#include <cstdio>
#include <functional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace cavern;
using namespace std::chrono_literals;

void setUp() {}
void tearDown() {}

/** @brief Resolvedor montado a partir de duas funções. */
struct ScriptedSolver : Solver {
    std::function<void(FindView&)> onFind = [](FindView&) {};
    std::function<void(ScramView&)> onScram = [](ScramView&) {};
    void exploreForTarget(FindView& v) override { onFind(v); }
    void scramToExit(ScramView& v) override { onScram(v); }
};

static void walk_find(FindView& v) {
    v.moveTo(0x102);
    v.moveTo(0x103);
}

static void walk_scram(ScramView& v) {
    const Cavern& c = v.cavern();
    v.moveTo(c.node(1));
    v.moveTo(c.node(2));
}

static Game corridor_game(Solver& s, const GameConfig& cfg, Logger& log = Logger::silent(),
                          Display* display = nullptr) {
    return Game(testing::corridor(0x100, 0, 0, 0, 1, 1),
                testing::corridor(0x200, 5, 7, 0, 2, 3), s, cfg, log, display);
}

/** @brief Display que registra cada evento como texto, na ordem recebida. */
struct RecordingDisplay : Display {
    std::vector<std::string> events;

    void cavernChanged(const Cavern&, Phase phase, int steps) override {
        events.push_back(std::string("cavern:") + phaseName(phase) + ":" + std::to_string(steps));
    }
    void positionChanged(const Node& n) override {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "pos:%llx", static_cast<unsigned long long>(n.id()));
        events.push_back(buf);
    }
    void stepsRemainingChanged(int steps) override { events.push_back("steps:" + std::to_string(steps)); }
    void bonusChanged(double bonus) override {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "bonus:%.2f", bonus);
        events.push_back(buf);
    }
    void goldChanged(int gold, int score) override {
        events.push_back("gold:" + std::to_string(gold) + ":" + std::to_string(score));
    }
    void phaseChanged(const std::string& label) override { events.push_back("phase:" + label); }
    void errorShown(const std::string& message) override { events.push_back("error:" + message); }
};

static void assert_events(const std::vector<std::string>& expected, const std::vector<std::string>& got) {
    TEST_ASSERT_EQUAL_INT((int)expected.size(), (int)got.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        TEST_ASSERT_EQUAL_STRING(expected[i].c_str(), got[i].c_str());
    }
}

static void assert_same_outcome(const PhaseOutcome& a, const PhaseOutcome& b) {
    TEST_ASSERT_EQUAL_INT(a.succeeded, b.succeeded);
    TEST_ASSERT_EQUAL_INT(a.errored, b.errored);
    TEST_ASSERT_EQUAL_INT(a.timedOut, b.timedOut);
    TEST_ASSERT_EQUAL_INT(a.outOfSteps, b.outOfSteps);
}

static std::string drain(std::FILE* f) {
    std::rewind(f);
    std::string text;
    char buf[512];
    while (std::fgets(buf, sizeof(buf), f)) text += buf;
    std::fclose(f);
    return text;
}

static GameConfig short_deadlines() {
    GameConfig cfg;
    cfg.findTimeout = 500ms;
    cfg.scramTimeout = 500ms;
    return cfg;
}

void test_default_deadlines() {
    GameConfig cfg;
    TEST_ASSERT_EQUAL_INT(10000, (int)cfg.findTimeout.count());
    TEST_ASSERT_EQUAL_INT(15000, (int)cfg.scramTimeout.count());
    TEST_ASSERT_TRUE(cfg.timeLimited);
}

void test_scripted_game_succeeds_and_reports() {
    ScriptedSolver s;
    s.onFind = walk_find;
    s.onScram = walk_scram;
    std::FILE* out = std::tmpfile();
    TEST_ASSERT_NOT_NULL(out);
    Logger log(LogLevel::Info, out, out);
    Game g = corridor_game(s, short_deadlines(), log);
    g.run();
    TEST_ASSERT_TRUE(g.findOutcome().succeeded);
    TEST_ASSERT_TRUE(g.scramOutcome().succeeded);
    TEST_ASSERT_EQUAL_INT(12, g.goldCollected());
    TEST_ASSERT_EQUAL_INT(15, g.score());
    TEST_ASSERT_EQUAL_INT(2, g.minFindDistance());
    TEST_ASSERT_EQUAL_INT(5, g.minScramDistance());
    TEST_ASSERT_EQUAL_INT(-1, g.findDistanceLeft());
    TEST_ASSERT_EQUAL_INT(-1, g.scramDistanceLeft());

    std::rewind(out);
    char buf[512];
    std::string text;
    while (std::fgets(buf, sizeof(buf), out)) text += buf;
    std::fclose(out);
    TEST_ASSERT_TRUE(text.find("Score            : 15") != std::string::npos);
    TEST_ASSERT_TRUE(text.find("Gold collected   : 12") != std::string::npos);
}

void test_find_at_wrong_location_skips_scram() {
    ScriptedSolver s;
    s.onFind = [](FindView& v) { v.moveTo(0x102); };
    bool scram_called = false;
    s.onScram = [&](ScramView&) { scram_called = true; };
    Game g = corridor_game(s, short_deadlines());
    g.run();
    const PhaseOutcome& f = g.findOutcome();
    TEST_ASSERT_FALSE(f.succeeded);
    TEST_ASSERT_FALSE(f.errored);
    TEST_ASSERT_FALSE(f.timedOut);
    TEST_ASSERT_FALSE(scram_called);
    TEST_ASSERT_EQUAL_INT(1, g.findDistanceLeft());
    TEST_ASSERT_EQUAL_INT(5, g.scramDistanceLeft());
    TEST_ASSERT_EQUAL_INT(0, g.score());
}

void test_find_exception_marks_errored() {
    ScriptedSolver s;
    s.onFind = [](FindView& v) {
        v.moveTo(0x102);
        v.moveTo(0x101);
        v.moveTo(0x103); // ilegal: não é vizinho de 0x101
    };
    Game g = corridor_game(s, short_deadlines());
    g.run();
    TEST_ASSERT_TRUE(g.findOutcome().errored);
    TEST_ASSERT_FALSE(g.findOutcome().succeeded);
    // os movimentos válidos anteriores ficaram registrados
    TEST_ASSERT_EQUAL_INT(2, g.state().stepsTaken());
    TEST_ASSERT_TRUE(g.state().position().id() == 0x101);
}

void test_never_returning_find_times_out() {
    ScriptedSolver s;
    s.onFind = [](FindView& v) {
        v.moveTo(0x102);
        for (;;) std::this_thread::sleep_for(10ms);
    };
    GameConfig cfg = short_deadlines();
    cfg.findTimeout = 300ms;
    Game g = corridor_game(s, cfg);
    g.run();
    TEST_ASSERT_TRUE(g.findOutcome().timedOut);
    TEST_ASSERT_FALSE(g.findOutcome().errored);
    TEST_ASSERT_EQUAL_INT(1, g.state().stepsTaken());
}

void test_never_returning_scram_times_out_only() {
    ScriptedSolver s;
    s.onFind = walk_find;
    s.onScram = [](ScramView& v) {
        v.moveTo(v.cavern().node(1));
        for (;;) std::this_thread::sleep_for(10ms);
    };
    GameConfig cfg = short_deadlines();
    cfg.scramTimeout = 300ms;
    Game g = corridor_game(s, cfg);
    const auto t0 = std::chrono::steady_clock::now();
    g.run();
    const auto elapsed = std::chrono::steady_clock::now() - t0;
    const PhaseOutcome& sc = g.scramOutcome();
    TEST_ASSERT_TRUE(sc.timedOut);
    TEST_ASSERT_FALSE(sc.errored);
    TEST_ASSERT_FALSE(sc.succeeded);
    TEST_ASSERT_FALSE(sc.outOfSteps);
    TEST_ASSERT_TRUE(elapsed < 5s);
    // ouro coletado antes do prazo conta
    TEST_ASSERT_EQUAL_INT(12, g.goldCollected());
    TEST_ASSERT_EQUAL_INT(3, g.scramDistanceLeft());
    TEST_ASSERT_EQUAL_INT(15, g.score());
}

void test_out_of_steps_is_unsuccessful_not_errored() {
    ScriptedSolver s;
    s.onFind = walk_find;
    s.onScram = [](ScramView& v) {
        const Cavern& c = v.cavern();
        for (;;) {
            const Node& next = v.currentNode() == c.node(0) ? c.node(1) : c.node(0);
            v.moveTo(next);
        }
    };
    Game g = corridor_game(s, short_deadlines());
    g.run();
    const PhaseOutcome& sc = g.scramOutcome();
    TEST_ASSERT_TRUE(sc.outOfSteps);
    TEST_ASSERT_FALSE(sc.succeeded);
    TEST_ASSERT_FALSE(sc.errored);
    TEST_ASSERT_FALSE(sc.timedOut);
    TEST_ASSERT_TRUE(g.state().stepsRemaining() >= 0);
    TEST_ASSERT_TRUE(g.state().stepsRemaining() < 2);
}

void test_scram_at_wrong_location() {
    ScriptedSolver s;
    s.onFind = walk_find;
    s.onScram = [](ScramView& v) { v.moveTo(v.cavern().node(1)); };
    Game g = corridor_game(s, short_deadlines());
    g.run();
    TEST_ASSERT_FALSE(g.scramOutcome().succeeded);
    TEST_ASSERT_FALSE(g.scramOutcome().errored);
    TEST_ASSERT_EQUAL_INT(3, g.scramDistanceLeft());
}

void test_single_phase_runs() {
    ScriptedSolver s;
    s.onFind = walk_find;
    s.onScram = walk_scram;
    GameConfig cfg;
    cfg.timeLimited = false;
    Game onlyScram = corridor_game(s, cfg);
    onlyScram.runScramOnly();
    TEST_ASSERT_TRUE(onlyScram.scramOutcome().succeeded);
    TEST_ASSERT_FALSE(onlyScram.findOutcome().succeeded);
    TEST_ASSERT_EQUAL_INT(12, onlyScram.goldCollected());

    Game onlyFind = corridor_game(s, cfg);
    onlyFind.runFindOnly();
    TEST_ASSERT_TRUE(onlyFind.findOutcome().succeeded);
    TEST_ASSERT_EQUAL_INT(0, onlyFind.goldCollected());
}

void test_inline_mode_reports_failures_too() {
    ScriptedSolver s;
    s.onFind = [](FindView&) { throw std::runtime_error("solver bug"); };
    GameConfig cfg;
    cfg.timeLimited = false;
    Game g = corridor_game(s, cfg);
    g.run();
    TEST_ASSERT_TRUE(g.findOutcome().errored);
    TEST_ASSERT_EQUAL_INT(0, g.score());
}

void test_greedy_solver_wins_generated_games() {
    GreedySolver solver;
    for (uint64_t seed = 1; seed <= 5; ++seed) {
        Game g(seed * 7919, solver);
        g.run();
        TEST_ASSERT_TRUE(g.findOutcome().succeeded);
        TEST_ASSERT_TRUE(g.scramOutcome().succeeded);
        TEST_ASSERT_TRUE(g.state().stepsRemaining() >= 0);
        TEST_ASSERT_TRUE(g.bonusFactor() >= MIN_BONUS && g.bonusFactor() <= MAX_BONUS);
        TEST_ASSERT_EQUAL_INT((int)(g.bonusFactor() * g.goldCollected()), g.score());
    }
}

static void check_display_events_on_success(const GameConfig& cfg) {
    ScriptedSolver s;
    s.onFind = walk_find;
    s.onScram = walk_scram;
    RecordingDisplay rec;
    Game shown = corridor_game(s, cfg, Logger::silent(), &rec);
    shown.run();
    Game plain = corridor_game(s, cfg);
    plain.run();

    const int budget = computeStepsToScram(5, 3);
    assert_events({
        "cavern:find:0", "pos:101", "phase:Finding",
        "pos:102", "bonus:1.30", "pos:103", "bonus:1.30",
        "cavern:scram:" + std::to_string(budget), "pos:201", "gold:5:6", "phase:Scramming",
        "steps:" + std::to_string(budget - 2), "pos:202", "gold:12:15",
        "steps:" + std::to_string(budget - 5), "pos:203",
        "phase:Scram succeeded",
    }, rec.events);
    assert_same_outcome(plain.findOutcome(), shown.findOutcome());
    assert_same_outcome(plain.scramOutcome(), shown.scramOutcome());
    TEST_ASSERT_EQUAL_INT(plain.score(), shown.score());
}

static void check_display_events_on_wrong_location(const GameConfig& cfg) {
    ScriptedSolver s;
    s.onFind = [](FindView& v) { v.moveTo(0x102); };
    RecordingDisplay rec;
    Game shown = corridor_game(s, cfg, Logger::silent(), &rec);
    shown.run();
    Game plain = corridor_game(s, cfg);
    plain.run();

    assert_events({
        "cavern:find:0", "pos:101", "phase:Finding", "pos:102", "bonus:1.30",
        "error:Your solution to find returned at the wrong location.",
    }, rec.events);
    assert_same_outcome(plain.findOutcome(), shown.findOutcome());
    assert_same_outcome(plain.scramOutcome(), shown.scramOutcome());
}

void test_display_follows_isolated_replay() {
    check_display_events_on_success(short_deadlines());
    check_display_events_on_wrong_location(short_deadlines());
}

void test_display_follows_inline_run() {
    GameConfig cfg;
    cfg.timeLimited = false;
    check_display_events_on_success(cfg);
    check_display_events_on_wrong_location(cfg);
}

void test_failed_find_still_reports_score() {
    ScriptedSolver s;
    s.onFind = [](FindView&) {};
    std::FILE* out = std::tmpfile();
    TEST_ASSERT_NOT_NULL(out);
    Logger log(LogLevel::Info, out, out);
    Game g = corridor_game(s, short_deadlines(), log);
    g.run();
    const std::string text = drain(out);
    TEST_ASSERT_FALSE(g.findOutcome().succeeded);
    TEST_ASSERT_TRUE(text.find("Score            : 0") != std::string::npos);
    TEST_ASSERT_TRUE(text.find("Gold collected   : 0") != std::string::npos);
}

int main(int argc, char** argv) {
    (void)argc; (void)argv;
    UNITY_BEGIN();
    RUN_TEST(test_default_deadlines);
    RUN_TEST(test_scripted_game_succeeds_and_reports);
    RUN_TEST(test_find_at_wrong_location_skips_scram);
    RUN_TEST(test_find_exception_marks_errored);
    RUN_TEST(test_never_returning_find_times_out);
    RUN_TEST(test_never_returning_scram_times_out_only);
    RUN_TEST(test_out_of_steps_is_unsuccessful_not_errored);
    RUN_TEST(test_scram_at_wrong_location);
    RUN_TEST(test_single_phase_runs);
    RUN_TEST(test_inline_mode_reports_failures_too);
    RUN_TEST(test_greedy_solver_wins_generated_games);
    RUN_TEST(test_display_follows_isolated_replay);
    RUN_TEST(test_display_follows_inline_run);
    RUN_TEST(test_failed_find_still_reports_score);
    return UNITY_END();
}
