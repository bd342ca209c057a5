/**
 * @file Game.hpp
 * @brief Máquina de fases FIND -> SCRAM com execução limitada do resolvedor.
 */
#pragma once
#include <cstdint>
#include "BoundedExecutor.hpp"
#include "Config.hpp"
#include "Display.hpp"
#include "GameRun.hpp"
#include "Logger.hpp"
#include "Views.hpp"

namespace cavern {

/**
 * @brief Uma partida: possui as cavernas e o estado, conduz o resolvedor.
 *
 * O resolvedor recebe apenas a visão da fase corrente, sobre uma cópia do
 * estado; o estado da partida só muda pelos movimentos relatados, reaplicados
 * e validados aqui. Nenhuma falha do resolvedor escapa de `run()`.
 */
class Game {
public:
    /**
     * @brief Partida gerada a partir de uma semente.
     *
     * As dimensões e as duas cavernas são sorteadas do mesmo
     * `std::mt19937_64(seed)`; a caverna do SCRAM começa nas coordenadas do
     * alvo do FIND.
     */
    Game(uint64_t seed, Solver& solver, const GameConfig& cfg = {}, Logger& log = Logger::silent(), Display* display = nullptr);

    /** @brief Partida com cavernas já construídas (ex.: lidas de arquivo). */
    Game(Cavern find, Cavern scram, Solver& solver, const GameConfig& cfg = {}, Logger& log = Logger::silent(), Display* display = nullptr);

    /** @brief Gera o par de cavernas de uma semente. */
    static GameRun generate(uint64_t seed);

    /**
     * @brief FIND e, se bem-sucedido, SCRAM.
     *
     * Ao fim relata ouro, bônus e pontuação, também quando o FIND falha
     * (pontuação 0).
     */
    void run();
    /** @brief Somente o FIND. */
    void runFindOnly();
    /** @brief Somente o SCRAM, a partir da entrada do SCRAM. */
    void runScramOnly();

    uint64_t seed() const { return seed_; }
    const GameRun& state() const { return run_; }
    const PhaseOutcome& findOutcome() const { return find_; }
    const PhaseOutcome& scramOutcome() const { return scram_; }

    int score() const { return run_.score(); }
    double bonusFactor() const { return run_.bonusFactor(); }
    int goldCollected() const { return run_.goldCollected(); }

    /** @brief Distância mínima da entrada ao alvo no início do FIND. */
    int minFindDistance() const { return minFindDistance_; }
    /** @brief Distância mínima do início do SCRAM à saída. */
    int minScramDistance() const { return minScramDistance_; }
    /** @brief Após FIND malsucedido: distância restante até o alvo (-1 se não se aplica). */
    int findDistanceLeft() const { return findDistanceLeft_; }
    /** @brief Após falha: distância restante até a saída (-1 se não se aplica). */
    int scramDistanceLeft() const { return scramDistanceLeft_; }

private:
    void find();
    void scram();
    ExecResult execute(const BoundedExecutor::Body& body, std::chrono::milliseconds deadline,
                       const BoundedExecutor::Handler& handler);
    void fail(Phase phase, const char* what, const std::string& detail);
    void report() const;

    GameRun run_;
    Solver& solver_;
    GameConfig cfg_;
    Logger& log_;
    Display* display_;
    uint64_t seed_{0};

    PhaseOutcome find_{};
    PhaseOutcome scram_{};
    int minFindDistance_{0};
    int minScramDistance_{0};
    int findDistanceLeft_{-1};
    int scramDistanceLeft_{-1};
};

} // namespace cavern
