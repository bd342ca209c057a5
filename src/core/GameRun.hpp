/**
 * @file GameRun.hpp
 * @brief Estado mutável de uma partida e regras de movimento por fase.
 */
#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include "Cavern.hpp"

namespace cavern {

/** @brief Fases do jogo; a transição é sempre Find -> Scram. */
enum class Phase : uint8_t { Find, Scram };

/** @brief Nome legível da fase ("find"/"scram"). */
const char* phaseName(Phase p);

/** @brief Movimento para nó não adjacente à posição atual. */
class IllegalMoveError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/** @brief Operação restrita a uma fase chamada na outra fase. */
class PhaseError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/** @brief Movimento do SCRAM cujo peso excede os passos restantes. */
class OutOfStepsError : public std::runtime_error {
public:
    OutOfStepsError() : std::runtime_error("scram ran out of steps before returning") {}
};

/**
 * @brief Resultado de uma fase.
 */
struct PhaseOutcome {
    bool succeeded{false};  ///< Terminou no nó esperado
    bool errored{false};    ///< Callback falhou (exceção, movimento ilegal, queda)
    bool timedOut{false};   ///< Prazo esgotado
    bool outOfSteps{false}; ///< Só SCRAM: tentou mover além do orçamento
};

/**
 * @brief Estado de uma partida: cavernas, posição, contadores e resultados.
 *
 * É copiável: o executor entrega uma cópia (sandbox) à callback do
 * resolvedor e reaplica no original os movimentos relatados.
 */
class GameRun {
public:
    /**
     * @brief Constrói a partida a partir das duas cavernas.
     * @throws std::invalid_argument se alguma caverna não tiver alvo alcançável
     */
    GameRun(Cavern find, Cavern scram);

    /** @brief Fase corrente. */
    Phase phase() const { return phase_; }
    /** @brief Caverna do FIND. */
    const Cavern& findCavern() const { return find_; }
    /** @brief Caverna do SCRAM (com o ouro restante). */
    const Cavern& scramCavern() const { return scram_; }
    /** @brief Caverna da fase atual. */
    const Cavern& cavern() const { return phase_ == Phase::Find ? find_ : scram_; }
    /** @brief Nó atual na caverna da fase atual. */
    const Node& position() const { return cavern().node(position_); }

    /** @brief Movimentos feitos no FIND. */
    int stepsTaken() const { return stepsTaken_; }
    /** @brief Orçamento restante do SCRAM (nunca negativo). */
    int stepsRemaining() const { return stepsRemaining_; }
    /** @brief Ouro recolhido no SCRAM. */
    int goldCollected() const { return goldCollected_; }
    /** @brief Peso do caminho mínimo da entrada ao alvo do FIND. */
    int minStepsToFind() const { return minStepsToFind_; }

    /** @brief Reinicia o FIND: posição na entrada, zero passos. */
    void beginFind();

    /**
     * @brief Passa ao SCRAM: posição na entrada do SCRAM, orçamento calculado
     *        e coleta do ouro do ladrilho inicial.
     */
    void beginScram();

    /**
     * @brief Move no FIND para o vizinho com o id dado.
     * @throws PhaseError fora do FIND
     * @throws IllegalMoveError se o nó não for vizinho
     */
    void findMoveTo(NodeId id);

    /**
     * @brief Move no SCRAM para o vizinho com o id dado, coletando ouro.
     *
     * Em caso de falha nenhum estado é alterado.
     * @return ouro coletado neste movimento
     * @throws PhaseError fora do SCRAM
     * @throws IllegalMoveError se o nó não for vizinho
     * @throws OutOfStepsError se o peso da aresta exceder os passos restantes
     */
    int scramMoveTo(NodeId id);

    /** @brief Distância de Manhattan de (row,col) ao alvo do FIND. */
    int manhattanToTarget(int row, int col) const;

    /** @brief Posição atual é o alvo da caverna da fase. */
    bool atTarget() const { return position_ == cavern().targetIndex(); }

    /** @brief Multiplicador de bônus com os passos atuais. */
    double bonusFactor() const;
    /** @brief Pontuação com o ouro atual. */
    int score() const;

private:
    int collectGold();

    Cavern find_;
    Cavern scram_;
    Phase phase_{Phase::Find};
    int position_{0};
    int stepsTaken_{0};
    int stepsRemaining_{0};
    int goldCollected_{0};
    int minStepsToFind_{0};
};

} // namespace cavern
