#pragma once
#include <algorithm>
#include <cmath>
#include "Config.hpp"

/**
 * @file Scoring.hpp
 * @brief Multiplicador de bônus, pontuação final e orçamento de passos do SCRAM.
 */

namespace cavern {

/**
 * @brief Multiplicador de bônus pela eficiência do FIND.
 *
 * Vale MAX_BONUS quando `stepsTaken <= minStepsToFind` e decai linearmente
 * até MIN_BONUS quando `stepsTaken` atinge (1 + NO_BONUS_LENGTH) vezes o ótimo.
 *
 * @param stepsTaken     passos dados no FIND
 * @param minStepsToFind peso do caminho mínimo da entrada ao alvo
 * @return valor em [MIN_BONUS, MAX_BONUS]
 */
inline double computeBonusFactor(int stepsTaken, int minStepsToFind) {
    if (minStepsToFind <= 0) return MAX_BONUS;
    const double huntDiff = (stepsTaken - minStepsToFind) / static_cast<double>(minStepsToFind);
    if (huntDiff <= 0) return MAX_BONUS;
    const double multDiff = MAX_BONUS - MIN_BONUS;
    return std::max(MIN_BONUS, MAX_BONUS - huntDiff / NO_BONUS_LENGTH * multDiff);
}

/** @brief Pontuação final: piso de bônus × ouro coletado. */
inline int computeScore(double bonusFactor, int goldCollected) {
    return static_cast<int>(std::floor(bonusFactor * goldCollected));
}

/**
 * @brief Passos concedidos ao SCRAM.
 *
 * Garante o mínimo para sair e soma uma folga proporcional ao tamanho da
 * caverna.
 *
 * @param minScramSteps peso do caminho mínimo do início até a saída
 * @param openTiles     ladrilhos abertos da caverna do SCRAM
 */
inline int computeStepsToScram(int minScramSteps, int openTiles) {
    return static_cast<int>(minScramSteps + EXTRA_STEPS_FACTOR * (MAX_EDGE_WEIGHT + 1) * openTiles / 2);
}

} // namespace cavern
