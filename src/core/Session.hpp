/**
 * @file Session.hpp
 * @brief Série de partidas: semente, repetição e média de pontuação.
 */
#pragma once
#include <cstdint>
#include <vector>
#include "Display.hpp"
#include "Logger.hpp"
#include "RunOptions.hpp"
#include "Views.hpp"

namespace cavern {

/** @brief Resultado de uma série. */
struct SessionResult {
    std::vector<uint64_t> seeds{};  ///< Semente de cada partida (0 para cavernas lidas)
    std::vector<int> scores{};      ///< Pontuação de cada partida
    int averageScore{0};            ///< Média inteira
};

/** @brief Semente da partida seguinte de uma série com semente fixa (nunca 0). */
uint64_t nextSeed(uint64_t seed);

/** @brief Semente não nula sorteada do sistema. */
uint64_t randomSeed();

/**
 * @brief Joga `opt.repeat` partidas e relata cada pontuação e a média.
 *
 * Falhas do resolvedor viram pontuação (possivelmente 0); apenas erros de
 * leitura das cavernas (`FormatError`, `std::runtime_error`) escapam.
 */
SessionResult runSession(const RunOptions& opt, Solver& solver, Logger& log, Display* display = nullptr);

} // namespace cavern
