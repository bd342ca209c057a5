#pragma once
#include <random>
#include "Cavern.hpp"
#include "Config.hpp"

/**
 * @file CavernDigger.hpp
 * @brief Geração procedural de cavernas conexas e ponderadas.
 */

namespace cavern {

/**
 * @brief Parâmetros do escavador. Padrões vêm dos macros `CFG_*`.
 */
struct DigOptions {
    double density{CFG_DIG_DENSITY};     ///< Fração do interior a abrir
    double loopChance{CFG_LOOP_CHANCE};  ///< Chance de aresta extra entre vizinhos abertos
    double goldChance{CFG_GOLD_CHANCE};  ///< Chance de um ladrilho receber ouro
};

/**
 * @brief Escavador de cavernas.
 *
 * Mesma semente (estado do gerador) e mesmas dimensões produzem a mesma
 * caverna: nós, ids, arestas, pesos, ouro, entrada e alvo.
 */
class CavernDigger {
public:
    /**
     * @brief Escava uma caverna com entrada em ladrilho interior aleatório.
     * @param rows linhas em [MIN_ROWS, MAX_ROWS]
     * @param cols colunas em [MIN_COLS, MAX_COLS]
     * @param rng fonte aleatória (avança)
     * @throws std::invalid_argument para dimensões fora da faixa
     */
    static Cavern dig(int rows, int cols, std::mt19937_64& rng, const DigOptions& opt = {});

    /**
     * @brief Escava uma caverna cuja entrada fica em (startRow,startCol).
     *
     * Usado para a caverna do SCRAM, enraizada nas coordenadas do alvo do FIND.
     * @throws std::invalid_argument se o início não for um ladrilho interior
     */
    static Cavern dig(int rows, int cols, int startRow, int startCol, std::mt19937_64& rng, const DigOptions& opt = {});
};

} // namespace cavern
