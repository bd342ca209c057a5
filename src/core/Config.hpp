#pragma once
#include <chrono>

/**
 * @file Config.hpp
 * @brief Constantes do jogo e parâmetros configuráveis em tempo de compilação.
 */

/**
 * @name Parâmetros de configuração (CFG_*)
 * @brief Macros ajustáveis via `-D` no CMake.
 *
 * - `CFG_FIND_TIMEOUT_MS`: prazo da fase FIND em milissegundos.
 * - `CFG_SCRAM_TIMEOUT_MS`: prazo da fase SCRAM em milissegundos.
 * - `CFG_DIG_DENSITY`: fração do interior da caverna aberta pelo escavador [0..1].
 * - `CFG_LOOP_CHANCE`: probabilidade de ligar dois ladrilhos vizinhos ainda não ligados.
 * - `CFG_GOLD_CHANCE`: probabilidade de um ladrilho aberto receber ouro.
 *
 * Exemplo: `-DCFG_SCRAM_TIMEOUT_MS=20000 -DCFG_DIG_DENSITY=0.6`.
 */
#ifndef CFG_FIND_TIMEOUT_MS
#define CFG_FIND_TIMEOUT_MS 10000
#endif
#ifndef CFG_SCRAM_TIMEOUT_MS
#define CFG_SCRAM_TIMEOUT_MS 15000
#endif
#ifndef CFG_DIG_DENSITY
#define CFG_DIG_DENSITY 0.55
#endif
#ifndef CFG_LOOP_CHANCE
#define CFG_LOOP_CHANCE 0.15
#endif
#ifndef CFG_GOLD_CHANCE
#define CFG_GOLD_CHANCE 0.35
#endif

namespace cavern {

/** @brief Número mínimo de linhas de uma caverna gerada. */
constexpr int MIN_ROWS = 8;
/** @brief Número máximo de linhas de uma caverna gerada. */
constexpr int MAX_ROWS = 25;
/** @brief Número mínimo de colunas de uma caverna gerada. */
constexpr int MIN_COLS = 12;
/** @brief Número máximo de colunas de uma caverna gerada. */
constexpr int MAX_COLS = 40;

/** @brief Maior comprimento possível de uma aresta. */
constexpr int MAX_EDGE_WEIGHT = 15;
/** @brief Maior quantidade de ouro em um único ladrilho. */
constexpr int MAX_TILE_GOLD = 1000;

constexpr double MIN_BONUS = 1.0;
constexpr double MAX_BONUS = 1.3;
/** @brief Folga de passos do SCRAM; maior é mais generoso. */
constexpr double EXTRA_STEPS_FACTOR = 0.3;
/** @brief Razão (passos/ótimo - 1) a partir da qual não há bônus. */
constexpr double NO_BONUS_LENGTH = 3.0;

/**
 * @brief Configuração de execução de um jogo.
 *
 * Os prazos padrão vêm de `CFG_FIND_TIMEOUT_MS` e `CFG_SCRAM_TIMEOUT_MS`.
 * Com `timeLimited` falso as callbacks rodam no próprio processo, sem prazo.
 */
struct GameConfig {
    std::chrono::milliseconds findTimeout{CFG_FIND_TIMEOUT_MS};   ///< Prazo da fase FIND
    std::chrono::milliseconds scramTimeout{CFG_SCRAM_TIMEOUT_MS}; ///< Prazo da fase SCRAM
    bool timeLimited{true};                                       ///< Isola e limita as callbacks
};

} // namespace cavern
