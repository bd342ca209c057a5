/**
 * @file RunOptions.hpp
 * @brief Opções de linha de comando dos executáveis.
 */
#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace cavern {

/** @brief Argumento inválido na fronteira do processo. */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Opções de uma série de partidas.
 */
struct RunOptions {
    uint64_t seed{0};           ///< 0 = sortear
    int repeat{1};              ///< Número de partidas (>= 1)
    bool display{false};        ///< Abrir visualização
    bool timeLimited{true};     ///< Falso com --no-timeout
    bool quiet{false};          ///< Só erros
    bool help{false};
    std::string findCavernPath{};  ///< -l: caverna do FIND
    std::string scramCavernPath{}; ///< -l: caverna do SCRAM

    bool hasCavernFiles() const { return !findCavernPath.empty(); }
};

/**
 * @brief Interpreta os argumentos (sem o nome do programa).
 *
 * `-s <seed>`, `-n <count>`, `-g`, `-l <find> <scram>`, `--no-timeout`,
 * `-q`, `-h`.
 * @throws ConfigError para número malformado, valor ausente ou opção desconhecida
 */
RunOptions parseRunOptions(const std::vector<std::string>& args);

/** @brief Texto de uso para `prog`. */
std::string runUsage(const std::string& prog);

} // namespace cavern
