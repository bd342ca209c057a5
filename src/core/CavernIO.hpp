/**
 * @file CavernIO.hpp
 * @brief Serialização textual (por linhas) de cavernas.
 */
#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include "Cavern.hpp"

namespace cavern {

/**
 * @brief Erro de formato ao desserializar uma caverna.
 *
 * `line()` é a linha (1-based) onde o problema foi detectado, ou 0 quando
 * o erro se refere ao arquivo como um todo.
 */
class FormatError : public std::runtime_error {
public:
    FormatError(int line, const std::string& what)
        : std::runtime_error(line > 0 ? "line " + std::to_string(line) + ": " + what : what), line_(line) {}
    int line() const { return line_; }

private:
    int line_;
};

/**
 * @brief Fachada estática para ler e escrever cavernas.
 *
 * Formato:
 * @code
 * cavern 1
 * size <rows> <cols>
 * entrance <row> <col>
 * target <row> <col>
 * <rows linhas com <cols> tokens: '#' (parede) ou <id-hex>:<ouro>>
 * edges <n>
 * <n linhas: <r1> <c1> <r2> <c2> <comprimento>>
 * end
 * @endcode
 * Linhas em branco e linhas iniciadas por ';' são ignoradas.
 */
class CavernIO {
public:
    /**
     * @brief Constrói uma caverna a partir das linhas do formato.
     * @throws FormatError para entrada malformada ou alvo inalcançável
     */
    static Cavern parse(const std::vector<std::string>& lines);

    /** @brief Produz as linhas do formato para a caverna. */
    static std::vector<std::string> serialize(const Cavern& cav);

    /**
     * @brief Lê e desserializa um arquivo.
     * @throws std::runtime_error se o arquivo não puder ser aberto
     * @throws FormatError se o conteúdo for malformado
     */
    static Cavern loadFile(const std::string& path);

    /**
     * @brief Grava a caverna no arquivo (truncando).
     * @return true em caso de sucesso
     */
    static bool saveFile(const std::string& path, const Cavern& cav);
};

} // namespace cavern
