#pragma once
#include <vector>
#include <optional>
#include "Cavern.hpp"

/**
 * @file PathPlanner.hpp
 * @brief Caminhos mínimos (Dijkstra) sobre o grafo ponderado da caverna.
 */

namespace cavern {

/**
 * @brief Planejador de caminhos mínimos.
 *
 * Todos os pesos são positivos, então Dijkstra é exato. Empates são
 * resolvidos pelo menor índice de nó, o que torna o resultado reprodutível
 * para uma caverna fixa. Consultas sem caminho retornam `std::nullopt`.
 */
class PathPlanner {
public:
    /**
     * @brief Caminho de menor peso de `from` até `to`.
     * @return nós do caminho incluindo os extremos (`{from}` se from == to),
     *         ou std::nullopt se inalcançável
     */
    static std::optional<std::vector<const Node*>> shortestPath(const Cavern& cav, const Node& from, const Node& to);

    /**
     * @brief Soma dos comprimentos das arestas ao longo do caminho.
     * @throws std::invalid_argument se dois nós consecutivos não forem adjacentes
     */
    static int pathWeight(const Cavern& cav, const std::vector<const Node*>& path);

    /** @brief Peso mínimo entre dois nós, ou std::nullopt se inalcançável. */
    static std::optional<int> minDistance(const Cavern& cav, const Node& from, const Node& to);

    /** @brief Peso mínimo de `from` até o alvo designado da caverna. */
    static std::optional<int> minPathLengthToTarget(const Cavern& cav, const Node& from);

    /**
     * @brief Distâncias mínimas de `from` a todos os nós.
     * @return vetor indexado por índice de nó; -1 para inalcançáveis
     */
    static std::vector<int> distancesFrom(const Cavern& cav, const Node& from);

private:
    /** @brief Dijkstra de fonte única; `stop` >= 0 encerra ao fixar esse nó. */
    static void dijkstra(const Cavern& cav, int from, int stop, std::vector<int>& dist, std::vector<int>& prev);
};

} // namespace cavern
