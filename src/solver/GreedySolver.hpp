/**
 * @file GreedySolver.hpp
 * @brief Resolvedor de referência: DFS guiado por distância no FIND e coleta gulosa no SCRAM.
 */
#pragma once
#include "core/Views.hpp"

namespace cavern {

/**
 * @brief Resolvedor simples usado pelos executáveis e pelos testes.
 *
 * FIND: busca em profundidade que prefere vizinhos mais próximos do alvo
 * (Manhattan), voltando pelo caminho percorrido em becos sem saída.
 *
 * SCRAM: visita repetidamente o ladrilho com maior razão ouro/distância cujo
 * desvio ainda cabe no orçamento, e por fim segue o caminho mínimo até a saída.
 */
class GreedySolver : public Solver {
public:
    void exploreForTarget(FindView& view) override;
    void scramToExit(ScramView& view) override;

private:
    /** @brief Percorre o caminho mínimo até `to`. */
    static void walk(ScramView& view, const Node& to);
};

} // namespace cavern
