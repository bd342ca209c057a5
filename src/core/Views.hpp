/**
 * @file Views.hpp
 * @brief Visões restritas por fase entregues ao resolvedor e a interface `Solver`.
 *
 * Cada fase tem sua própria visão: não existe objeto que ofereça operações das
 * duas fases, então chamar uma operação do SCRAM durante o FIND (ou o
 * contrário) não compila.
 */
#pragma once
#include <vector>
#include "BoundedExecutor.hpp"
#include "GameRun.hpp"

namespace cavern {

/**
 * @brief Vizinho visível no FIND: id e distância (Manhattan) até o alvo.
 */
struct NodeStatus {
    NodeId id{0};
    int distanceToTarget{0};

    /** @brief Ordena por distância e, em empate, por id. */
    bool operator<(const NodeStatus& o) const {
        if (distanceToTarget != o.distanceToTarget) return distanceToTarget < o.distanceToTarget;
        return id < o.id;
    }
};

/**
 * @brief Visão do FIND: só a vizinhança imediata e distâncias heurísticas.
 */
class FindView {
public:
    FindView(GameRun& run, MessageSink& sink) : run_(run), sink_(sink) {}

    /** @brief Id do nó atual. */
    NodeId currentLocation() const;

    /**
     * @brief Vizinhos do nó atual com a distância de Manhattan de cada um ao alvo.
     *
     * A distância ignora paredes e pesos das arestas.
     */
    std::vector<NodeStatus> neighbors() const;

    /** @brief Distância de Manhattan do nó atual ao alvo; 0 exatamente no alvo. */
    int distanceToTarget() const;

    /**
     * @brief Move para o vizinho com o id dado.
     * @throws IllegalMoveError se não for vizinho
     */
    void moveTo(NodeId id);

private:
    GameRun& run_;
    MessageSink& sink_;
};

/**
 * @brief Visão do SCRAM: grafo completo, orçamento decrescente.
 */
class ScramView {
public:
    ScramView(GameRun& run, MessageSink& sink) : run_(run), sink_(sink) {}

    const Node& currentNode() const { return run_.position(); }
    const Node& exitNode() const { return run_.scramCavern().target(); }
    /** @brief Todos os nós da caverna do SCRAM. */
    std::vector<const Node*> allNodes() const;
    /** @brief Grafo somente-leitura, para planejamento (ex.: `PathPlanner`). */
    const Cavern& cavern() const { return run_.scramCavern(); }
    int stepsRemaining() const { return run_.stepsRemaining(); }
    int goldCollected() const { return run_.goldCollected(); }

    /**
     * @brief Move para um nó adjacente; ouro no destino é coletado.
     * @throws IllegalMoveError se não for vizinho
     * @throws OutOfStepsError se o peso exceder os passos restantes (estado intacto)
     */
    void moveTo(const Node& n);

private:
    GameRun& run_;
    MessageSink& sink_;
};

/**
 * @brief Lógica de decisão fornecida externamente.
 *
 * Cada método é chamado no máximo uma vez por partida, em processo isolado e
 * com prazo; lançar exceções, não retornar ou retornar fora do lugar são
 * tolerados pelo motor e contados como falha da fase.
 */
class Solver {
public:
    virtual ~Solver() = default;
    /** @brief Deve retornar parado sobre o alvo. */
    virtual void exploreForTarget(FindView& view) = 0;
    /** @brief Deve retornar parado sobre a saída antes de esgotar os passos. */
    virtual void scramToExit(ScramView& view) = 0;
};

} // namespace cavern
