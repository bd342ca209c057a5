#pragma once
#include <vector>
#include <cstdint>
#include <optional>
#include <unordered_map>

/**
 * @file Cavern.hpp
 * @brief Grafo ponderado da caverna: ladrilhos, nós e arestas.
 */

namespace cavern {

/** @brief Identificador único de um nó (não revela coordenadas). */
using NodeId = std::uint64_t;

/**
 * @brief Ladrilho de um nó: coordenadas fixas e ouro coletável.
 */
class Tile {
public:
    /** @brief Constrói o ladrilho em (row,col) com `gold` de ouro. */
    Tile(int row, int col, int gold) : row_(row), col_(col), gold_(gold) {}

    /** @brief Linha do ladrilho na grade. */
    int row() const { return row_; }
    /** @brief Coluna do ladrilho na grade. */
    int column() const { return col_; }
    /** @brief Ouro ainda presente no ladrilho. */
    int gold() const { return gold_; }

    /**
     * @brief Retira todo o ouro do ladrilho.
     * @return quantidade retirada (0 se já vazio)
     */
    int takeGold() { int g = gold_; gold_ = 0; return g; }

private:
    int row_;
    int col_;
    int gold_;
};

/**
 * @brief Aresta não direcionada entre dois nós (índices na caverna).
 */
struct Edge {
    int a{-1};      ///< Índice do primeiro extremo
    int b{-1};      ///< Índice do segundo extremo
    int length{1};  ///< Peso em [1, MAX_EDGE_WEIGHT]

    /** @brief Extremo oposto a `n` (que deve ser `a` ou `b`). */
    int other(int n) const { return n == a ? b : a; }
};

/**
 * @brief Vértice do grafo: identificador, ladrilho e arestas incidentes.
 *
 * A igualdade é por identidade (endereço), não por valor.
 */
class Node {
public:
    /** @brief Constrói o nó `id` na posição `index` da caverna, dono de `tile`. */
    Node(NodeId id, int index, Tile tile) : id_(id), index_(index), tile_(tile) {}

    /** @brief Identificador único do nó. */
    NodeId id() const { return id_; }
    /** @brief Posição do nó no vetor da caverna dona. */
    int index() const { return index_; }
    /** @brief Ladrilho do nó (somente leitura). */
    const Tile& tile() const { return tile_; }
    /** @brief Ladrilho do nó (para retirar ouro). */
    Tile& tile() { return tile_; }
    /** @brief Índices das arestas incidentes, em ordem de inserção. */
    const std::vector<int>& edges() const { return edges_; }

    /** @brief Mesmo nó (identidade). */
    bool operator==(const Node& o) const { return this == &o; }
    /** @brief Nós distintos (identidade). */
    bool operator!=(const Node& o) const { return this != &o; }

private:
    friend class Cavern;
    NodeId id_;
    int index_;
    Tile tile_;
    std::vector<int> edges_{};
};

/**
 * @brief Caverna: grade de ladrilhos com um nó por ladrilho aberto.
 *
 * Paredes não possuem nó. Entrada e alvo são designados por índice.
 */
class Cavern {
public:
    /**
     * @brief Constrói uma caverna vazia (só paredes).
     * @param rows número de linhas
     * @param cols número de colunas
     */
    Cavern(int rows, int cols);

    /** @brief Número de linhas da grade. */
    int rows() const { return rows_; }
    /** @brief Número de colunas da grade. */
    int cols() const { return cols_; }
    /** @brief Verifica se (row,col) está dentro da grade. */
    bool in_bounds(int row, int col) const { return row>=0 && col>=0 && row<rows_ && col<cols_; }

    /**
     * @brief Abre o ladrilho (row,col) criando um nó.
     * @return índice do novo nó
     * @throws std::invalid_argument fora dos limites, ladrilho já aberto ou id repetido
     */
    int addNode(NodeId id, int row, int col, int gold);

    /**
     * @brief Liga dois nós vizinhos por uma aresta.
     * @return índice da nova aresta
     * @throws std::invalid_argument se os nós não forem vizinhos na grade ou já ligados
     */
    int addEdge(int a, int b, int length);

    /**
     * @brief Designa o nó de entrada.
     * @throws std::out_of_range para índice inexistente
     */
    void setEntrance(int index);
    /**
     * @brief Designa o nó alvo (saída no SCRAM).
     * @throws std::out_of_range para índice inexistente
     */
    void setTarget(int index);

    /** @brief Número de nós (ladrilhos abertos). */
    int nodeCount() const { return static_cast<int>(nodes_.size()); }
    /** @brief Ladrilhos abertos (paredes excluídas); igual ao número de nós. */
    int numOpenTiles() const { return nodeCount(); }

    /** @brief Nó pelo índice (somente leitura). @throws std::out_of_range */
    const Node& node(int index) const { return nodes_.at(static_cast<size_t>(index)); }
    /** @brief Nó pelo índice (mutável). @throws std::out_of_range */
    Node& node(int index) { return nodes_.at(static_cast<size_t>(index)); }
    /** @brief Todos os nós, indexados por `Node::index()`. */
    const std::vector<Node>& nodes() const { return nodes_; }
    /** @brief Todas as arestas, em ordem de inserção. */
    const std::vector<Edge>& edges() const { return edges_; }
    /** @brief Aresta pelo índice. @throws std::out_of_range */
    const Edge& edge(int index) const { return edges_.at(static_cast<size_t>(index)); }

    /** @brief Nó de entrada. */
    const Node& entrance() const { return node(entrance_); }
    /** @brief Nó alvo (orbe no FIND, saída no SCRAM). */
    const Node& target() const { return node(target_); }
    /** @brief Índice da entrada (-1 se não designada). */
    int entranceIndex() const { return entrance_; }
    /** @brief Índice do alvo (-1 se não designado). */
    int targetIndex() const { return target_; }

    /** @brief Índice do nó com o id dado, se existir. */
    std::optional<int> indexOf(NodeId id) const;
    /** @brief Índice do nó no ladrilho (row,col), se aberto. */
    std::optional<int> nodeAt(int row, int col) const;
    bool isOpen(int row, int col) const { return nodeAt(row, col).has_value(); }

    /** @brief Aresta entre dois nós, ou nullptr se não forem adjacentes. */
    const Edge* edgeBetween(int a, int b) const;
    /** @brief Índices dos vizinhos de um nó, na ordem das arestas. */
    std::vector<int> neighbors(int index) const;

private:
    int rows_;
    int cols_;
    std::vector<Node> nodes_{};
    std::vector<Edge> edges_{};
    std::vector<int> grid_;                    ///< Índice do nó por ladrilho (-1 = parede), linha-major
    std::unordered_map<NodeId, int> by_id_{};
    int entrance_{-1};
    int target_{-1};
};

} // namespace cavern
