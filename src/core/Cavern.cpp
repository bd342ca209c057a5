/**
 * @file Cavern.cpp
 * @brief Construção e consultas do grafo da caverna.
 */
#include "Cavern.hpp"
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace cavern {

Cavern::Cavern(int rows, int cols)
    : rows_(rows), cols_(cols) {
    if (rows <= 0 || cols <= 0) {
        throw std::invalid_argument("Cavern: dimensions must be positive");
    }
    grid_.assign(static_cast<size_t>(rows) * static_cast<size_t>(cols), -1);
}

int Cavern::addNode(NodeId id, int row, int col, int gold) {
    if (!in_bounds(row, col)) {
        throw std::invalid_argument("addNode: tile (" + std::to_string(row) + "," + std::to_string(col) + ") out of bounds");
    }
    int& slot = grid_[static_cast<size_t>(row * cols_ + col)];
    if (slot != -1) {
        throw std::invalid_argument("addNode: tile (" + std::to_string(row) + "," + std::to_string(col) + ") already open");
    }
    if (by_id_.count(id)) {
        throw std::invalid_argument("addNode: duplicate node id");
    }
    const int index = nodeCount();
    nodes_.emplace_back(id, index, Tile(row, col, gold));
    slot = index;
    by_id_.emplace(id, index);
    return index;
}

int Cavern::addEdge(int a, int b, int length) {
    const Node& na = node(a);
    const Node& nb = node(b);
    const int dr = std::abs(na.tile().row() - nb.tile().row());
    const int dc = std::abs(na.tile().column() - nb.tile().column());
    if (dr + dc != 1) {
        throw std::invalid_argument("addEdge: nodes are not grid neighbours");
    }
    if (edgeBetween(a, b)) {
        throw std::invalid_argument("addEdge: nodes already connected");
    }
    if (length <= 0) {
        throw std::invalid_argument("addEdge: length must be positive");
    }
    const int index = static_cast<int>(edges_.size());
    edges_.push_back(Edge{a, b, length});
    nodes_[static_cast<size_t>(a)].edges_.push_back(index);
    nodes_[static_cast<size_t>(b)].edges_.push_back(index);
    return index;
}

void Cavern::setEntrance(int index) {
    (void)node(index); // valida o índice
    entrance_ = index;
}

void Cavern::setTarget(int index) {
    (void)node(index);
    target_ = index;
}

std::optional<int> Cavern::indexOf(NodeId id) const {
    auto it = by_id_.find(id);
    if (it == by_id_.end()) return std::nullopt;
    return it->second;
}

std::optional<int> Cavern::nodeAt(int row, int col) const {
    if (!in_bounds(row, col)) return std::nullopt;
    const int i = grid_[static_cast<size_t>(row * cols_ + col)];
    if (i < 0) return std::nullopt;
    return i;
}

const Edge* Cavern::edgeBetween(int a, int b) const {
    for (int e : node(a).edges()) {
        const Edge& ed = edges_[static_cast<size_t>(e)];
        if (ed.other(a) == b) return &ed;
    }
    return nullptr;
}

std::vector<int> Cavern::neighbors(int index) const {
    std::vector<int> out;
    const Node& n = node(index);
    out.reserve(n.edges().size());
    for (int e : n.edges()) out.push_back(edges_[static_cast<size_t>(e)].other(index));
    return out;
}

} // namespace cavern
