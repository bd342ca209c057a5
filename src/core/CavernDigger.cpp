/**
 * @file CavernDigger.cpp
 * @brief Escavação por fronteira aleatória, trançado de corredores e sorteio de alvo/ouro.
 */
#include "CavernDigger.hpp"
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <utility>
#include <vector>

namespace cavern {

namespace {

/** @brief Deslocamentos N, E, S, W. */
constexpr int DR[4] = {-1, 0, 1, 0};
constexpr int DC[4] = {0, 1, 0, -1};

/**
 * @brief Estado de uma escavação em andamento.
 */
struct Dig {
    Cavern& cav;
    std::mt19937_64& rng;
    const DigOptions& opt;
    std::uniform_int_distribution<int> weight{1, MAX_EDGE_WEIGHT};
    std::uniform_int_distribution<int> amount{1, MAX_TILE_GOLD};
    std::bernoulli_distribution gold_coin;
    std::bernoulli_distribution loop_coin;

    Dig(Cavern& c, std::mt19937_64& r, const DigOptions& o)
        : cav(c), rng(r), opt(o), gold_coin(o.goldChance), loop_coin(o.loopChance) {}

    bool interior(int r, int c) const {
        return r >= 1 && c >= 1 && r < cav.rows() - 1 && c < cav.cols() - 1;
    }

    /** @brief Sorteia um id ainda não usado nesta caverna. */
    NodeId fresh_id() {
        NodeId id = rng();
        while (cav.indexOf(id)) id = rng();
        return id;
    }

    int open(int r, int c, bool with_gold) {
        int g = 0;
        if (with_gold && gold_coin(rng)) g = amount(rng);
        return cav.addNode(fresh_id(), r, c, g);
    }
};

void validate_dims(int rows, int cols) {
    if (rows < MIN_ROWS || rows > MAX_ROWS || cols < MIN_COLS || cols > MAX_COLS) {
        throw std::invalid_argument("CavernDigger: dimensions out of range");
    }
}

Cavern dig_from(int rows, int cols, int sr, int sc, std::mt19937_64& rng, const DigOptions& opt) {
    Cavern cav(rows, cols);
    Dig d(cav, rng, opt);
    if (!d.interior(sr, sc)) {
        throw std::invalid_argument("CavernDigger: start must be an interior tile");
    }

    const int interior_count = (rows - 2) * (cols - 2);
    int goal = static_cast<int>(std::ceil(opt.density * interior_count));
    if (goal < 2) goal = 2;
    if (goal > interior_count) goal = interior_count;

    // 1) Entrada (sem ouro)
    const int start = d.open(sr, sc, false);
    cav.setEntrance(start);

    // 2) Fronteira aleatória: (ladrilho fechado, nó pai)
    std::vector<std::pair<int,int>> frontier;
    auto push_walls = [&](int idx) {
        const Tile& t = cav.node(idx).tile();
        for (int k = 0; k < 4; ++k) {
            int r = t.row() + DR[k], c = t.column() + DC[k];
            if (d.interior(r, c) && !cav.isOpen(r, c)) frontier.push_back({r * cols + c, idx});
        }
    };
    push_walls(start);
    while (cav.nodeCount() < goal && !frontier.empty()) {
        std::uniform_int_distribution<size_t> pick(0, frontier.size() - 1);
        const size_t k = pick(rng);
        std::swap(frontier[k], frontier.back());
        const auto [cell, parent] = frontier.back();
        frontier.pop_back();
        const int r = cell / cols, c = cell % cols;
        if (cav.isOpen(r, c)) continue;
        const int idx = d.open(r, c, true);
        cav.addEdge(parent, idx, d.weight(rng));
        push_walls(idx);
    }

    // 3) Trançado: liga vizinhos abertos ainda desconectados, criando laços
    for (int i = 0; i < cav.nodeCount(); ++i) {
        const Tile& t = cav.node(i).tile();
        for (int k = 1; k <= 2; ++k) { // leste e sul
            auto j = cav.nodeAt(t.row() + DR[k], t.column() + DC[k]);
            if (!j || cav.edgeBetween(i, *j)) continue;
            if (d.loop_coin(rng)) cav.addEdge(i, *j, d.weight(rng));
        }
    }

    // 4) Alvo: preferência por ladrilhos longe da entrada
    const int far = (rows + cols) / 3;
    std::vector<int> near_ok, far_ok;
    for (int i = 0; i < cav.nodeCount(); ++i) {
        if (i == start) continue;
        const Tile& t = cav.node(i).tile();
        near_ok.push_back(i);
        if (std::abs(t.row() - sr) + std::abs(t.column() - sc) >= far) far_ok.push_back(i);
    }
    const std::vector<int>& pool = far_ok.empty() ? near_ok : far_ok;
    if (pool.empty()) {
        throw std::logic_error("CavernDigger: no tile available for the target");
    }
    std::uniform_int_distribution<size_t> pick(0, pool.size() - 1);
    cav.setTarget(pool[pick(rng)]);
    return cav;
}

} // namespace

Cavern CavernDigger::dig(int rows, int cols, std::mt19937_64& rng, const DigOptions& opt) {
    validate_dims(rows, cols);
    std::uniform_int_distribution<int> dr(1, rows - 2), dc(1, cols - 2);
    const int sr = dr(rng);
    const int sc = dc(rng);
    return dig_from(rows, cols, sr, sc, rng, opt);
}

Cavern CavernDigger::dig(int rows, int cols, int startRow, int startCol, std::mt19937_64& rng, const DigOptions& opt) {
    validate_dims(rows, cols);
    return dig_from(rows, cols, startRow, startCol, rng, opt);
}

} // namespace cavern
