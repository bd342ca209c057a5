/**
 * @file CavernIO.cpp
 * @brief Leitura/escrita do formato textual de cavernas.
 */
#include "CavernIO.hpp"
#include "Config.hpp"
#include "PathPlanner.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace cavern {

namespace {

/** @brief Linha significativa com seu número original. */
struct Line {
    int number;
    std::vector<std::string> tokens;
};

std::vector<std::string> split(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream iss(s);
    std::string tok;
    while (iss >> tok) out.push_back(tok);
    return out;
}

/**
 * @brief Cursor sobre as linhas significativas (ignora vazias e comentários).
 */
class Reader {
public:
    explicit Reader(const std::vector<std::string>& raw) {
        for (size_t i = 0; i < raw.size(); ++i) {
            auto toks = split(raw[i]);
            if (toks.empty() || toks[0][0] == ';') continue;
            lines_.push_back(Line{static_cast<int>(i) + 1, std::move(toks)});
        }
        last_ = static_cast<int>(raw.size());
    }

    bool done() const { return pos_ >= lines_.size(); }

    const Line& next(const char* expected) {
        if (done()) throw FormatError(last_ + 1, std::string("unexpected end of input, expected ") + expected);
        return lines_[pos_++];
    }

    /** @brief Próxima linha que deve começar com `keyword` e ter `count` valores. */
    const Line& keyword(const char* kw, size_t count) {
        const Line& l = next(kw);
        if (l.tokens[0] != kw) {
            throw FormatError(l.number, std::string("expected '") + kw + "', found '" + l.tokens[0] + "'");
        }
        if (l.tokens.size() != count + 1) {
            throw FormatError(l.number, std::string("'") + kw + "' expects " + std::to_string(count) + " value(s)");
        }
        return l;
    }

private:
    std::vector<Line> lines_;
    size_t pos_{0};
    int last_{0};
};

int to_int(const std::string& s, int line, const char* what) {
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (s.empty() || *end != '\0' || errno == ERANGE || v < -2147483647L || v > 2147483647L) {
        throw FormatError(line, std::string("invalid ") + what + " '" + s + "'");
    }
    return static_cast<int>(v);
}

NodeId to_id(const std::string& s, int line) {
    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(s.c_str(), &end, 16);
    if (s.empty() || s[0] == '-' || *end != '\0' || errno == ERANGE) {
        throw FormatError(line, "invalid node id '" + s + "'");
    }
    return static_cast<NodeId>(v);
}

int open_at(const Cavern& cav, int row, int col, int line, const char* what) {
    auto idx = cav.nodeAt(row, col);
    if (!idx) {
        throw FormatError(line, std::string(what) + " (" + std::to_string(row) + "," + std::to_string(col) + ") is not an open tile");
    }
    return *idx;
}

} // namespace

Cavern CavernIO::parse(const std::vector<std::string>& lines) {
    Reader in(lines);

    const Line& hdr = in.keyword("cavern", 1);
    if (to_int(hdr.tokens[1], hdr.number, "version") != 1) {
        throw FormatError(hdr.number, "unsupported cavern version " + hdr.tokens[1]);
    }

    const Line& sz = in.keyword("size", 2);
    const int rows = to_int(sz.tokens[1], sz.number, "row count");
    const int cols = to_int(sz.tokens[2], sz.number, "column count");
    if (rows <= 0 || cols <= 0) throw FormatError(sz.number, "size must be positive");
    if (rows > MAX_ROWS || cols > MAX_COLS) {
        throw FormatError(sz.number, "size " + sz.tokens[1] + "x" + sz.tokens[2] + " exceeds " +
                          std::to_string(MAX_ROWS) + "x" + std::to_string(MAX_COLS));
    }

    const Line& ent = in.keyword("entrance", 2);
    const int er = to_int(ent.tokens[1], ent.number, "row");
    const int ec = to_int(ent.tokens[2], ent.number, "column");
    const Line& tgt = in.keyword("target", 2);
    const int tr = to_int(tgt.tokens[1], tgt.number, "row");
    const int tc = to_int(tgt.tokens[2], tgt.number, "column");

    Cavern cav(rows, cols);
    for (int r = 0; r < rows; ++r) {
        const Line& row = in.next("tile row");
        if (static_cast<int>(row.tokens.size()) != cols) {
            throw FormatError(row.number, "row " + std::to_string(r) + ": expected " + std::to_string(cols) +
                              " tiles, found " + std::to_string(row.tokens.size()));
        }
        for (int c = 0; c < cols; ++c) {
            const std::string& tok = row.tokens[static_cast<size_t>(c)];
            if (tok == "#") continue;
            const auto colon = tok.find(':');
            if (colon == std::string::npos) throw FormatError(row.number, "bad tile token '" + tok + "'");
            const NodeId id = to_id(tok.substr(0, colon), row.number);
            const int gold = to_int(tok.substr(colon + 1), row.number, "gold");
            if (gold < 0) throw FormatError(row.number, "negative gold in '" + tok + "'");
            if (cav.indexOf(id)) throw FormatError(row.number, "duplicate node id '" + tok.substr(0, colon) + "'");
            cav.addNode(id, r, c, gold);
        }
    }

    const Line& eh = in.keyword("edges", 1);
    const int count = to_int(eh.tokens[1], eh.number, "edge count");
    if (count < 0) throw FormatError(eh.number, "negative edge count");
    for (int i = 0; i < count; ++i) {
        const Line& el = in.next("edge");
        if (el.tokens.size() != 5) throw FormatError(el.number, "edge expects 5 values");
        int v[5];
        for (int k = 0; k < 5; ++k) v[k] = to_int(el.tokens[static_cast<size_t>(k)], el.number, "edge value");
        const int a = open_at(cav, v[0], v[1], el.number, "edge endpoint");
        const int b = open_at(cav, v[2], v[3], el.number, "edge endpoint");
        if (v[4] < 1 || v[4] > MAX_EDGE_WEIGHT) {
            throw FormatError(el.number, "edge length " + std::to_string(v[4]) + " outside [1," + std::to_string(MAX_EDGE_WEIGHT) + "]");
        }
        try {
            cav.addEdge(a, b, v[4]);
        } catch (const std::invalid_argument& e) {
            throw FormatError(el.number, e.what());
        }
    }

    in.keyword("end", 0);
    if (!in.done()) {
        throw FormatError(in.next("nothing").number, "unexpected content after 'end'");
    }

    cav.setEntrance(open_at(cav, er, ec, ent.number, "entrance"));
    cav.setTarget(open_at(cav, tr, tc, tgt.number, "target"));
    if (!PathPlanner::minPathLengthToTarget(cav, cav.entrance())) {
        throw FormatError(0, "target is unreachable from the entrance");
    }
    return cav;
}

std::vector<std::string> CavernIO::serialize(const Cavern& cav) {
    std::vector<std::string> out;
    out.push_back("cavern 1");
    out.push_back("size " + std::to_string(cav.rows()) + " " + std::to_string(cav.cols()));
    const Tile& e = cav.entrance().tile();
    const Tile& t = cav.target().tile();
    out.push_back("entrance " + std::to_string(e.row()) + " " + std::to_string(e.column()));
    out.push_back("target " + std::to_string(t.row()) + " " + std::to_string(t.column()));
    for (int r = 0; r < cav.rows(); ++r) {
        std::string line;
        for (int c = 0; c < cav.cols(); ++c) {
            if (c) line += ' ';
            auto idx = cav.nodeAt(r, c);
            if (!idx) { line += '#'; continue; }
            const Node& n = cav.node(*idx);
            char buf[48];
            std::snprintf(buf, sizeof(buf), "%llx:%d", static_cast<unsigned long long>(n.id()), n.tile().gold());
            line += buf;
        }
        out.push_back(line);
    }
    out.push_back("edges " + std::to_string(cav.edges().size()));
    for (const Edge& ed : cav.edges()) {
        const Tile& a = cav.node(ed.a).tile();
        const Tile& b = cav.node(ed.b).tile();
        out.push_back(std::to_string(a.row()) + " " + std::to_string(a.column()) + " " +
                      std::to_string(b.row()) + " " + std::to_string(b.column()) + " " +
                      std::to_string(ed.length));
    }
    out.push_back("end");
    return out;
}

Cavern CavernIO::loadFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) throw std::runtime_error("cannot open cavern file " + path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return parse(lines);
}

bool CavernIO::saveFile(const std::string& path, const Cavern& cav) {
    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs) return false;
    for (const std::string& l : serialize(cav)) ofs << l << "\n";
    ofs.close();
    return static_cast<bool>(ofs);
}

} // namespace cavern
