// ========================= src/core/Maze.cpp =========================
#include "Maze.hpp"
#include <map>

namespace hm {

    char MazeCell::symbol() const {
        switch (tile) {
        case Tile::Wall: return '#';
        case Tile::Entrance: return 'P';
        case Tile::Exit: return 'E';
        case Tile::Hollow:
            if (!hollow || hollow->kind() == HollowKind::Spooky) return 'S';
            {
                int pool = static_cast<const MysticalHollow*>(hollow)->pool();
                return pool == 0 ? 'M' : char('0' + pool);
            }
        default: return ' ';
        }
    }

    static bool knownSymbol(char ch) {
        switch (ch) {
        case '#': case ' ': case '.': case '*': case 'P': case 'E': case 'S': case 'M': return true;
        default: return ch >= '1' && ch <= '9';
        }
    }

    static void fail(std::string* reason, const std::string& msg) { if (reason) *reason = msg; }

    bool Maze::validate(const std::vector<std::string>& rows, std::string* reason) {
        if (rows.empty() || rows[0].empty()) { fail(reason, "Maze layout is empty."); return false; }
        const size_t width = rows[0].size();
        int entrances = 0, exits = 0;
        for (size_t r = 0; r < rows.size(); ++r) {
            if (rows[r].size() != width) {
                fail(reason, "Row " + std::to_string(r) + " has " + std::to_string(rows[r].size()) +
                    " columns, expected " + std::to_string(width) + ".");
                return false;
            }
            for (size_t c = 0; c < width; ++c) {
                char ch = rows[r][c];
                if (!knownSymbol(ch)) {
                    fail(reason, std::string("Invalid tile '") + ch + "' at " + Position{ (int)r, (int)c }.str() + ".");
                    return false;
                }
                if (ch == 'P') ++entrances;
                else if (ch == 'E') ++exits;
            }
        }
        if (entrances == 0) { fail(reason, "Maze has no entrance (P)."); return false; }
        if (entrances > 1) { fail(reason, "Maze has " + std::to_string(entrances) + " entrances, expected one."); return false; }
        if (exits == 0) { fail(reason, "Maze has no exit (E)."); return false; }
        return true;
    }

    std::optional<Maze> Maze::build(const std::vector<std::string>& rows, const TreasureSource& fill, std::string* reason) {
        if (!validate(rows, reason)) return std::nullopt;

        Maze m;
        m.nRows = (int)rows.size();
        m.nCols = (int)rows[0].size();
        m.cells.resize(size_t(m.nRows) * m.nCols);

        std::map<int, MysticalHollow*> pools; // pool id -> shared hollow
        for (int r = 0; r < m.nRows; ++r) {
            for (int c = 0; c < m.nCols; ++c) {
                Position p{ r, c };
                MazeCell& cell = m.at(p);
                cell.pos = p;
                char ch = rows[r][c];
                switch (ch) {
                case '#': cell.tile = Tile::Wall; break;
                case 'P': cell.tile = Tile::Entrance; m.start = p; break;
                case 'E': cell.tile = Tile::Exit; m.ends.push_back(p); break;
                case 'S': {
                    cell.tile = Tile::Hollow;
                    m.owned.push_back(std::make_unique<SpookyHollow>(fill ? fill() : std::vector<Treasure>{}));
                    cell.hollow = m.owned.back().get();
                    break;
                }
                case 'M': case '1': case '2': case '3': case '4': case '5': case '6': case '7': case '8': case '9': {
                    cell.tile = Tile::Hollow;
                    int pool = ch == 'M' ? 0 : ch - '0';
                    auto it = pools.find(pool);
                    if (it == pools.end()) {
                        // the pool is filled once, by the first cell that names it
                        auto h = std::make_unique<MysticalHollow>(pool, fill ? fill() : std::vector<Treasure>{});
                        it = pools.emplace(pool, h.get()).first;
                        m.owned.push_back(std::move(h));
                    }
                    it->second->link(p);
                    cell.hollow = it->second;
                    break;
                }
                default: cell.tile = Tile::Open; break;
                }
            }
        }
        return m;
    }

    std::vector<Position> Maze::availableFrom(Position p) const {
        std::vector<Position> out; out.reserve(4);
        for (Direction d : kDirections) {
            Position n = step(p, d);
            if (canEnter(n)) out.push_back(n);
        }
        return out;
    }

    void Maze::resetVisited() {
        for (auto& c : cells) c.visited = false;
    }

    int Maze::treasuresLeft() const {
        int n = 0;
        for (const auto& h : owned) n += h->size();
        return n;
    }

    std::vector<std::string> Maze::render(const std::vector<Position>* path) const {
        std::vector<std::string> out(nRows, std::string(nCols, ' '));
        for (const auto& c : cells) out[c.pos.row][c.pos.col] = c.symbol();
        if (path) {
            for (const auto& p : *path) {
                if (!inBounds(p)) continue;
                Tile t = at(p).tile;
                if (t == Tile::Entrance || t == Tile::Exit) continue;
                out[p.row][p.col] = '*';
            }
        }
        return out;
    }

} // namespace hm
