// ========================= src/core/Generator.cpp =========================
#include "Generator.hpp"
#include "Solver.hpp"
#include <algorithm>

namespace hm {

    static uint64_t rotl(uint64_t x, int r) { return (x << r) | (x >> (64 - r)); }
    uint64_t RNG::next() { s ^= rotl(s, 7); s ^= (s >> 9); return s * 0x9E3779B97F4A7C15ULL; }
    int RNG::irange(int lo, int hi) { if (hi <= lo) return lo; return lo + int(next() % uint64_t(hi - lo + 1)); }

    TreasureGenerator::TreasureGenerator(GenOptions opt_) :opt(opt_) { rng.s = opt.seed ? opt.seed : 0xBADC0FFEEULL; }

    Treasure TreasureGenerator::generate() {
        int w = rng.irange(std::max(1, opt.weightMin), std::max(1, opt.weightMax));
        int v = rng.irange(std::max(1, opt.valueMin), std::max(1, opt.valueMax));
        return Treasure(nextId++, w, v);
    }

    std::vector<Treasure> TreasureGenerator::batch() {
        int n = rng.irange(std::max(0, opt.treasuresMin), std::max(0, opt.treasuresMax));
        std::vector<Treasure> out; out.reserve(n);
        for (int i = 0; i < n; ++i) out.push_back(generate());
        return out;
    }

    MazeGenerator::MazeGenerator(Params p_, GenOptions opt_) :p(p_), opt(opt_) {
        rng.s = (opt.seed ? opt.seed : 0xBADC0FFEEULL) ^ 0x5DEECE66DULL;
        // carving works on odd dimensions so corridors sit on odd rows/cols
        if (p.rows % 2 == 0) ++p.rows;
        if (p.cols % 2 == 0) ++p.cols;
        p.rows = std::max(p.rows, 5);
        p.cols = std::max(p.cols, 5);
    }

    // Recursive backtracker on the odd lattice, run with an explicit stack.
    std::vector<std::string> MazeGenerator::carve() {
        std::vector<std::string> g(p.rows, std::string(p.cols, '#'));
        std::vector<Position> st;
        st.push_back({ 1, 1 });
        g[1][1] = ' ';
        while (!st.empty()) {
            Position cur = st.back();
            Direction dirs[4] = { Direction::Up, Direction::Down, Direction::Left, Direction::Right };
            for (int i = 3; i > 0; --i) std::swap(dirs[i], dirs[rng.irange(0, i)]);
            bool moved = false;
            for (Direction d : dirs) {
                Position mid = step(cur, d);
                Position nxt = step(mid, d);
                if (nxt.row <= 0 || nxt.col <= 0 || nxt.row >= p.rows - 1 || nxt.col >= p.cols - 1) continue;
                if (g[nxt.row][nxt.col] != '#') continue;
                g[mid.row][mid.col] = ' ';
                g[nxt.row][nxt.col] = ' ';
                st.push_back(nxt);
                moved = true;
                break;
            }
            if (!moved) st.pop_back();
        }

        // a few extra openings so more than one route exists
        for (int r = 1; r < p.rows - 1; ++r) {
            for (int c = 1; c < p.cols - 1; ++c) {
                if (g[r][c] != '#') continue;
                bool horiz = g[r][c - 1] != '#' && g[r][c + 1] != '#';
                bool vert = g[r - 1][c] != '#' && g[r + 1][c] != '#';
                if ((horiz != vert) && rng.irange(0, 99) < opt.loopPercent) g[r][c] = ' ';
            }
        }
        return g;
    }

    std::vector<Position> MazeGenerator::openCells(const std::vector<std::string>& grid) const {
        std::vector<Position> out;
        for (int r = 0; r < (int)grid.size(); ++r)
            for (int c = 0; c < (int)grid[r].size(); ++c)
                if (grid[r][c] == ' ') out.push_back({ r, c });
        return out;
    }

    void MazeGenerator::place(std::vector<std::string>& grid) {
        grid[1][1] = 'P';
        auto spots = openCells(grid);
        for (size_t i = 0; i < spots.size(); ++i) {
            size_t j = size_t(rng.irange(0, (int)spots.size() - 1));
            std::swap(spots[i], spots[j]);
        }
        // exits prefer the far half of the grid
        std::stable_sort(spots.begin(), spots.end(), [](const Position& a, const Position& b) {
            return (a.row + a.col) > (b.row + b.col);
        });
        for (int e = 0; e < std::max(1, opt.exits) && !spots.empty(); ++e) {
            int farHalf = std::max(1, (int)spots.size() / 2);
            size_t idx = size_t(rng.irange(0, farHalf - 1));
            grid[spots[idx].row][spots[idx].col] = 'E';
            spots.erase(spots.begin() + idx);
        }

        for (size_t i = 0; i < spots.size(); ++i) {
            size_t j = size_t(rng.irange(0, (int)spots.size() - 1));
            std::swap(spots[i], spots[j]);
        }
        int pools = std::clamp(opt.mysticalPools, 1, 10);
        size_t cursor = 0;
        for (int s = 0; s < opt.spooky && cursor < spots.size(); ++s, ++cursor)
            grid[spots[cursor].row][spots[cursor].col] = 'S';
        for (int m = 0; m < opt.mystical && cursor < spots.size(); ++m, ++cursor) {
            int pool = m % pools;
            grid[spots[cursor].row][spots[cursor].col] = pool == 0 ? 'M' : char('0' + pool);
        }
    }

    std::optional<Generated> MazeGenerator::makeOne(std::string* reason) {
        for (int tries = 0; tries < std::max(1, opt.attempts); ++tries) {
            uint64_t seedUsed = rng.s;
            auto grid = carve();
            place(grid);

            std::string why;
            auto scratch = Maze::build(grid, TreasureSource{}, &why);
            if (!scratch) { if (reason) *reason = why; continue; }

            Solver solver;
            auto path = solver.findWayOut(*scratch);
            if (path) {
                Generated g; g.layout = std::move(grid); g.seed = seedUsed; g.pathLength = (int)path->size();
                return g;
            }
            if (reason) *reason = "Generated maze had no escape route.";
        }
        return std::nullopt;
    }

} // namespace hm
