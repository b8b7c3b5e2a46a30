// ========================= src/core/Solver.cpp =========================
#include "Solver.hpp"
#include <chrono>

namespace hm {

    void LootReport::add(const Treasure& t) {
        taken[t.id()] = t;
        order.push_back(t.id());
        totalWeight += t.weight();
        totalValue += t.value();
    }

    void Solver::visitHollow(Hollow& h, LootReport& loot) const {
        Selection sel = h.collect(selector, loot.remaining);
        for (const auto& t : sel.accepted) loot.add(t);
        loot.remaining = sel.remaining;
    }

    // Iterative DFS. Each frame is a cell on the current path plus the next
    // direction to try, which reproduces recursive order without call-stack growth.
    // Visited flags stay set on backtrack, so every cell is expanded at most once.
    bool Solver::search(Maze& maze, LootReport* loot, SolveResult& stats, std::vector<Position>& path) const {
        struct Frame { Position pos; int next{ 0 }; };
        std::vector<Frame> stack;

        auto enter = [&](Position pos) {
            MazeCell& cell = maze.at(pos);
            cell.visited = true;
            path.push_back(pos);
            stack.push_back(Frame{ pos, 0 });
            ++stats.nodesExpanded;
            if (loot && cell.hollow) {
                ++stats.hollowVisits;
                visitHollow(*cell.hollow, *loot); // not undone on backtrack
            }
            return cell.tile == Tile::Exit;
        };

        if (enter(maze.entrance())) return true;

        while (!stack.empty()) {
            Frame& top = stack.back();
            if (top.next >= (int)kDirections.size()) {
                stack.pop_back();
                path.pop_back();
                continue;
            }
            Position n = step(top.pos, kDirections[top.next++]);
            if (!maze.canEnter(n)) continue;
            if (enter(n)) return true;
        }
        return false;
    }

    SolveResult Solver::solve(Maze& maze) const {
        auto t0 = std::chrono::steady_clock::now();
        SolveResult res;
        res.loot.capacity = p.capacity;
        res.loot.remaining = p.capacity;

        maze.resetVisited();
        LootReport* live = p.mode == CollectMode::DuringSearch ? &res.loot : nullptr;
        std::vector<Position> path;
        res.found = search(maze, live, res, path);
        res.status = res.found ? SolveStatus::Found : SolveStatus::NoPathFound;
        if (res.found) {
            res.path = std::move(path);
            if (p.mode == CollectMode::AlongPath) res.loot = takeTreasures(maze, res.path, p.capacity, &res.hollowVisits);
        }

        res.computeTimeMs = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
        return res;
    }

    std::optional<std::vector<Position>> Solver::findWayOut(Maze& maze) const {
        maze.resetVisited();
        SolveResult stats;
        std::vector<Position> path;
        if (!search(maze, nullptr, stats, path)) return std::nullopt;
        return path;
    }

    LootReport Solver::takeTreasures(Maze& maze, const std::vector<Position>& path, int capacity, int* visits) const {
        LootReport loot;
        loot.capacity = capacity;
        loot.remaining = capacity;
        for (const auto& pos : path) {
            Hollow* h = maze.hollowAt(pos);
            if (!h) continue;
            if (visits) ++*visits;
            visitHollow(*h, loot);
        }
        return loot;
    }

} // namespace hm
