// ========================= src/core/Solver.hpp =========================
#pragma once
#include "Maze.hpp"
#include <map>

namespace hm {

    struct LootReport {
        std::map<int, Treasure> taken;   // treasure id -> treasure
        std::vector<int> order;          // ids in pick-up order
        int capacity{ 0 };
        int remaining{ 0 };
        int totalWeight{ 0 };
        int totalValue{ 0 };

        void add(const Treasure& t);
    };

    enum class SolveStatus : uint8_t { Found = 0, NoPathFound = 1 };

    struct SolveResult {
        bool found{ false };
        SolveStatus status{ SolveStatus::NoPathFound };
        std::vector<Position> path;      // entrance -> exit, empty when not found
        LootReport loot;
        int nodesExpanded{ 0 };
        int hollowVisits{ 0 };
        double computeTimeMs{ 0.0 };
    };

    class Solver {
    public:
        explicit Solver(Params params = Params{}) :p(params), selector(params.maxPerVisit) {}

        // Depth-first escape from the entrance. First exit reached wins.
        // DuringSearch collects at every hollow the search enters; AlongPath
        // collects afterwards, only on the returned path.
        SolveResult solve(Maze& maze) const;

        // Escape path only, no collection.
        std::optional<std::vector<Position>> findWayOut(Maze& maze) const;

        // Walks path in order and collects from each hollow cell on it. visits, when
        // given, is increased once per hollow cell on the path.
        LootReport takeTreasures(Maze& maze, const std::vector<Position>& path, int capacity, int* visits = nullptr) const;

    private:
        Params p;
        GreedySelector selector;

        bool search(Maze& maze, LootReport* loot, SolveResult& stats, std::vector<Position>& path) const;
        void visitHollow(Hollow& h, LootReport& loot) const;
    };

} // namespace hm
