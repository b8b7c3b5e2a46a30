// ========================= src/core/Generator.hpp =========================
#pragma once
#include "Maze.hpp"
#include <optional>

namespace hm {

    struct GenOptions {
        uint64_t seed{ 0xA17C3B5ECAFEBEEFULL };
        int weightMin{ 1 };
        int weightMax{ 10 };
        int valueMin{ 1 };
        int valueMax{ 30 };
        int treasuresMin{ 3 };     // per hollow
        int treasuresMax{ 8 };
        int exits{ 2 };
        int spooky{ 4 };
        int mystical{ 3 };         // cells linked to mystical pools
        int mysticalPools{ 1 };    // 1..10; pool 0 is drawn as 'M'
        int loopPercent{ 8 };      // chance to knock out an extra wall, makes alternative routes
        int attempts{ 20 };
    };

    class TreasureGenerator {
    public:
        explicit TreasureGenerator(GenOptions opt);

        Treasure generate();
        std::vector<Treasure> batch();       // one hollow's worth
        TreasureSource source() { return [this] { return batch(); }; }

        int issued() const { return nextId - 1; }

    private:
        GenOptions opt; RNG rng; int nextId{ 1 };
    };

    struct Generated { std::vector<std::string> layout; uint64_t seed{ 0 }; int pathLength{ 0 }; };

    class MazeGenerator {
    public:
        MazeGenerator(Params p, GenOptions opt);

        // Random perfect maze (plus a few loops), validated by a solve on a scratch build.
        std::optional<Generated> makeOne(std::string* reason = nullptr);

    private:
        Params p; GenOptions opt; RNG rng;

        std::vector<std::string> carve();
        void place(std::vector<std::string>& grid);
        std::vector<Position> openCells(const std::vector<std::string>& grid) const;
    };

} // namespace hm
