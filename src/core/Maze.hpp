// ========================= src/core/Maze.hpp =========================
#pragma once
#include "Types.hpp"
#include "Hollow.hpp"
#include <functional>
#include <memory>

namespace hm {

    struct MazeCell {
        Position pos;
        Tile tile{ Tile::Open };
        Hollow* hollow{ nullptr };   // not owned; the Maze keeps every hollow alive
        bool visited{ false };       // scoped to one solve

        char symbol() const;
    };

    // Supplies the treasures for one freshly built hollow.
    using TreasureSource = std::function<std::vector<Treasure>()>;

    class Maze {
    public:
        // Layout symbols: '#' wall, ' ' '.' or '*' open, 'P' entrance, 'E' exit,
        // 'S' spooky hollow, 'M' mystical pool 0, '1'..'9' mystical pools 1..9.
        // Returns nullopt on an invalid layout with the cause in *reason.
        static std::optional<Maze> build(const std::vector<std::string>& rows, const TreasureSource& fill, std::string* reason = nullptr);
        static bool validate(const std::vector<std::string>& rows, std::string* reason = nullptr);

        Maze(Maze&&) noexcept = default;
        Maze& operator=(Maze&&) noexcept = default;
        Maze(const Maze&) = delete;
        Maze& operator=(const Maze&) = delete;

        int rows() const { return nRows; }
        int cols() const { return nCols; }

        bool inBounds(Position p) const { return p.row >= 0 && p.col >= 0 && p.row < nRows && p.col < nCols; }
        const MazeCell& at(Position p) const { return cells[index(p)]; }
        MazeCell& at(Position p) { return cells[index(p)]; }

        bool isPassable(Position p) const { return inBounds(p) && at(p).tile != Tile::Wall; }
        bool canEnter(Position p) const { return isPassable(p) && !at(p).visited; }
        bool isExit(Position p) const { return inBounds(p) && at(p).tile == Tile::Exit; }

        // unvisited passable neighbours, Up/Down/Left/Right order
        std::vector<Position> availableFrom(Position p) const;

        Position entrance() const { return start; }
        const std::vector<Position>& exits() const { return ends; }

        void resetVisited();

        const std::vector<std::unique_ptr<Hollow>>& hollows() const { return owned; }
        Hollow* hollowAt(Position p) const { return inBounds(p) ? at(p).hollow : nullptr; }
        int treasuresLeft() const;

        // grid as text; cells on path are drawn as '*' except entrance/exit
        std::vector<std::string> render(const std::vector<Position>* path = nullptr) const;

    private:
        Maze() = default;

        int index(Position p) const { return p.row * nCols + p.col; }

        int nRows{ 0 }, nCols{ 0 };
        std::vector<MazeCell> cells;                 // row-major
        std::vector<std::unique_ptr<Hollow>> owned;  // spooky + mystical
        Position start;
        std::vector<Position> ends;
    };

} // namespace hm
