// ========================= src/core/Types.hpp =========================
#pragma once
#include <cstdint>
#include <vector>
#include <string>
#include <optional>
#include <array>
#include <limits>

namespace hm {

    struct Position {
        int row{ 0 };
        int col{ 0 };

        bool operator==(const Position& o) const { return row == o.row && col == o.col; }
        bool operator!=(const Position& o) const { return !(*this == o); }
        bool operator<(const Position& o) const { return row != o.row ? row < o.row : col < o.col; }

        std::string str() const { return "(" + std::to_string(row) + ", " + std::to_string(col) + ")"; }
    };

    enum class Tile : uint8_t { Open = 0, Wall = 1, Entrance = 2, Exit = 3, Hollow = 4 };

    enum class Direction : uint8_t { Up = 0, Down = 1, Left = 2, Right = 3 };

    // exploration order is fixed so solves are reproducible
    constexpr std::array<Direction, 4> kDirections{ Direction::Up, Direction::Down, Direction::Left, Direction::Right };

    inline Position step(Position p, Direction d) {
        switch (d) {
        case Direction::Up:    return { p.row - 1, p.col };
        case Direction::Down:  return { p.row + 1, p.col };
        case Direction::Left:  return { p.row, p.col - 1 };
        case Direction::Right: return { p.row, p.col + 1 };
        }
        return p;
    }

    class Treasure {
    public:
        Treasure() = default;
        Treasure(int id, int weight, int value) :id_(id), weight_(weight), value_(value) {}

        int id() const { return id_; }
        int weight() const { return weight_; }
        int value() const { return value_; }
        double ratio() const { return weight_ > 0 ? double(value_) / double(weight_) : 0.0; }

        bool operator==(const Treasure& o) const { return id_ == o.id_ && weight_ == o.weight_ && value_ == o.value_; }

    private:
        int id_{ 0 };
        int weight_{ 1 };
        int value_{ 0 };
    };

    // Heap order: higher ratio first, equal ratios leave lowest id first. Ids are
    // issued in the order a pool is filled, so this is the pool's insertion order,
    // and it still holds for treasures pushed back after a visit.
    struct ByRatio {
        bool operator()(const Treasure& a, const Treasure& b) const {
            if (a.ratio() != b.ratio()) return a.ratio() < b.ratio();
            return a.id() > b.id();
        }
    };

    // Tree key for Spooky caches. Ascending order = worst to best, so the
    // tree maximum is the best ratio and ties favour the lowest id.
    struct RankKey {
        double ratio{ 0.0 };
        int id{ 0 };

        static RankKey of(const Treasure& t) { return { t.ratio(), t.id() }; }

        bool operator<(const RankKey& o) const {
            if (ratio != o.ratio) return ratio < o.ratio;
            return id > o.id;
        }
        bool operator==(const RankKey& o) const { return ratio == o.ratio && id == o.id; }
    };

    enum class CollectMode : uint8_t { DuringSearch = 0, AlongPath = 1 };

    struct Params {
        int rows{ 15 };          // 5..61
        int cols{ 21 };          // 5..81
        int capacity{ 20 };      // backpack weight limit
        CollectMode mode{ CollectMode::DuringSearch };
        int maxPerVisit{ 0 };    // 0 = take as many as fit
    };

    struct RNG { uint64_t s = 0x9E3779B97F4A7C15ULL; uint64_t next(); int irange(int lo, int hi); };

    // Loot labels for the viewer
    inline std::string labelForValue(int totalValue, int capacity) {
        double perUnit = capacity > 0 ? double(totalValue) / capacity : 0.0;
        if (perUnit < 0.5) return "Meagre";
        if (perUnit < 1.5) return "Modest";
        if (perUnit < 3.0) return "Rich";
        return "Legendary";
    }

} // namespace hm
