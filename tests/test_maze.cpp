#include <catch2/catch.hpp>
#include "core/Maze.hpp"

using namespace hm;

namespace {
    const std::vector<std::string> kSample{
        "#########",
        "#P  S  M#",
        "# ### # #",
        "# #M  # #",
        "# # ### #",
        "#S  #  E#",
        "#########",
    };

    TreasureSource counting(int perHollow) {
        auto next = std::make_shared<int>(1);
        return [next, perHollow] {
            std::vector<Treasure> out;
            for (int i = 0; i < perHollow; ++i) { int id = (*next)++; out.emplace_back(id, 1 + id % 4, 3 * id); }
            return out;
        };
    }

    std::string buildError(const std::vector<std::string>& rows) {
        std::string reason;
        auto m = Maze::build(rows, counting(1), &reason);
        REQUIRE_FALSE(m.has_value());
        return reason;
    }
}

TEST_CASE("layout symbols map to cells", "[maze]") {
    auto m = Maze::build(kSample, counting(2));
    REQUIRE(m.has_value());
    REQUIRE(m->rows() == 7);
    REQUIRE(m->cols() == 9);
    REQUIRE(m->entrance() == Position{ 1, 1 });
    REQUIRE(m->exits() == std::vector<Position>{ { 5, 7 } });
    REQUIRE(m->at({ 0, 0 }).tile == Tile::Wall);
    REQUIRE(m->at({ 1, 2 }).tile == Tile::Open);
    REQUIRE(m->at({ 1, 4 }).tile == Tile::Hollow);
    REQUIRE(m->isExit({ 5, 7 }));
    REQUIRE_FALSE(m->isPassable({ 0, 3 }));
    REQUIRE_FALSE(m->isPassable({ -1, 3 }));
    REQUIRE(m->render() == kSample);
}

TEST_CASE("mystical cells share one hollow, spooky cells do not", "[maze]") {
    auto m = Maze::build(kSample, counting(2));
    REQUIRE(m.has_value());
    REQUIRE(m->hollows().size() == 3);

    Hollow* a = m->hollowAt({ 1, 7 });
    Hollow* b = m->hollowAt({ 3, 3 });
    REQUIRE(a != nullptr);
    REQUIRE(a == b);
    REQUIRE(a->kind() == HollowKind::Mystical);
    REQUIRE(static_cast<MysticalHollow*>(a)->linkedCells().size() == 2);

    Hollow* s1 = m->hollowAt({ 1, 4 });
    Hollow* s2 = m->hollowAt({ 5, 1 });
    REQUIRE(s1->kind() == HollowKind::Spooky);
    REQUIRE(s1 != s2);
    REQUIRE(m->hollowAt({ 1, 2 }) == nullptr);
    REQUIRE(m->treasuresLeft() == 6);
}

TEST_CASE("numbered pools are separate from the M pool", "[maze]") {
    std::vector<std::string> rows{
        "#######",
        "#PM1 E#",
        "# 1M2 #",
        "#######",
    };
    auto m = Maze::build(rows, counting(1));
    REQUIRE(m.has_value());
    REQUIRE(m->hollows().size() == 3);
    REQUIRE(m->hollowAt({ 1, 2 }) == m->hollowAt({ 2, 3 }));
    REQUIRE(m->hollowAt({ 1, 3 }) == m->hollowAt({ 2, 2 }));
    REQUIRE(m->hollowAt({ 1, 2 }) != m->hollowAt({ 1, 3 }));
    REQUIRE(m->at({ 2, 4 }).symbol() == '2');
}

TEST_CASE("neighbours come in Up, Down, Left, Right order", "[maze]") {
    std::vector<std::string> rows{
        "#####",
        "#   #",
        "# P #",
        "#  E#",
        "#####",
    };
    auto m = Maze::build(rows, counting(0));
    REQUIRE(m.has_value());
    auto n = m->availableFrom({ 2, 2 });
    REQUIRE(n == std::vector<Position>{ { 1, 2 }, { 3, 2 }, { 2, 1 }, { 2, 3 } });

    m->at({ 3, 2 }).visited = true;
    REQUIRE(m->availableFrom({ 2, 2 }).size() == 3);
    m->resetVisited();
    REQUIRE(m->availableFrom({ 2, 2 }).size() == 4);
}

TEST_CASE("dots are open cells", "[maze]") {
    auto m = Maze::build({ "P.E" }, counting(0));
    REQUIRE(m.has_value());
    REQUIRE(m->at({ 0, 1 }).tile == Tile::Open);
    REQUIRE(m->render() == std::vector<std::string>{ "P E" });
}

TEST_CASE("invalid layouts are rejected at build time", "[maze]") {
    REQUIRE(buildError({}) == "Maze layout is empty.");
    REQUIRE(buildError({ "#P#", "#E" }) == "Row 1 has 2 columns, expected 3.");
    REQUIRE(buildError({ "# E" }) == "Maze has no entrance (P).");
    REQUIRE(buildError({ "P P", "E  " }) == "Maze has 2 entrances, expected one.");
    REQUIRE(buildError({ "P S" }) == "Maze has no exit (E).");
    REQUIRE(buildError({ "P?E" }) == "Invalid tile '?' at (0, 1).");
    REQUIRE(Maze::validate(kSample));
}

TEST_CASE("a layout without hollows is a valid escape-only maze", "[maze]") {
    std::vector<std::string> rows{ "#####", "#P  #", "# # #", "#  E#", "#####" };
    std::string reason;
    REQUIRE(Maze::validate(rows, &reason));
    REQUIRE(reason.empty());
    auto m = Maze::build(rows, counting(3));
    REQUIRE(m.has_value());
    REQUIRE(m->hollows().empty());
    REQUIRE(m->treasuresLeft() == 0);
}
