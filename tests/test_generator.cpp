#include <catch2/catch.hpp>
#include "core/Generator.hpp"
#include "core/Solver.hpp"

#include <algorithm>

using namespace hm;

namespace {
    int countOf(const std::vector<std::string>& rows, char ch) {
        int n = 0;
        for (const auto& r : rows) n += (int)std::count(r.begin(), r.end(), ch);
        return n;
    }
}

TEST_CASE("treasures respect the configured ranges", "[generator]") {
    GenOptions opt;
    opt.weightMin = 2; opt.weightMax = 5;
    opt.valueMin = 10; opt.valueMax = 12;
    opt.treasuresMin = 3; opt.treasuresMax = 3;
    TreasureGenerator gen(opt);

    for (int i = 1; i <= 200; ++i) {
        Treasure t = gen.generate();
        REQUIRE(t.id() == i);
        REQUIRE(t.weight() >= 2);
        REQUIRE(t.weight() <= 5);
        REQUIRE(t.value() >= 10);
        REQUIRE(t.value() <= 12);
    }
    REQUIRE(gen.batch().size() == 3);
    REQUIRE(gen.issued() == 203);
}

TEST_CASE("the seed makes treasures reproducible", "[generator]") {
    GenOptions opt; opt.seed = 77;
    TreasureGenerator a(opt), b(opt);
    auto src = a.source();
    auto x = src();
    auto y = b.batch();
    REQUIRE(x == y);

    opt.seed = 78;
    TreasureGenerator c(opt);
    std::vector<Treasure> many1, many2;
    TreasureGenerator d(GenOptions{});
    for (int i = 0; i < 20; ++i) { many1.push_back(c.generate()); many2.push_back(d.generate()); }
    REQUIRE_FALSE(many1 == many2);
}

TEST_CASE("generated mazes are valid and solvable", "[generator]") {
    Params p; p.rows = 14; p.cols = 20;   // bumped to 15 x 21
    GenOptions opt;
    opt.seed = 2024;
    opt.exits = 2; opt.spooky = 4; opt.mystical = 3; opt.mysticalPools = 2;
    MazeGenerator gen(p, opt);

    for (int i = 0; i < 5; ++i) {
        std::string reason;
        auto g = gen.makeOne(&reason);
        REQUIRE(g.has_value());
        const auto& rows = g->layout;
        REQUIRE(rows.size() == 15);
        REQUIRE(rows[0].size() == 21);
        REQUIRE(rows[1][1] == 'P');
        REQUIRE(countOf(rows, 'P') == 1);
        REQUIRE(countOf(rows, 'E') == 2);
        REQUIRE(countOf(rows, 'S') == 4);
        REQUIRE(countOf(rows, 'M') == 2);
        REQUIRE(countOf(rows, '1') == 1);
        REQUIRE(rows.front() == std::string(21, '#'));
        REQUIRE(rows.back() == std::string(21, '#'));
        REQUIRE(Maze::validate(rows, &reason));

        TreasureGenerator treasures(opt);
        auto m = Maze::build(rows, treasures.source());
        REQUIRE(m.has_value());
        auto path = Solver().findWayOut(*m);
        REQUIRE(path.has_value());
        REQUIRE((int)path->size() == g->pathLength);
        REQUIRE(m->hollows().size() == 6);
    }
}

TEST_CASE("the same seed generates the same maze", "[generator]") {
    Params p;
    GenOptions opt; opt.seed = 5;
    auto a = MazeGenerator(p, opt).makeOne();
    auto b = MazeGenerator(p, opt).makeOne();
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(a->layout == b->layout);
    REQUIRE(a->seed == b->seed);
}
