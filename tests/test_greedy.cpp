#include <catch2/catch.hpp>
#include "core/Greedy.hpp"

using hm::GreedySelector;
using hm::Treasure;

namespace {
    int weightOf(const std::vector<Treasure>& ts) { int w = 0; for (const auto& t : ts) w += t.weight(); return w; }
}

TEST_CASE("two ratio-5 items fill capacity exactly", "[greedy]") {
    // ratios 5, 5, 3, 1
    std::vector<Treasure> candidates{ Treasure(1, 2, 10), Treasure(2, 3, 15), Treasure(3, 4, 12), Treasure(4, 10, 10) };
    auto sel = GreedySelector().select(candidates, 5);
    REQUIRE(sel.accepted.size() == 2);
    REQUIRE(sel.accepted[0].id() == 1);
    REQUIRE(sel.accepted[1].id() == 2);
    REQUIRE(sel.remaining == 0);
    REQUIRE(weightOf(sel.accepted) <= 5);
}

TEST_CASE("a candidate too heavy is skipped and never retried", "[greedy]") {
    std::vector<Treasure> candidates{ Treasure(1, 6, 30), Treasure(2, 2, 8), Treasure(3, 4, 12) };
    auto sel = GreedySelector().select(candidates, 5);
    REQUIRE(sel.accepted.size() == 1);
    REQUIRE(sel.accepted[0].id() == 2);
    REQUIRE(sel.remaining == 3);
}

TEST_CASE("greedy is not an exact knapsack", "[greedy]") {
    // best ratio first blocks the optimal pair {2, 3} worth 20
    std::vector<Treasure> candidates{ Treasure(1, 3, 12), Treasure(2, 2, 7), Treasure(3, 2, 7) };
    auto sel = GreedySelector().select(candidates, 4);
    REQUIRE(sel.accepted.size() == 1);
    REQUIRE(sel.accepted[0].id() == 1);
    REQUIRE(sel.remaining == 1);
}

TEST_CASE("per-visit limit and degenerate capacities", "[greedy]") {
    std::vector<Treasure> candidates{ Treasure(1, 1, 9), Treasure(2, 1, 8), Treasure(3, 1, 7) };

    SECTION("limit of one") {
        auto sel = GreedySelector(1).select(candidates, 10);
        REQUIRE(sel.accepted.size() == 1);
        REQUIRE(sel.remaining == 9);
    }
    SECTION("zero capacity takes nothing") {
        auto sel = GreedySelector().select(candidates, 0);
        REQUIRE(sel.accepted.empty());
        REQUIRE(sel.remaining == 0);
    }
    SECTION("no candidates") {
        auto sel = GreedySelector().select({}, 7);
        REQUIRE(sel.accepted.empty());
        REQUIRE(sel.remaining == 7);
    }
}

TEST_CASE("offering one candidate at a time matches a batch select", "[greedy]") {
    std::vector<Treasure> candidates{ Treasure(1, 6, 30), Treasure(2, 2, 8), Treasure(3, 4, 12), Treasure(4, 1, 1) };
    GreedySelector selector;
    auto sel = selector.begin(5);
    REQUIRE_FALSE(selector.full(sel));
    REQUIRE_FALSE(selector.offer(candidates[0], sel));
    REQUIRE(selector.offer(candidates[1], sel));
    REQUIRE_FALSE(selector.offer(candidates[2], sel));
    REQUIRE(selector.offer(candidates[3], sel));
    REQUIRE(sel.remaining == 2);

    auto batch = selector.select(candidates, 5);
    REQUIRE(batch.accepted == sel.accepted);
    REQUIRE(batch.remaining == sel.remaining);

    GreedySelector one(1);
    auto single = one.begin(10);
    REQUIRE(one.offer(candidates[1], single));
    REQUIRE(one.full(single));
    REQUIRE_FALSE(one.offer(candidates[3], single));
    REQUIRE(one.full(one.begin(0)));
}
