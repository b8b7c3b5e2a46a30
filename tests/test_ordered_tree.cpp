#include <catch2/catch.hpp>
#include "core/OrderedTree.hpp"
#include "core/Types.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <set>
#include <string>

using hm::OrderedTree;

namespace {
    double heightBound(int n) { return 1.44 * std::log2(double(n) + 2.0); }
}

TEST_CASE("find, insert and remove on a small tree", "[tree]") {
    OrderedTree<int, std::string> t;
    REQUIRE(t.empty());
    REQUIRE_FALSE(t.find(3).has_value());

    t.insert(5, "five");
    t.insert(3, "three");
    t.insert(8, "eight");
    REQUIRE(t.size() == 3);
    REQUIRE(t.find(3) == std::string("three"));
    REQUIRE(t.contains(8));

    SECTION("existing key replaces payload") {
        t.insert(3, "THREE");
        REQUIRE(t.size() == 3);
        REQUIRE(t.find(3) == std::string("THREE"));
    }

    SECTION("removing an absent key reports NotFound") {
        REQUIRE_FALSE(t.remove(42));
        REQUIRE(t.size() == 3);
        REQUIRE(t.remove(5));
        REQUIRE_FALSE(t.remove(5));
        REQUIRE(t.size() == 2);
        REQUIRE(t.keys() == std::vector<int>{ 3, 8 });
    }

    SECTION("min and max") {
        REQUIRE(t.minimal()->first == 3);
        REQUIRE(t.maximal()->second == "eight");
    }
}

TEST_CASE("ascending inserts stay balanced", "[tree]") {
    OrderedTree<int, int> t;
    for (int i = 0; i < 1000; ++i) t.insert(i, i * i);
    REQUIRE(t.size() == 1000);
    REQUIRE(t.isBalanced());
    REQUIRE(t.height() <= heightBound(1000));
    REQUIRE(t.find(31) == 961);
}

TEST_CASE("random inserts and removes keep order and AVL balance", "[tree]") {
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> key(0, 300);
    OrderedTree<int, int> t;
    std::set<int> model;

    for (int i = 0; i < 3000; ++i) {
        int k = key(rng);
        if (rng() % 3 == 0) {
            bool expected = model.erase(k) > 0;
            REQUIRE(t.remove(k) == expected);
        }
        else {
            t.insert(k, -k);
            model.insert(k);
        }
        REQUIRE(t.size() == (int)model.size());
        REQUIRE(t.isBalanced());
        REQUIRE(t.height() <= heightBound(t.size()));
    }
    auto keys = t.keys();
    REQUIRE(std::is_sorted(keys.begin(), keys.end()));
    REQUIRE(keys == std::vector<int>(model.begin(), model.end()));
}

TEST_CASE("bulk build from unsorted pairs", "[tree]") {
    std::vector<std::pair<int, char>> elems{ {7, 'g'}, {1, 'a'}, {4, 'd'}, {9, 'i'}, {2, 'b'}, {6, 'f'}, {3, 'c'} };
    OrderedTree<int, char> t(elems);
    REQUIRE(t.size() == 7);
    REQUIRE(t.isBalanced());
    REQUIRE(t.height() == 3);
    REQUIRE(t.keys() == std::vector<int>{ 1, 2, 3, 4, 6, 7, 9 });
}

TEST_CASE("descending walk can stop early", "[tree]") {
    OrderedTree<int, int> t;
    for (int i = 1; i <= 10; ++i) t.insert(i, i);
    std::vector<int> seen;
    t.forEachDescending([&](const int& k, const int&) { seen.push_back(k); return seen.size() < 3; });
    REQUIRE(seen == std::vector<int>{ 10, 9, 8 });
}

TEST_CASE("copies are independent", "[tree]") {
    OrderedTree<int, int> a;
    for (int i = 0; i < 20; ++i) a.insert(i, i);
    OrderedTree<int, int> b = a;
    REQUIRE(b.remove(5));
    REQUIRE(a.contains(5));
    REQUIRE(a.size() == 20);
    REQUIRE(b.size() == 19);
    REQUIRE(b.isBalanced());
}

TEST_CASE("rank keys put the best ratio at the maximum", "[tree]") {
    using hm::RankKey; using hm::Treasure;
    std::vector<Treasure> ts{ Treasure(1, 2, 10), Treasure(2, 3, 15), Treasure(3, 4, 12), Treasure(4, 10, 10) };
    OrderedTree<RankKey, Treasure> t;
    for (const auto& x : ts) t.insert(RankKey::of(x), x);
    // ids 1 and 2 share ratio 5: the lower id ranks higher
    REQUIRE(t.maximal()->second.id() == 1);
    REQUIRE(t.minimal()->second.id() == 4);
    REQUIRE(t.remove(RankKey::of(ts[0])));
    REQUIRE(t.maximal()->second.id() == 2);
}
