// ========================= src/core/Hollow.cpp =========================
#include "Hollow.hpp"
#include <unordered_set>

namespace hm {

    std::optional<Treasure> Hollow::takeOptimal(int capacity) {
        GreedySelector single(1);
        Selection sel = collect(single, capacity);
        if (sel.accepted.empty()) return std::nullopt;
        return sel.accepted.front();
    }

    static std::vector<std::pair<RankKey, Treasure>> ranked(const std::vector<Treasure>& treasures) {
        std::vector<std::pair<RankKey, Treasure>> out; out.reserve(treasures.size());
        for (const auto& t : treasures) out.emplace_back(RankKey::of(t), t);
        return out;
    }

    SpookyHollow::SpookyHollow(const std::vector<Treasure>& treasures) :tree(ranked(treasures)) {}

    std::vector<Treasure> SpookyHollow::candidates() const {
        std::vector<Treasure> out; out.reserve(tree.size());
        tree.forEachDescending([&](const RankKey&, const Treasure& t) { out.push_back(t); return true; });
        return out;
    }

    int SpookyHollow::commit(const std::vector<Treasure>& taken) {
        int removed = 0;
        for (const auto& t : taken) {
            if (tree.remove(RankKey::of(t))) ++removed; // miss = already gone
        }
        return removed;
    }

    Selection SpookyHollow::collect(const GreedySelector& selector, int capacity) {
        Selection sel = selector.begin(capacity);
        tree.forEachDescending([&](const RankKey&, const Treasure& t) {
            if (selector.full(sel)) return false;
            selector.offer(t, sel);
            return true;
        });

        // the walk only reads; removal happens once it is over
        std::vector<Treasure> taken; taken.reserve(sel.accepted.size());
        for (const auto& t : sel.accepted) {
            if (tree.remove(RankKey::of(t))) taken.push_back(t);
            else sel.remaining += t.weight();
        }
        sel.accepted = std::move(taken);
        return sel;
    }

    MysticalHollow::MysticalHollow(int poolId_, const std::vector<Treasure>& treasures)
        :poolId(poolId_), heap(treasures) {}

    int MysticalHollow::commit(const std::vector<Treasure>& taken) {
        std::unordered_set<int> want;
        for (const auto& t : taken) want.insert(t.id());

        // pull from the top until every wanted treasure is out, then put the rest back
        std::vector<Treasure> skipped;
        int removed = 0;
        while (removed < (int)want.size()) {
            auto top = heap.extractMax();
            if (!top) break;
            if (want.count(top->id())) ++removed;
            else skipped.push_back(*top);
        }
        for (const auto& t : skipped) heap.push(t);
        return removed;
    }

    // Extracts from the top while the selection has room; too heavy ones are
    // parked and pushed back, so a visit costs O((taken + skipped) log n).
    Selection MysticalHollow::collect(const GreedySelector& selector, int capacity) {
        Selection sel = selector.begin(capacity);
        std::vector<Treasure> skipped;
        while (!selector.full(sel)) {
            auto top = heap.extractMax();
            if (!top) break;
            if (!selector.offer(*top, sel)) skipped.push_back(*top);
        }
        for (const auto& t : skipped) heap.push(t);
        return sel;
    }

} // namespace hm
