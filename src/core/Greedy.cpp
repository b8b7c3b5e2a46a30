// ========================= src/core/Greedy.cpp =========================
#include "Greedy.hpp"

namespace hm {

    Selection GreedySelector::begin(int capacity) const {
        Selection sel;
        sel.remaining = capacity < 0 ? 0 : capacity;
        return sel;
    }

    bool GreedySelector::full(const Selection& sel) const {
        if (limit > 0 && (int)sel.accepted.size() >= limit) return true;
        return sel.remaining <= 0;
    }

    bool GreedySelector::offer(const Treasure& t, Selection& sel) const {
        if (full(sel) || t.weight() > sel.remaining) return false; // too heavy now, skipped for good
        sel.accepted.push_back(t);
        sel.remaining -= t.weight();
        return true;
    }

    Selection GreedySelector::select(const std::vector<Treasure>& candidates, int capacity) const {
        Selection sel = begin(capacity);
        for (const auto& t : candidates) {
            if (full(sel)) break;
            offer(t, sel);
        }
        return sel;
    }

} // namespace hm
