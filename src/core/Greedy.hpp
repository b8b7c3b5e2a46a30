// ========================= src/core/Greedy.hpp =========================
#pragma once
#include "Types.hpp"

namespace hm {

    struct Selection {
        std::vector<Treasure> accepted;   // in offer order
        int remaining{ 0 };               // capacity left after the accepted weight
    };

    // Greedy value/weight knapsack approximation. Candidates must be offered in
    // descending ratio order. Each one is taken iff it still fits; a skipped
    // candidate is never reconsidered. Exact only for the fractional relaxation.
    //
    // Hollows drive it one treasure at a time (begin / full / offer) so they can
    // stop pulling from their container as soon as the selection is full.
    class GreedySelector {
    public:
        explicit GreedySelector(int maxPerPick = 0) :limit(maxPerPick) {}

        Selection select(const std::vector<Treasure>& candidates, int capacity) const;

        Selection begin(int capacity) const;
        // per-visit limit reached or no capacity left
        bool full(const Selection& sel) const;
        // true when t was accepted into sel
        bool offer(const Treasure& t, Selection& sel) const;

    private:
        int limit{ 0 }; // 0 = unlimited
    };

} // namespace hm
