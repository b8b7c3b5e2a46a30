// ========================= src/core/Hollow.hpp =========================
#pragma once
#include "Types.hpp"
#include "Greedy.hpp"
#include "OrderedTree.hpp"
#include "MaxHeap.hpp"

namespace hm {

    enum class HollowKind : uint8_t { Spooky = 0, Mystical = 1 };

    // A treasure store attached to one or more maze cells.
    class Hollow {
    public:
        virtual ~Hollow() = default;

        virtual HollowKind kind() const = 0;
        virtual int size() const = 0;

        // every treasure still here, best ratio first (ties: lowest id). Full listing
        // for display; visits go through collect.
        virtual std::vector<Treasure> candidates() const = 0;

        // removes the given treasures; ones that are no longer here are ignored.
        // returns how many were actually removed
        virtual int commit(const std::vector<Treasure>& taken) = 0;

        // One visit: pulls treasures best first and offers them to the selector,
        // stopping as soon as the selection is full. Only treasures that actually
        // left the hollow are reported as accepted.
        virtual Selection collect(const GreedySelector& selector, int capacity) = 0;

        bool empty() const { return size() == 0; }

        // best-ratio treasure that fits, removed from the hollow; nullopt leaves it untouched
        std::optional<Treasure> takeOptimal(int capacity);
    };

    // Treasures only this cell can see.
    class SpookyHollow : public Hollow {
    public:
        explicit SpookyHollow(const std::vector<Treasure>& treasures);

        HollowKind kind() const override { return HollowKind::Spooky; }
        int size() const override { return tree.size(); }
        std::vector<Treasure> candidates() const override;
        int commit(const std::vector<Treasure>& taken) override;
        Selection collect(const GreedySelector& selector, int capacity) override;

        const OrderedTree<RankKey, Treasure>& store() const { return tree; }

    private:
        OrderedTree<RankKey, Treasure> tree;
    };

    // One pool shared by every cell linked to it.
    class MysticalHollow : public Hollow {
    public:
        MysticalHollow(int poolId, const std::vector<Treasure>& treasures);

        HollowKind kind() const override { return HollowKind::Mystical; }
        int size() const override { return heap.size(); }
        std::vector<Treasure> candidates() const override { return heap.drainSorted(); }
        int commit(const std::vector<Treasure>& taken) override;
        Selection collect(const GreedySelector& selector, int capacity) override;

        int pool() const { return poolId; }
        void link(Position p) { cells.push_back(p); }
        const std::vector<Position>& linkedCells() const { return cells; }

    private:
        int poolId{ 0 };
        MaxHeap<Treasure, ByRatio> heap;
        std::vector<Position> cells;
    };

} // namespace hm
