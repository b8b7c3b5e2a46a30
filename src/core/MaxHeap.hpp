// ========================= src/core/MaxHeap.hpp =========================
#pragma once
#include <vector>
#include <optional>
#include <cstdint>
#include <utility>
#include <functional>

namespace hm {

    // Array-backed binary max-heap. Less orders items like std::priority_queue;
    // items equal under Less come out in insertion order.
    template <typename T, typename Less = std::less<T>>
    class MaxHeap {
    public:
        MaxHeap() = default;
        explicit MaxHeap(Less cmp) :less(std::move(cmp)) {}

        // bottom-up heapify, O(n)
        explicit MaxHeap(const std::vector<T>& items, Less cmp = Less()) :less(std::move(cmp)) {
            a.reserve(items.size());
            for (const auto& it : items) a.push_back(Entry{ it, seq++ });
            for (int i = (int)a.size() / 2 - 1; i >= 0; --i) siftDown(i);
        }

        void push(const T& item) {
            a.push_back(Entry{ item, seq++ });
            siftUp((int)a.size() - 1);
        }

        std::optional<T> peekMax() const {
            if (a.empty()) return std::nullopt;
            return a.front().item;
        }

        std::optional<T> extractMax() {
            if (a.empty()) return std::nullopt;
            T top = std::move(a.front().item);
            a.front() = std::move(a.back());
            a.pop_back();
            if (!a.empty()) siftDown(0);
            return top;
        }

        // all items, best first; the heap itself is not touched
        std::vector<T> drainSorted() const {
            MaxHeap copy = *this;
            std::vector<T> out; out.reserve(a.size());
            while (auto t = copy.extractMax()) out.push_back(std::move(*t));
            return out;
        }

        int size() const { return (int)a.size(); }
        bool empty() const { return a.empty(); }

        // parent >= child at every index
        bool isHeap() const {
            for (int i = 1; i < (int)a.size(); ++i) if (before(i, (i - 1) / 2)) return false;
            return true;
        }

    private:
        struct Entry { T item; uint64_t seq; };

        std::vector<Entry> a;
        uint64_t seq{ 0 };
        Less less{};

        // true when a[i] must sit above a[j]
        bool before(int i, int j) const {
            if (less(a[j].item, a[i].item)) return true;
            if (less(a[i].item, a[j].item)) return false;
            return a[i].seq < a[j].seq;
        }

        void siftUp(int i) {
            while (i > 0) {
                int p = (i - 1) / 2;
                if (!before(i, p)) break;
                std::swap(a[i], a[p]);
                i = p;
            }
        }

        void siftDown(int i) {
            const int n = (int)a.size();
            for (;;) {
                int l = 2 * i + 1, r = l + 1, best = i;
                if (l < n && before(l, best)) best = l;
                if (r < n && before(r, best)) best = r;
                if (best == i) break;
                std::swap(a[i], a[best]);
                i = best;
            }
        }
    };

} // namespace hm
