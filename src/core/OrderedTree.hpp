// ========================= src/core/OrderedTree.hpp =========================
#pragma once
#include <memory>
#include <optional>
#include <vector>
#include <utility>
#include <algorithm>
#include <functional>

namespace hm {

    // AVL tree. Keys need operator<; equality is !(a<b) && !(b<a).
    template <typename K, typename V>
    class OrderedTree {
    public:
        OrderedTree() = default;

        // Balanced bulk build: sort once, then insert medians before their halves
        // so every insert lands on an already balanced tree.
        explicit OrderedTree(std::vector<std::pair<K, V>> elements) {
            std::stable_sort(elements.begin(), elements.end(),
                [](const std::pair<K, V>& a, const std::pair<K, V>& b) { return a.first < b.first; });
            std::function<void(int, int)> build = [&](int l, int r) {
                if (l > r) return;
                int m = (l + r) / 2;
                insert(elements[m].first, elements[m].second);
                build(l, m - 1);
                build(m + 1, r);
            };
            build(0, (int)elements.size() - 1);
        }

        OrderedTree(const OrderedTree& o) { root = cloneNode(o.root.get()); count = o.count; }
        OrderedTree& operator=(const OrderedTree& o) {
            if (this != &o) { root = cloneNode(o.root.get()); count = o.count; }
            return *this;
        }
        OrderedTree(OrderedTree&&) noexcept = default;
        OrderedTree& operator=(OrderedTree&&) noexcept = default;

        // existing key: payload replaced, size unchanged
        void insert(const K& key, const V& payload) { root = insertAt(std::move(root), key, payload); }

        // false when the key is absent (NotFound); the tree is left untouched
        bool remove(const K& key) {
            bool removed = false;
            root = removeAt(std::move(root), key, removed);
            if (removed) --count;
            return removed;
        }

        std::optional<V> find(const K& key) const {
            const Node* n = root.get();
            while (n) {
                if (key < n->key) n = n->left.get();
                else if (n->key < key) n = n->right.get();
                else return n->payload;
            }
            return std::nullopt;
        }

        bool contains(const K& key) const { return find(key).has_value(); }

        std::optional<std::pair<K, V>> minimal() const {
            const Node* n = root.get(); if (!n) return std::nullopt;
            while (n->left) n = n->left.get();
            return std::make_pair(n->key, n->payload);
        }

        std::optional<std::pair<K, V>> maximal() const {
            const Node* n = root.get(); if (!n) return std::nullopt;
            while (n->right) n = n->right.get();
            return std::make_pair(n->key, n->payload);
        }

        // ascending key order
        void forEach(const std::function<void(const K&, const V&)>& fn) const { walkAsc(root.get(), fn); }

        // descending key order; return false from fn to stop early
        void forEachDescending(const std::function<bool(const K&, const V&)>& fn) const { walkDesc(root.get(), fn); }

        std::vector<K> keys() const {
            std::vector<K> out; out.reserve(count);
            forEach([&](const K& k, const V&) { out.push_back(k); });
            return out;
        }

        int size() const { return count; }
        bool empty() const { return count == 0; }
        int height() const { return h(root.get()); }
        void clear() { root.reset(); count = 0; }

        // checks ordering, stored heights and the AVL balance factor of every node
        bool isBalanced() const {
            bool ok = true;
            const K* prev = nullptr;
            checkNode(root.get(), prev, ok);
            return ok;
        }

    private:
        struct Node {
            K key; V payload;
            std::unique_ptr<Node> left, right;
            int height{ 1 };
            Node(const K& k, const V& v) :key(k), payload(v) {}
        };
        using NodePtr = std::unique_ptr<Node>;

        NodePtr root;
        int count{ 0 };

        static int h(const Node* n) { return n ? n->height : 0; }
        static void update(Node* n) { n->height = 1 + std::max(h(n->left.get()), h(n->right.get())); }
        static int balance(const Node* n) { return h(n->left.get()) - h(n->right.get()); }

        static NodePtr rotateRight(NodePtr y) {
            NodePtr x = std::move(y->left);
            y->left = std::move(x->right);
            update(y.get());
            x->right = std::move(y);
            update(x.get());
            return x;
        }

        static NodePtr rotateLeft(NodePtr x) {
            NodePtr y = std::move(x->right);
            x->right = std::move(y->left);
            update(x.get());
            y->left = std::move(x);
            update(y.get());
            return y;
        }

        static NodePtr rebalance(NodePtr n) {
            update(n.get());
            int b = balance(n.get());
            if (b > 1) {
                if (balance(n->left.get()) < 0) n->left = rotateLeft(std::move(n->left));
                return rotateRight(std::move(n));
            }
            if (b < -1) {
                if (balance(n->right.get()) > 0) n->right = rotateRight(std::move(n->right));
                return rotateLeft(std::move(n));
            }
            return n;
        }

        NodePtr insertAt(NodePtr n, const K& key, const V& payload) {
            if (!n) { ++count; return std::make_unique<Node>(key, payload); }
            if (key < n->key) n->left = insertAt(std::move(n->left), key, payload);
            else if (n->key < key) n->right = insertAt(std::move(n->right), key, payload);
            else { n->payload = payload; return n; }
            return rebalance(std::move(n));
        }

        // detaches the leftmost node of a subtree into out
        static NodePtr takeMin(NodePtr n, NodePtr& out) {
            if (!n->left) {
                NodePtr rest = std::move(n->right);
                out = std::move(n);
                return rest;
            }
            n->left = takeMin(std::move(n->left), out);
            return rebalance(std::move(n));
        }

        static NodePtr removeAt(NodePtr n, const K& key, bool& removed) {
            if (!n) return n;
            if (key < n->key) n->left = removeAt(std::move(n->left), key, removed);
            else if (n->key < key) n->right = removeAt(std::move(n->right), key, removed);
            else {
                removed = true;
                if (!n->left) return std::move(n->right);
                if (!n->right) return std::move(n->left);
                NodePtr succ;
                NodePtr right = takeMin(std::move(n->right), succ);
                succ->left = std::move(n->left);
                succ->right = std::move(right);
                return rebalance(std::move(succ));
            }
            return rebalance(std::move(n));
        }

        static NodePtr cloneNode(const Node* n) {
            if (!n) return nullptr;
            auto c = std::make_unique<Node>(n->key, n->payload);
            c->height = n->height;
            c->left = cloneNode(n->left.get());
            c->right = cloneNode(n->right.get());
            return c;
        }

        static void walkAsc(const Node* n, const std::function<void(const K&, const V&)>& fn) {
            if (!n) return;
            walkAsc(n->left.get(), fn);
            fn(n->key, n->payload);
            walkAsc(n->right.get(), fn);
        }

        static bool walkDesc(const Node* n, const std::function<bool(const K&, const V&)>& fn) {
            if (!n) return true;
            if (!walkDesc(n->right.get(), fn)) return false;
            if (!fn(n->key, n->payload)) return false;
            return walkDesc(n->left.get(), fn);
        }

        static int checkNode(const Node* n, const K*& prev, bool& ok) {
            if (!n) return 0;
            int lh = checkNode(n->left.get(), prev, ok);
            if (prev && !(*prev < n->key)) ok = false;
            prev = &n->key;
            int rh = checkNode(n->right.get(), prev, ok);
            if (lh - rh > 1 || rh - lh > 1) ok = false;
            if (n->height != 1 + std::max(lh, rh)) ok = false;
            return 1 + std::max(lh, rh);
        }
    };

} // namespace hm
