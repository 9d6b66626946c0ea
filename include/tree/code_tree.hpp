#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "core/errors.hpp"
#include "core/symbol_format.hpp"

namespace hcodec {

// Binary code tree stored as an arena of nodes addressed by index.
// Leaves hold exactly one symbol; internal nodes hold exactly two children.
// A node can be attached to at most one parent, so every subtree is owned by
// exactly one node. Built once by build_code_tree(), then read-only.
template <typename T>
class CodeTree {
public:
    static constexpr int kNone = -1;

    struct Node {
        uint64_t freq{0};
        int left{kNone};
        int right{kNone};
        int symbol{kNone}; // index into symbols(), leaves only
    };

    CodeTree() = default;
    CodeTree(const CodeTree&) = delete;
    CodeTree& operator=(const CodeTree&) = delete;
    CodeTree(CodeTree&&) noexcept = default;
    CodeTree& operator=(CodeTree&&) noexcept = default;

    int add_leaf(T symbol, uint64_t freq) {
        Node n;
        n.freq = freq;
        n.symbol = static_cast<int>(symbols_.size());
        symbols_.push_back(std::move(symbol));
        return push_node(n);
    }

    int add_internal(int left, int right) {
        if (left == right) {
            throw InvalidWeightsError("tree: internal node needs two distinct children");
        }
        claim(left);
        claim(right);
        Node n;
        n.freq = nodes_[left].freq + nodes_[right].freq;
        n.left = left;
        n.right = right;
        return push_node(n);
    }

    void set_root(int idx) {
        check_index(idx);
        if (has_parent_[idx]) {
            throw InvalidWeightsError("tree: root must not have a parent");
        }
        root_ = idx;
    }

    int root() const { return root_; }
    bool empty() const { return root_ == kNone; }

    const Node& node(int idx) const { return nodes_[static_cast<size_t>(idx)]; }
    bool is_leaf(int idx) const { return nodes_[static_cast<size_t>(idx)].symbol != kNone; }
    // Symbol held by a leaf node.
    const T& symbol(int idx) const { return symbols_[static_cast<size_t>(nodes_[static_cast<size_t>(idx)].symbol)]; }

    const std::vector<T>& symbols() const { return symbols_; }
    size_t node_count() const { return nodes_.size(); }
    size_t leaf_count() const { return symbols_.size(); }
    uint64_t total_frequency() const { return empty() ? 0 : nodes_[static_cast<size_t>(root_)].freq; }

    // Longest root-to-leaf path. A lone leaf root counts as depth 1 since it
    // is given a one-bit code.
    size_t max_depth() const {
        if (empty()) return 0;
        if (is_leaf(root_)) return 1;
        size_t best = 0;
        std::vector<std::pair<int, size_t>> stack;
        stack.push_back({root_, 0});
        while (!stack.empty()) {
            auto [idx, depth] = stack.back();
            stack.pop_back();
            const Node& n = node(idx);
            if (n.symbol != kNone) {
                if (depth > best) best = depth;
                continue;
            }
            stack.push_back({n.right, depth + 1});
            stack.push_back({n.left, depth + 1});
        }
        return best;
    }

    // Indented dump, one node per line; left subtree first.
    void print(std::ostream& os) const {
        if (empty()) {
            os << "(empty)\n";
            return;
        }
        std::vector<std::pair<int, size_t>> stack;
        stack.push_back({root_, 0});
        while (!stack.empty()) {
            auto [idx, depth] = stack.back();
            stack.pop_back();
            const Node& n = node(idx);
            os << std::string(depth * 2, ' ');
            if (n.symbol != kNone) {
                os << describe_symbol(symbols_[static_cast<size_t>(n.symbol)]) << " (" << n.freq << ")\n";
                continue;
            }
            os << "* (" << n.freq << ")\n";
            stack.push_back({n.right, depth + 1});
            stack.push_back({n.left, depth + 1});
        }
    }

private:
    int push_node(const Node& n) {
        nodes_.push_back(n);
        has_parent_.push_back(false);
        return static_cast<int>(nodes_.size() - 1);
    }

    void check_index(int idx) const {
        if (idx < 0 || static_cast<size_t>(idx) >= nodes_.size()) {
            throw InvalidWeightsError("tree: invalid node index");
        }
    }

    void claim(int idx) {
        check_index(idx);
        if (has_parent_[idx]) {
            throw InvalidWeightsError("tree: node already owned by another parent");
        }
        has_parent_[idx] = true;
    }

    std::vector<Node> nodes_;
    std::vector<bool> has_parent_;
    std::vector<T> symbols_;
    int root_{kNone};
};

} // namespace hcodec
