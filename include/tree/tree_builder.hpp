#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <queue>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/errors.hpp"
#include "tree/code_tree.hpp"

namespace hcodec {

template <typename T>
using Weights = std::vector<std::pair<T, uint32_t>>;

namespace detail {

// Heap entry used during the merge loop.
struct HeapNode {
    uint64_t freq;
    uint64_t seq;  // creation order, breaks frequency ties
    int node;      // index into the tree arena
};

struct HeapComp {
    bool operator()(const HeapNode& a, const HeapNode& b) const {
        if (a.freq != b.freq) return a.freq > b.freq; // min-heap
        return a.seq > b.seq; // earlier node first
    }
};

// Frequencies must be non-negative and fit in 32 bits.
template <typename F>
uint64_t checked_frequency(const F& f) {
    if constexpr (std::is_signed_v<F>) {
        if (f < 0) {
            throw InvalidWeightsError("negative frequency");
        }
    }
    if (static_cast<std::make_unsigned_t<F>>(f) > std::numeric_limits<uint32_t>::max()) {
        throw InvalidWeightsError("frequency out of range");
    }
    return static_cast<uint64_t>(f);
}

} // namespace detail

// Count symbol occurrences; symbols are listed in order of first appearance.
template <typename T>
Weights<T> count_frequencies(const std::vector<T>& data) {
    Weights<T> out;
    std::unordered_map<T, size_t> pos;
    pos.reserve(data.size());
    for (const T& s : data) {
        auto it = pos.find(s);
        if (it == pos.end()) {
            pos.emplace(s, out.size());
            out.emplace_back(s, 1u);
            continue;
        }
        uint32_t& f = out[it->second].second;
        if (f == std::numeric_limits<uint32_t>::max()) {
            throw InvalidWeightsError("frequency overflow");
        }
        ++f;
    }
    return out;
}

// Build the Huffman code tree for a (symbol, frequency) table.
//
// Range is any iterable of pairs (first = symbol, second = integer
// frequency). A negative frequency or one above 32 bits is rejected.
// Repeated symbols are merged into one leaf carrying the summed frequency.
// Each merge takes the two lightest nodes from a min-heap; the first one
// taken becomes the left child (bit 0) and the second the right child
// (bit 1). Equal frequencies are resolved by creation order: leaves in table
// order, then merged nodes in the order they were made.
template <typename T, typename Range>
CodeTree<T> build_code_tree(const Range& weights) {
    // coalesce duplicates, keeping first-seen order
    std::vector<std::pair<T, uint64_t>> leaves;
    std::unordered_map<T, size_t> pos;
    for (const auto& w : weights) {
        const uint64_t freq = detail::checked_frequency(w.second);
        auto it = pos.find(w.first);
        if (it == pos.end()) {
            pos.emplace(w.first, leaves.size());
            leaves.emplace_back(w.first, freq);
            continue;
        }
        uint64_t sum = leaves[it->second].second + freq;
        if (sum > std::numeric_limits<uint32_t>::max()) {
            throw InvalidWeightsError("frequency overflow");
        }
        leaves[it->second].second = sum;
    }
    if (leaves.empty()) {
        throw InvalidWeightsError("empty frequency table");
    }

    CodeTree<T> tree;
    std::priority_queue<detail::HeapNode, std::vector<detail::HeapNode>, detail::HeapComp> pq;
    uint64_t seq = 0;
    for (auto& leaf : leaves) {
        const uint64_t freq = leaf.second;
        const int idx = tree.add_leaf(std::move(leaf.first), freq);
        pq.push({freq, seq++, idx});
    }

    while (pq.size() > 1) {
        detail::HeapNode a = pq.top(); pq.pop();
        detail::HeapNode b = pq.top(); pq.pop();
        const int parent = tree.add_internal(a.node, b.node);
        pq.push({a.freq + b.freq, seq++, parent});
    }
    if (pq.empty()) {
        throw InvalidWeightsError("expected a root node");
    }
    tree.set_root(pq.top().node);
    return tree;
}

} // namespace hcodec
