#pragma once

#include <cstddef>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/errors.hpp"
#include "core/symbol_format.hpp"
#include "entropy/bit_vector.hpp"
#include "tree/code_tree.hpp"

namespace hcodec {

// Symbol -> code dictionary derived once from a code tree.
template <typename T>
class Encoder {
public:
    using Dictionary = std::unordered_map<T, BitVector>;

    explicit Encoder(const CodeTree<T>& tree) {
        if (tree.empty()) {
            throw InvalidWeightsError("encoder: empty code tree");
        }
        dict_.reserve(tree.leaf_count());

        // A lone leaf root has no path; give it the one-bit code "0".
        if (tree.is_leaf(tree.root())) {
            BitVector code;
            code.push_back(false);
            dict_.emplace(tree.symbol(tree.root()), std::move(code));
            return;
        }

        // DFS with an explicit stack: (node, path so far)
        std::vector<std::pair<int, BitVector>> stack;
        stack.push_back({tree.root(), BitVector{}});
        while (!stack.empty()) {
            auto [idx, path] = std::move(stack.back());
            stack.pop_back();
            const auto& n = tree.node(idx);
            if (tree.is_leaf(idx)) {
                dict_.emplace(tree.symbol(idx), std::move(path));
                continue;
            }
            BitVector left = path;
            left.push_back(false);
            path.push_back(true);
            // right then left so left is processed first
            stack.push_back({n.right, std::move(path)});
            stack.push_back({n.left, std::move(left)});
        }
    }

    // Concatenate the codes of data in order. Throws NoSuchKeyError on the
    // first symbol without a code; nothing is returned in that case.
    BitVector encode(const std::vector<T>& data) const {
        BitVector out;
        for (const T& s : data) {
            out.append(code_for(s));
        }
        return out;
    }

    const BitVector& code_for(const T& symbol) const {
        auto it = dict_.find(symbol);
        if (it == dict_.end()) {
            throw NoSuchKeyError(describe_symbol(symbol));
        }
        return it->second;
    }

    bool contains(const T& symbol) const { return dict_.find(symbol) != dict_.end(); }
    size_t size() const { return dict_.size(); }
    const Dictionary& dictionary() const { return dict_; }

private:
    Dictionary dict_;
};

} // namespace hcodec
