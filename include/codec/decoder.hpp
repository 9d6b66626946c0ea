#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <utility>
#include <vector>

#include "codec/options.hpp"
#include "core/errors.hpp"
#include "entropy/bit_vector.hpp"
#include "tree/code_tree.hpp"

namespace hcodec {

// Walks a code tree one bit at a time and yields the symbol at every leaf.
// Symbols are referenced in place from the tree.
template <typename T>
class DecodeIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = T;
    using difference_type = std::ptrdiff_t;
    using pointer = const T*;
    using reference = const T&;

    // end sentinel
    DecodeIterator() = default;

    DecodeIterator(const CodeTree<T>* tree, const BitVector* bits, TruncationPolicy policy)
        : tree_(tree), bits_(bits), policy_(policy) {
        advance();
    }

    reference operator*() const { return tree_->symbol(leaf_); }
    pointer operator->() const { return &tree_->symbol(leaf_); }

    DecodeIterator& operator++() {
        advance();
        return *this;
    }
    DecodeIterator operator++(int) {
        DecodeIterator prev = *this;
        advance();
        return prev;
    }

    // Bits consumed so far.
    size_t position() const { return pos_; }

    bool operator==(const DecodeIterator& o) const {
        return tree_ == o.tree_ && bits_ == o.bits_ && pos_ == o.pos_ && leaf_ == o.leaf_;
    }
    bool operator!=(const DecodeIterator& o) const { return !(*this == o); }

private:
    void advance() {
        const int root = tree_->root();
        const size_t start = pos_;
        int cur = root;
        while (pos_ < bits_->size()) {
            const bool bit = (*bits_)[pos_++];
            const auto& n = tree_->node(cur);
            const int next = bit ? n.right : n.left;
            if (next != CodeTree<T>::kNone) cur = next;
            if (tree_->is_leaf(cur)) {
                leaf_ = cur;
                return;
            }
        }
        if (cur != root && policy_ == TruncationPolicy::error) {
            throw TruncatedStreamError(start, pos_ - start);
        }
        *this = DecodeIterator();
    }

    const CodeTree<T>* tree_{nullptr};
    const BitVector* bits_{nullptr};
    TruncationPolicy policy_{TruncationPolicy::discard};
    size_t pos_{0};
    int leaf_{CodeTree<T>::kNone};
};

// Lazy decode of one bitstream. Every begin() restarts at the first bit.
// The range keeps a pointer to the bitstream, so the bitstream and the owning
// Decoder must outlive the range and every iterator taken from it. Temporaries
// are rejected at compile time; decode() or decode_owned() take them.
template <typename T>
class DecodeRange {
public:
    DecodeRange(const CodeTree<T>* tree, const BitVector* bits, TruncationPolicy policy)
        : tree_(tree), bits_(bits), policy_(policy) {}

    DecodeIterator<T> begin() const { return DecodeIterator<T>(tree_, bits_, policy_); }
    DecodeIterator<T> end() const { return DecodeIterator<T>(); }

private:
    const CodeTree<T>* tree_;
    const BitVector* bits_;
    TruncationPolicy policy_;
};

// Owns a code tree for its whole lifetime. The tree is heap-held, so symbol
// references handed out by decode() survive moving the Decoder itself.
template <typename T>
class Decoder {
public:
    explicit Decoder(CodeTree<T> tree, CodecOptions opts = {})
        : tree_(std::make_unique<CodeTree<T>>(std::move(tree))), opts_(opts) {
        if (tree_->empty()) {
            throw InvalidWeightsError("decoder: empty code tree");
        }
    }

    DecodeRange<T> decode_iter(const BitVector& bits) const {
        return DecodeRange<T>(tree_.get(), &bits, opts_.on_truncation);
    }
    DecodeRange<T> decode_iter(const BitVector&& bits) const = delete;

    std::vector<std::reference_wrapper<const T>> decode(const BitVector& bits) const {
        std::vector<std::reference_wrapper<const T>> out;
        for (const T& s : decode_iter(bits)) {
            out.push_back(std::cref(s));
        }
        return out;
    }

    std::vector<T> decode_owned(const BitVector& bits) const {
        std::vector<T> out;
        for (const T& s : decode_iter(bits)) {
            out.push_back(s);
        }
        return out;
    }

    const CodeTree<T>& tree() const { return *tree_; }
    const CodecOptions& options() const { return opts_; }

private:
    std::unique_ptr<const CodeTree<T>> tree_;
    CodecOptions opts_;
};

} // namespace hcodec
