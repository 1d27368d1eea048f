// Copyright 2025 The Silkproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "tree.hpp"

#include <bit>
#include <string>
#include <utility>

#include <silkproof/core/common/assert.hpp>
#include <silkproof/core/common/ensure.hpp>
#include <silkproof/core/merkle/hashing.hpp>

namespace silkproof::merkle {

size_t padded_leaf_count(size_t n) noexcept {
    return n <= 1 ? 1 : std::bit_ceil(n);
}

MerkleTree::MerkleTree(std::vector<Hash> nodes, std::vector<Proof> proofs)
    : nodes_{std::move(nodes)}, proofs_{std::move(proofs)} {}

MerkleTree MerkleTree::build(const std::vector<Bytes>& leaves) {
    ensure_pre_condition(!leaves.empty(), "cannot build a Merkle tree over an empty leaf list");

    const size_t leaf_count{leaves.size()};
    const size_t padded_count{merkle::padded_leaf_count(leaf_count)};
    const size_t first_leaf{padded_count - 1};

    std::vector<Hash> nodes(2 * padded_count - 1);

    // Padding leaves are empty blobs
    const Hash empty_leaf{leaf_digest(ByteView{})};
    for (size_t j{0}; j < padded_count; ++j) {
        nodes[first_leaf + j] = j < leaf_count ? leaf_digest(leaves[j]) : empty_leaf;
    }

    // Decreasing positions guarantee both children are already computed
    for (size_t i{first_leaf}; i > 0; --i) {
        const size_t node{i - 1};
        nodes[node] = combine(nodes[left_child(node)], nodes[right_child(node)]);
    }

    MerkleTree tree{std::move(nodes), {}};
    tree.proofs_.reserve(leaf_count);
    for (size_t i{0}; i < leaf_count; ++i) {
        tree.proofs_.push_back(tree.extract_proof(i));
    }
    return tree;
}

Proof MerkleTree::extract_proof(size_t leaf_index) const {
    Proof proof;
    proof.reserve(depth());
    size_t v{padded_leaf_count() - 1 + leaf_index};
    SILKPROOF_ASSERT(v < nodes_.size());
    while (v > 0) {
        proof.push_back(nodes_[sibling(v)]);
        v = parent(v);
    }
    return proof;
}

const Proof& MerkleTree::proof(size_t index) const {
    ensure_pre_condition(index < proofs_.size(), [&]() {
        return "leaf index " + std::to_string(index) + " out of range [0, " + std::to_string(proofs_.size()) + ")";
    });
    return proofs_[index];
}

size_t MerkleTree::depth() const noexcept {
    return static_cast<size_t>(std::countr_zero(padded_leaf_count()));
}

}  // namespace silkproof::merkle
