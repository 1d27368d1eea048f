// Copyright 2025 The Silkproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <vector>

#include <silkproof/core/common/bytes.hpp>
#include <silkproof/core/types/hash.hpp>

namespace silkproof::merkle {

//! Sibling digests ordered from the leaf level up to (excluding) the root
using Proof = std::vector<Hash>;

//! \brief Smallest power of two greater than or equal to n (1 for n <= 1)
size_t padded_leaf_count(size_t n) noexcept;

//! \brief Position of the sibling of node v in heap layout (v > 0)
constexpr size_t sibling(size_t v) noexcept { return (v % 2 == 0) ? v - 1 : v + 1; }

//! \brief Position of the parent of node v in heap layout (v > 0)
constexpr size_t parent(size_t v) noexcept { return (v - 1) / 2; }

//! \brief Position of the left child of node i in heap layout
constexpr size_t left_child(size_t i) noexcept { return 2 * i + 1; }

//! \brief Position of the right child of node i in heap layout
constexpr size_t right_child(size_t i) noexcept { return 2 * i + 2; }

//! \brief Binary Merkle tree over an ordered list of blobs, built once and read-only afterward
//! \details The leaf list is padded with empty blobs up to L = padded_leaf_count(n) leaves. Nodes are kept in a
//! single array of 2L - 1 digests using 0-based heap addressing: node 0 is the root, node i has children 2i + 1 and
//! 2i + 2, and the last L slots hold the leaf digests in input order. Internal nodes are combine()d pairs.
//! Proofs are produced for the n original leaves only.
class MerkleTree {
  public:
    //! \brief Builds the tree and all the proofs for the given leaves
    //! \throws std::invalid_argument if leaves is empty
    static MerkleTree build(const std::vector<Bytes>& leaves);

    const Hash& root() const noexcept { return nodes_.front(); }

    //! \brief All the proofs, proofs()[i] being the one for leaves[i]
    const std::vector<Proof>& proofs() const noexcept { return proofs_; }

    //! \brief The proof for leaf at provided index
    //! \throws std::invalid_argument if index is out of range
    const Proof& proof(size_t index) const;

    //! Number of original (unpadded) leaves
    size_t leaf_count() const noexcept { return proofs_.size(); }

    //! Number of leaves after padding, always a power of two
    size_t padded_leaf_count() const noexcept { return (nodes_.size() + 1) / 2; }

    //! Length of every proof, i.e. log2(padded_leaf_count())
    size_t depth() const noexcept;

    const std::vector<Hash>& nodes() const noexcept { return nodes_; }

  private:
    MerkleTree(std::vector<Hash> nodes, std::vector<Proof> proofs);

    Proof extract_proof(size_t leaf_index) const;

    std::vector<Hash> nodes_;
    std::vector<Proof> proofs_;
};

}  // namespace silkproof::merkle
