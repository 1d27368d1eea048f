// Copyright 2025 The Silkproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <silkproof/commitment/receipt.hpp>
#include <silkproof/core/common/base.hpp>
#include <silkproof/core/common/bytes.hpp>
#include <silkproof/core/merkle/proof.hpp>
#include <silkproof/core/merkle/tree.hpp>
#include <silkproof/core/types/hash.hpp>

namespace silkproof::commitment {

//! \brief One leaf picked out of a commitment, together with what is needed to check it
struct Selection {
    merkle::MerkleRoot root;
    merkle::Proof proof;
    Bytes leaf;
};

//! \brief Object-commitment mode: one leaf per canonically encoded receipt, in the given order
class ReceiptCommitment {
  public:
    //! \throws std::invalid_argument if records is empty
    explicit ReceiptCommitment(std::vector<ReceiptRecord> records);

    merkle::MerkleRoot root() const { return {tree_.root()}; }
    const merkle::MerkleTree& tree() const noexcept { return tree_; }
    const std::vector<Bytes>& leaves() const noexcept { return leaves_; }
    const std::vector<ReceiptRecord>& records() const noexcept { return records_; }

    //! \brief Selects the receipt of the transaction at tx_index within its block, the first one if not given
    //! \throws std::invalid_argument if no record carries the requested transaction index
    Selection select(std::optional<uint64_t> tx_index = std::nullopt) const;

  private:
    std::vector<ReceiptRecord> records_;
    std::vector<Bytes> leaves_;
    merkle::MerkleTree tree_;
};

//! \brief Leaf blob for a transaction hash: SHA-256 of its JSON string form ("0x" followed by 64 lowercase digits,
//! quotes included)
//! \remarks The tree hashes this digest once more with Keccak-256, existing commitments depend on both steps
Bytes identifier_leaf(const Hash& identifier);

//! \brief Identifier-commitment mode: one leaf per transaction hash plus a trailing leaf for the block's
//! transactions root
class IdentifierCommitment {
  public:
    IdentifierCommitment(std::vector<Hash> tx_hashes, const Hash& transactions_root);

    merkle::MerkleRoot root() const { return {tree_.root()}; }
    const merkle::MerkleTree& tree() const noexcept { return tree_; }
    const std::vector<Bytes>& leaves() const noexcept { return leaves_; }

    //! \brief Committed identifiers: the transaction hashes followed by the transactions root
    const std::vector<Hash>& identifiers() const noexcept { return identifiers_; }

    //! \brief Position of the first occurrence of target among the identifiers, if any
    std::optional<size_t> find(const Hash& target) const;

    //! \brief Selects the leaf of target, the first identifier if not given
    //! \throws std::invalid_argument if target is not among the identifiers
    Selection select(const std::optional<Hash>& target = std::nullopt) const;

  private:
    std::vector<Hash> identifiers_;
    std::vector<Bytes> leaves_;
    merkle::MerkleTree tree_;
};

//! \brief The pair of roots published for one block
struct BlockCommitment {
    BlockNum block_num{0};
    merkle::MerkleRoot receipts_root;
    merkle::MerkleRoot identifiers_root;

    friend bool operator==(const BlockCommitment&, const BlockCommitment&) = default;
};

//! \brief Builds both commitments for one block
//! \throws std::invalid_argument if receipts is empty
BlockCommitment commit_block(BlockNum block_num, std::vector<ReceiptRecord> receipts,
                             std::vector<Hash> tx_hashes, const Hash& transactions_root);

}  // namespace silkproof::commitment
