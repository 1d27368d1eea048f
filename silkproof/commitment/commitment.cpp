// Copyright 2025 The Silkproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "commitment.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include <silkproof/core/common/ensure.hpp>
#include <silkproof/core/crypto/sha256.hpp>
#include <silkproof/infra/common/log.hpp>

namespace silkproof::commitment {

static std::vector<Bytes> encode_receipts(const std::vector<ReceiptRecord>& records) {
    ensure_pre_condition(!records.empty(), "cannot commit to an empty receipt list");
    std::vector<Bytes> leaves;
    leaves.reserve(records.size());
    for (const auto& record : records) {
        leaves.push_back(encode_receipt(record));
    }
    return leaves;
}

static Selection make_selection(const merkle::MerkleTree& tree, const std::vector<Bytes>& leaves, size_t position) {
    return {{tree.root()}, tree.proof(position), leaves.at(position)};
}

ReceiptCommitment::ReceiptCommitment(std::vector<ReceiptRecord> records)
    : records_{std::move(records)},
      leaves_{encode_receipts(records_)},
      tree_{merkle::MerkleTree::build(leaves_)} {
    SILKPROOF_DEBUG_M("ReceiptCommitment built", {"receipts", std::to_string(records_.size()),
                                                  "root", tree_.root().to_hex(true)});
}

Selection ReceiptCommitment::select(std::optional<uint64_t> tx_index) const {
    size_t position{0};
    if (tx_index) {
        const auto it{std::ranges::find_if(records_, [&](const auto& r) { return r.index == *tx_index; })};
        ensure_pre_condition(it != records_.end(), [&]() {
            return "no receipt for transaction index " + std::to_string(*tx_index);
        });
        position = static_cast<size_t>(std::distance(records_.begin(), it));
    }
    SILKPROOF_TRACE << "ReceiptCommitment::select position=" << position;
    return make_selection(tree_, leaves_, position);
}

Bytes identifier_leaf(const Hash& identifier) {
    const std::string json_text{nlohmann::json(identifier.to_hex(/*with_prefix=*/true)).dump()};
    const Hash digest{crypto::sha256(json_text)};
    return Bytes{ByteView{digest}};
}

static std::vector<Hash> append_aggregate(std::vector<Hash> tx_hashes, const Hash& transactions_root) {
    tx_hashes.push_back(transactions_root);
    return tx_hashes;
}

static std::vector<Bytes> identifier_leaves(const std::vector<Hash>& identifiers) {
    std::vector<Bytes> leaves;
    leaves.reserve(identifiers.size());
    for (const auto& identifier : identifiers) {
        leaves.push_back(identifier_leaf(identifier));
    }
    return leaves;
}

IdentifierCommitment::IdentifierCommitment(std::vector<Hash> tx_hashes, const Hash& transactions_root)
    : identifiers_{append_aggregate(std::move(tx_hashes), transactions_root)},
      leaves_{identifier_leaves(identifiers_)},
      tree_{merkle::MerkleTree::build(leaves_)} {
    SILKPROOF_DEBUG_M("IdentifierCommitment built", {"identifiers", std::to_string(identifiers_.size()),
                                                     "root", tree_.root().to_hex(true)});
}

std::optional<size_t> IdentifierCommitment::find(const Hash& target) const {
    const auto it{std::ranges::find(identifiers_, target)};
    if (it == identifiers_.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(std::distance(identifiers_.begin(), it));
}

Selection IdentifierCommitment::select(const std::optional<Hash>& target) const {
    size_t position{0};
    if (target) {
        const auto found{find(*target)};
        ensure_pre_condition(found.has_value(), [&]() {
            return "identifier " + target->to_hex(/*with_prefix=*/true) + " not found";
        });
        position = *found;
    }
    SILKPROOF_TRACE << "IdentifierCommitment::select position=" << position;
    return make_selection(tree_, leaves_, position);
}

BlockCommitment commit_block(BlockNum block_num, std::vector<ReceiptRecord> receipts,
                             std::vector<Hash> tx_hashes, const Hash& transactions_root) {
    const ReceiptCommitment receipts_commitment{std::move(receipts)};
    const IdentifierCommitment identifiers_commitment{std::move(tx_hashes), transactions_root};
    BlockCommitment block_commitment{
        .block_num = block_num,
        .receipts_root = receipts_commitment.root(),
        .identifiers_root = identifiers_commitment.root(),
    };
    SILKPROOF_INFO_M("Block committed", {"block", std::to_string(block_num),
                                         "receipts_root", block_commitment.receipts_root.hash.to_hex(true),
                                         "identifiers_root", block_commitment.identifiers_root.hash.to_hex(true)});
    return block_commitment;
}

}  // namespace silkproof::commitment
