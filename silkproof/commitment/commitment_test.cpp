// Copyright 2025 The Silkproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "commitment.hpp"

#include <string>

#include <catch2/catch_test_macros.hpp>

#include <silkproof/core/crypto/sha256.hpp>
#include <silkproof/core/merkle/hashing.hpp>
#include <silkproof/infra/test_util/log.hpp>

namespace silkproof::commitment {

using namespace evmc::literals;

static std::vector<ReceiptRecord> sample_receipts(size_t count) {
    std::vector<ReceiptRecord> records;
    for (size_t i{0}; i < count; ++i) {
        records.push_back(ReceiptRecord{
            .tx_hash = "0x" + std::string(63, '0') + std::to_string(i),
            .index = 10 + i,
            .logs = {"log" + std::to_string(i)},
            .from = "0xf0",
            .to = "0x70",
            .block_hash = "0xbb",
            .root = "0x00",
            .logs_bloom = "0x00",
        });
    }
    return records;
}

static const Hash kTx0{0x1111111111111111111111111111111111111111111111111111111111111111_bytes32};
static const Hash kTx1{0x2222222222222222222222222222222222222222222222222222222222222222_bytes32};
static const Hash kTx2{0x3333333333333333333333333333333333333333333333333333333333333333_bytes32};
static const Hash kTxRoot{0x56e81f171bcc55a6ff8345e692c0f86e5b48e01b996cadc001622fb5e363b421_bytes32};

TEST_CASE("ReceiptCommitment") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    const auto records{sample_receipts(3)};
    const ReceiptCommitment commitment{records};

    CHECK(commitment.leaves().size() == 3);
    CHECK(commitment.tree().leaf_count() == 3);
    CHECK(commitment.leaves()[1] == encode_receipt(records[1]));
    CHECK(commitment.root() == merkle::MerkleRoot{merkle::MerkleTree::build(commitment.leaves()).root()});

    SECTION("select defaults to the first receipt") {
        const auto selection{commitment.select()};
        CHECK(selection.leaf == encode_receipt(records[0]));
        CHECK(selection.root == commitment.root());
        CHECK(selection.root.verify(selection.leaf, selection.proof));
    }

    SECTION("select by transaction index") {
        const auto selection{commitment.select(12)};
        CHECK(selection.leaf == encode_receipt(records[2]));
        CHECK(selection.proof == commitment.tree().proof(2));
        CHECK(selection.root.verify(selection.leaf, selection.proof));
        CHECK_FALSE(selection.root.verify(encode_receipt(records[1]), selection.proof));
    }

    SECTION("unknown transaction index") {
        CHECK_THROWS_AS(commitment.select(3), std::invalid_argument);
    }

    SECTION("empty receipt list") {
        CHECK_THROWS_AS(ReceiptCommitment{std::vector<ReceiptRecord>{}}, std::invalid_argument);
    }
}

TEST_CASE("identifier_leaf hashes the JSON string form") {
    const std::string json_text{"\"0x" + kTx0.to_hex() + "\""};
    CHECK(identifier_leaf(kTx0) == Bytes{ByteView{crypto::sha256(json_text)}});
    CHECK(identifier_leaf(kTx0).size() == kHashLength);
    CHECK(identifier_leaf(kTx0) != identifier_leaf(kTx1));
}

TEST_CASE("IdentifierCommitment") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    const IdentifierCommitment commitment{{kTx0, kTx1, kTx2}, kTxRoot};

    REQUIRE(commitment.identifiers().size() == 4);
    CHECK(commitment.identifiers().back() == kTxRoot);
    CHECK(commitment.tree().padded_leaf_count() == 4);

    SECTION("leaves are hashed again by the tree") {
        CHECK(commitment.tree().nodes()[3] == merkle::leaf_digest(identifier_leaf(kTx0)));
        CHECK(commitment.tree().nodes()[6] == merkle::leaf_digest(identifier_leaf(kTxRoot)));
    }

    SECTION("find") {
        CHECK(commitment.find(kTx1) == 1);
        CHECK(commitment.find(kTxRoot) == 3);
        CHECK_FALSE(commitment.find(Hash{}).has_value());
    }

    SECTION("select defaults to the first identifier") {
        const auto selection{commitment.select()};
        CHECK(selection.leaf == identifier_leaf(kTx0));
        CHECK(selection.root.verify(selection.leaf, selection.proof));
    }

    SECTION("select by identifier") {
        const auto selection{commitment.select(kTx2)};
        CHECK(selection.leaf == identifier_leaf(kTx2));
        CHECK(selection.proof.size() == 2);
        CHECK(selection.root.verify(selection.leaf, selection.proof));
        CHECK_FALSE(selection.root.verify(identifier_leaf(kTx1), selection.proof));
    }

    SECTION("select the aggregate root identifier") {
        const auto selection{commitment.select(kTxRoot)};
        CHECK(selection.root.verify(identifier_leaf(kTxRoot), selection.proof));
    }

    SECTION("unknown identifier") {
        CHECK_THROWS_AS(commitment.select(Hash{}), std::invalid_argument);
    }
}

TEST_CASE("IdentifierCommitment over a block without transactions") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    const IdentifierCommitment commitment{{}, kTxRoot};
    CHECK(commitment.identifiers().size() == 1);
    CHECK(commitment.tree().depth() == 0);
    CHECK(commitment.root().hash == merkle::leaf_digest(identifier_leaf(kTxRoot)));
    CHECK(commitment.select().proof.empty());
}

TEST_CASE("commit_block") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    const auto block_commitment{commit_block(42, sample_receipts(5), {kTx0, kTx1}, kTxRoot)};

    CHECK(block_commitment.block_num == 42);
    CHECK(block_commitment.receipts_root == ReceiptCommitment{sample_receipts(5)}.root());
    CHECK(block_commitment.identifiers_root == IdentifierCommitment({kTx0, kTx1}, kTxRoot).root());
    CHECK(block_commitment.receipts_root != block_commitment.identifiers_root);

    CHECK_THROWS_AS(commit_block(42, {}, {kTx0}, kTxRoot), std::invalid_argument);
}

}  // namespace silkproof::commitment
