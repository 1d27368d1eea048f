// Copyright 2025 The Silkproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "proof.hpp"

#include <algorithm>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_exception.hpp>

#include <silkproof/core/common/util.hpp>
#include <silkproof/core/merkle/hashing.hpp>

namespace silkproof::merkle {

using Catch::Matchers::Message;

static std::vector<Bytes> sample_leaves() {
    return {*from_hex("0xaa"), *from_hex("0xbbbb"), *from_hex("0xcccccc"), *from_hex("0xdd"), *from_hex("0xee")};
}

TEST_CASE("verify") {
    const auto leaves{sample_leaves()};
    const auto tree{MerkleTree::build(leaves)};

    SECTION("accepts every committed leaf") {
        for (size_t i{0}; i < leaves.size(); ++i) {
            CHECK(verify(leaves[i], tree.proof(i), tree.root()));
        }
    }

    SECTION("rejects a leaf not in the tree") {
        CHECK_FALSE(verify(*from_hex("0xab"), tree.proof(0), tree.root()));
        CHECK_FALSE(verify(ByteView{}, tree.proof(4), tree.root()));
    }

    SECTION("rejects a tampered proof") {
        for (size_t level{0}; level < tree.depth(); ++level) {
            Proof tampered{tree.proof(2)};
            tampered[level].bytes[0] ^= 0x01;
            CHECK_FALSE(verify(leaves[2], tampered, tree.root()));
        }
    }

    SECTION("rejects truncated and extended proofs") {
        Proof truncated{tree.proof(1)};
        truncated.pop_back();
        CHECK_FALSE(verify(leaves[1], truncated, tree.root()));

        Proof extended{tree.proof(1)};
        extended.push_back(tree.root());
        CHECK_FALSE(verify(leaves[1], extended, tree.root()));
    }

    SECTION("rejects a tampered root") {
        Hash root{tree.root()};
        root.bytes[31] ^= 0xff;
        CHECK_FALSE(verify(leaves[0], tree.proof(0), root));
    }

    SECTION("sibling order within the proof matters") {
        Proof reversed{tree.proof(3)};
        std::reverse(reversed.begin(), reversed.end());
        CHECK_FALSE(verify(leaves[3], reversed, tree.root()));
    }
}

TEST_CASE("MerkleRoot") {
    const auto leaves{sample_leaves()};
    const auto tree{MerkleTree::build(leaves)};
    const MerkleRoot root{tree.root()};

    CHECK(root.verify(leaves[4], tree.proof(4)));
    CHECK_FALSE(root.verify(leaves[4], tree.proof(0)));
    CHECK(root == MerkleRoot{MerkleTree::build(sample_leaves()).root()});
}

TEST_CASE("Proof wire form") {
    const auto tree{MerkleTree::build(sample_leaves())};
    const Proof& proof{tree.proof(2)};

    const Bytes encoded{encode_proof(proof)};
    CHECK(encoded.size() == proof.size() * kHashLength);
    CHECK(ByteView{encoded}.substr(0, kHashLength) == ByteView{proof[0]});
    CHECK(decode_proof(encoded) == proof);

    CHECK(encode_proof({}).empty());
    CHECK(decode_proof(ByteView{}).empty());

    const Bytes malformed(kHashLength + 1, 0x00);
    CHECK_THROWS_MATCHES(decode_proof(malformed), std::invalid_argument,
                         Message("Pre-condition violation: encoded proof size 33 is not a multiple of 32"));
}

TEST_CASE("proof_to_hex") {
    const auto tree{MerkleTree::build(sample_leaves())};
    const auto hexed{proof_to_hex(tree.proof(0))};
    REQUIRE(hexed.size() == tree.depth());
    CHECK(hexed[0] == "0x" + leaf_digest(*from_hex("0xbbbb")).to_hex());
    CHECK(proof_to_hex({}).empty());
}

}  // namespace silkproof::merkle
