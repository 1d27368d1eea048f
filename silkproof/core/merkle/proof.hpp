// Copyright 2025 The Silkproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <vector>

#include <silkproof/core/common/bytes.hpp>
#include <silkproof/core/merkle/tree.hpp>
#include <silkproof/core/types/hash.hpp>

namespace silkproof::merkle {

//! \brief Checks that leaf is committed under root by replaying proof from the leaf level up
//! \return false on any mismatch, tampered proof or wrong leaf included
bool verify(ByteView leaf, const Proof& proof, const Hash& root);

//! \brief Published root of a Merkle tree, able to check inclusion proofs against itself
struct MerkleRoot {
    Hash hash;

    bool verify(ByteView leaf, const Proof& proof) const { return merkle::verify(leaf, proof, hash); }

    friend bool operator==(const MerkleRoot&, const MerkleRoot&) = default;
};

//! \brief Proof wire form: digests concatenated leaf-to-root with no delimiter
Bytes encode_proof(const Proof& proof);

//! \brief Splits a proof wire form back into digests
//! \throws std::invalid_argument if the encoded length is not a multiple of the digest size
Proof decode_proof(ByteView encoded);

//! \brief Proof as a list of 0x-prefixed hex digests
std::vector<std::string> proof_to_hex(const Proof& proof);

}  // namespace silkproof::merkle
