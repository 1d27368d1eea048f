// Copyright 2025 The Silkproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "proof.hpp"

#include <silkproof/core/common/ensure.hpp>
#include <silkproof/core/merkle/hashing.hpp>

namespace silkproof::merkle {

bool verify(ByteView leaf, const Proof& proof, const Hash& root) {
    Hash hash{leaf_digest(leaf)};
    for (const auto& sibling_hash : proof) {
        hash = combine(hash, sibling_hash);
    }
    return hash == root;
}

Bytes encode_proof(const Proof& proof) {
    Bytes encoded;
    encoded.reserve(proof.size() * kHashLength);
    for (const auto& hash : proof) {
        encoded.append(hash.bytes, kHashLength);
    }
    return encoded;
}

Proof decode_proof(ByteView encoded) {
    ensure_pre_condition(encoded.size() % kHashLength == 0, [&]() {
        return "encoded proof size " + std::to_string(encoded.size()) + " is not a multiple of " +
               std::to_string(kHashLength);
    });
    Proof proof;
    proof.reserve(encoded.size() / kHashLength);
    for (size_t offset{0}; offset < encoded.size(); offset += kHashLength) {
        proof.emplace_back(ByteView{encoded.substr(offset, kHashLength)});
    }
    return proof;
}

std::vector<std::string> proof_to_hex(const Proof& proof) {
    std::vector<std::string> out;
    out.reserve(proof.size());
    for (const auto& hash : proof) {
        out.push_back(hash.to_hex(/*with_prefix=*/true));
    }
    return out;
}

}  // namespace silkproof::merkle
