// Copyright 2025 The Silkproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <utility>

#include <silkproof/core/common/bytes.hpp>
#include <silkproof/core/types/hash.hpp>

namespace silkproof::merkle {

//! \brief Keccak-256 of the raw leaf blob, the initial value of every leaf node
Hash leaf_digest(ByteView blob);

//! \brief Orders a pair of digests so that the byte-lexicographically smaller one comes first
std::pair<Hash, Hash> sort_pair(const Hash& a, const Hash& b);

//! \brief Canonical serialization of an ordered digest pair
//! \details The pair is rendered as compact JSON text, each digest as an array of its 32 byte values, i.e.
//! `[[b0,b1,...,b31],[c0,c1,...,c31]]` with no whitespace. This is the preimage of every internal node.
Bytes encode_pair(const Hash& first, const Hash& second);

//! \brief Parent digest of two sibling digests
//! \details The pair is sorted before hashing, hence combine(a, b) == combine(b, a). Proofs therefore carry only
//! sibling values and never which side the sibling sits on. Changing this rule changes every root.
Hash combine(const Hash& a, const Hash& b);

}  // namespace silkproof::merkle
