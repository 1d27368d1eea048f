// Copyright 2025 The Silkproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstring>
#include <optional>
#include <string>

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>

#include <silkproof/core/common/assert.hpp>
#include <silkproof/core/common/base.hpp>
#include <silkproof/core/common/bytes.hpp>
#include <silkproof/core/common/util.hpp>

namespace silkproof {

//! 32-byte digest, ordered byte-lexicographically
class Hash : public evmc::bytes32 {
  public:
    using evmc::bytes32::bytes32;

    Hash() = default;
    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    Hash(const evmc::bytes32& other) : evmc::bytes32{other} {}
    explicit Hash(ByteView bv) {
        SILKPROOF_ASSERT(bv.size() == size());
        std::memcpy(bytes, bv.data(), size());
    }

    static constexpr size_t size() { return sizeof(evmc::bytes32); }

    std::string to_hex(bool with_prefix = false) const { return silkproof::to_hex(*this, with_prefix); }
    static std::optional<Hash> from_hex(const std::string& hex) { return evmc::from_hex<Hash>(hex); }

    // conversion to ByteView
    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    operator ByteView() const { return ByteView{bytes}; }

    static_assert(sizeof(evmc::bytes32) == 32);
};

//! Converts a Keccak-256 result into a Hash
inline Hash to_hash(const ethash::hash256& h) {
    return Hash{ByteView{h.bytes}};
}

}  // namespace silkproof

namespace std {

template <>
struct hash<silkproof::Hash> : public std::hash<evmc::bytes32>  // to use Hash with std::unordered_set/map
{};

}  // namespace std
