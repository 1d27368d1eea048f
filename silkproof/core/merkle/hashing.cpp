// Copyright 2025 The Silkproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "hashing.hpp"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <silkproof/core/common/util.hpp>

namespace silkproof::merkle {

static nlohmann::json to_json_byte_array(const Hash& hash) {
    return std::vector<uint8_t>(hash.bytes, hash.bytes + kHashLength);
}

Hash leaf_digest(ByteView blob) {
    return to_hash(keccak256(blob));
}

std::pair<Hash, Hash> sort_pair(const Hash& a, const Hash& b) {
    if (a < b) {
        return {a, b};
    }
    return {b, a};
}

Bytes encode_pair(const Hash& first, const Hash& second) {
    const nlohmann::json pair = nlohmann::json::array({to_json_byte_array(first), to_json_byte_array(second)});
    const std::string text{pair.dump()};
    return Bytes{text.begin(), text.end()};
}

Hash combine(const Hash& a, const Hash& b) {
    const auto [first, second] = sort_pair(a, b);
    return to_hash(keccak256(encode_pair(first, second)));
}

}  // namespace silkproof::merkle
