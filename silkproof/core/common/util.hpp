// Copyright 2025 The Silkproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iomanip>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <ethash/keccak.hpp>

#include <silkproof/core/common/base.hpp>
#include <silkproof/core/common/bytes.hpp>

namespace silkproof {

inline bool has_hex_prefix(std::string_view s) {
    return s.length() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
}

//! \brief Returns a string representing the hex form of provided string of bytes
std::string to_hex(ByteView bytes, bool with_prefix = false);

//! \brief Abridges a string to given length and eventually adds an ellipsis if input length is gt required length
std::string abridge(std::string_view input, size_t length);

std::optional<uint8_t> decode_hex_digit(char ch) noexcept;

//! \brief Parses a hex string, optionally 0x-prefixed, into bytes
//! \remarks An odd number of digits is accepted and the leading digit is treated as the low nibble of the first byte
std::optional<Bytes> from_hex(std::string_view hex) noexcept;

inline ethash::hash256 keccak256(ByteView view) { return ethash::keccak256(view.data(), view.size()); }

inline std::ostream& operator<<(std::ostream& out, ByteView bytes) {
    for (const auto& b : bytes) {
        out << std::hex << std::setw(2) << std::setfill('0') << int{b};
    }
    out << std::dec;
    return out;
}

}  // namespace silkproof
