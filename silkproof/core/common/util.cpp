// Copyright 2025 The Silkproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "util.hpp"

namespace silkproof {

std::string to_hex(ByteView bytes, bool with_prefix) {
    static const char* kHexDigits{"0123456789abcdef"};
    std::string out(bytes.size() * 2 + (with_prefix ? 2 : 0), '\0');
    char* dest{&out[0]};
    if (with_prefix) {
        *dest++ = '0';
        *dest++ = 'x';
    }
    for (const auto& b : bytes) {
        *dest++ = kHexDigits[b >> 4];    // Hi
        *dest++ = kHexDigits[b & 0x0f];  // Lo
    }
    return out;
}

std::string abridge(std::string_view input, size_t length) {
    if (input.length() <= length) {
        return std::string(input);
    }
    return std::string(input.substr(0, length)) + "...";
}

std::optional<uint8_t> decode_hex_digit(char ch) noexcept {
    if (ch >= '0' && ch <= '9') {
        return static_cast<uint8_t>(ch - '0');
    }
    if (ch >= 'a' && ch <= 'f') {
        return static_cast<uint8_t>(ch - 'a' + 10);
    }
    if (ch >= 'A' && ch <= 'F') {
        return static_cast<uint8_t>(ch - 'A' + 10);
    }
    return std::nullopt;
}

std::optional<Bytes> from_hex(std::string_view hex) noexcept {
    if (has_hex_prefix(hex)) {
        hex.remove_prefix(2);
    }
    if (hex.empty()) {
        return Bytes{};
    }

    size_t pos(hex.length() & 1);  // "[0x]1" is legit and has to be treated as "[0x]01"
    Bytes out((hex.length() + pos) / 2, '\0');
    auto src{hex.begin()};
    uint8_t* dst{&out[0]};

    if (pos) {
        const auto lo{decode_hex_digit(*src++)};
        if (!lo) {
            return std::nullopt;
        }
        *dst++ = *lo;
    }

    while (src != hex.end()) {
        const auto hi{decode_hex_digit(*src++)};
        const auto lo{decode_hex_digit(*src++)};
        if (!hi || !lo) {
            return std::nullopt;
        }
        *dst++ = static_cast<uint8_t>(*hi << 4 | *lo);
    }
    return out;
}

}  // namespace silkproof
