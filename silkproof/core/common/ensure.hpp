// Copyright 2025 The Silkproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <stdexcept>
#include <string>

namespace silkproof {

//! Ensure that a caller-facing pre-condition is met, otherwise raise std::invalid_argument with string literal message
template <unsigned int N>
inline void ensure_pre_condition(bool condition, const char (&message)[N]) {
    if (!condition) [[unlikely]] {
        throw std::invalid_argument("Pre-condition violation: " + std::string{message});
    }
}

//! Same as above with dynamically built message, evaluated only on failure
//! Usage: `ensure_pre_condition(index < size, [&]() { return "index " + std::to_string(index) + " out of range"; });`
inline void ensure_pre_condition(bool condition, const std::function<std::string()>& message_builder) {
    if (!condition) [[unlikely]] {
        throw std::invalid_argument("Pre-condition violation: " + message_builder());
    }
}

}  // namespace silkproof
