// Copyright 2025 The Silkproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// The most common and basic macros, types, and constants.

#include <cstddef>
#include <cstdint>
#include <string_view>

#include <silkproof/core/common/assert.hpp>

namespace silkproof {

using namespace std::string_view_literals;

using BlockNum = uint64_t;

inline constexpr size_t kHashLength{32};

}  // namespace silkproof
