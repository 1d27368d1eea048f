// Copyright 2025 The Silkproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string_view>

#include <silkproof/core/common/bytes.hpp>
#include <silkproof/core/types/hash.hpp>

namespace silkproof::crypto {

//! \brief SHA-256 digest of the input bytes
//! \throws std::runtime_error if the underlying digest context cannot be driven
Hash sha256(ByteView input);

//! \brief SHA-256 digest of the characters of a string
Hash sha256(std::string_view input);

}  // namespace silkproof::crypto
