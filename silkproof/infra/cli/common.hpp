// Copyright 2025 The Silkproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include <silkproof/infra/common/log.hpp>

namespace silkproof::cmd::common {

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief CLI11 validator accepting hex strings, optionally 0x-prefixed
struct HexValidator : public CLI::Validator {
    explicit HexValidator(bool allow_empty = true);
};

//! \brief CLI11 validator accepting 32-byte hex digests, optionally 0x-prefixed
struct HashValidator : public CLI::Validator {
    HashValidator();
};

}  // namespace silkproof::cmd::common
