// Copyright 2025 The Silkproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <silkproof/core/common/base.hpp>
#include <silkproof/infra/common/log.hpp>

namespace silkproof::cmd::toolbox {

enum class MerkleTool {  // NOLINT(performance-enum-size)
    root,
    prove,
    verify,
    receipts,
    identifiers,
    block
};

//! The overall settings for the Merkle toolbox
struct MerkleToolboxSettings {
    log::Settings log_settings;
    std::filesystem::path leaves_file;
    std::filesystem::path receipts_file;
    std::filesystem::path hashes_file;
    size_t index{0};
    std::optional<uint64_t> tx_index;
    std::string leaf;
    std::vector<std::string> proof;
    std::string root;
    std::string aggregate;
    std::optional<std::string> target;
    BlockNum block_num{0};
};

//! Exit codes returned by run()
inline constexpr int kExitSuccess{0};
inline constexpr int kExitProofMismatch{1};
inline constexpr int kExitInvalidInput{-1};
inline constexpr int kExitFailure{-2};

//! \brief Runs one toolbox command writing its JSON result to out
//! \return kExitSuccess, kExitProofMismatch when verify fails, kExitInvalidInput on malformed input or violated
//! pre-conditions, kExitFailure on any other error
int run(MerkleTool tool, const MerkleToolboxSettings& settings, std::ostream& out);

}  // namespace silkproof::cmd::toolbox
