// Copyright 2025 The Silkproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <silkproof/core/common/bytes.hpp>

namespace silkproof::commitment {

//! \brief Normalized projection of a transaction receipt, the record committed to in object mode
//! \details Every field but index and logs is rendered as text by the data source. The field order is part of the
//! committed encoding and must not change.
struct ReceiptRecord {
    std::string tx_hash;
    uint64_t index{0};
    std::vector<std::string> logs;
    std::string from;
    std::string to;
    std::string block_hash;
    std::string root;
    std::string logs_bloom;

    friend bool operator==(const ReceiptRecord&, const ReceiptRecord&) = default;
};

void to_json(nlohmann::ordered_json& json, const ReceiptRecord& record);
void from_json(const nlohmann::json& json, ReceiptRecord& record);

//! \brief Canonical leaf blob for a receipt: compact JSON object with keys in declaration order
Bytes encode_receipt(const ReceiptRecord& record);

}  // namespace silkproof::commitment
