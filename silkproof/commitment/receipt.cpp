// Copyright 2025 The Silkproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "receipt.hpp"

#include <silkproof/infra/common/log.hpp>

namespace silkproof::commitment {

void to_json(nlohmann::ordered_json& json, const ReceiptRecord& record) {
    json["tx_hash"] = record.tx_hash;
    json["index"] = record.index;
    json["logs"] = record.logs;
    json["from"] = record.from;
    json["to"] = record.to;
    json["block_hash"] = record.block_hash;
    json["root"] = record.root;
    json["logs_bloom"] = record.logs_bloom;
}

void from_json(const nlohmann::json& json, ReceiptRecord& record) {
    SILKPROOF_TRACE << "from_json<ReceiptRecord> json: " << json.dump();
    record.tx_hash = json.at("tx_hash").get<std::string>();
    record.index = json.at("index").get<uint64_t>();
    record.logs = json.value("logs", std::vector<std::string>{});
    record.from = json.at("from").get<std::string>();
    record.to = json.at("to").get<std::string>();
    record.block_hash = json.at("block_hash").get<std::string>();
    record.root = json.at("root").get<std::string>();
    record.logs_bloom = json.at("logs_bloom").get<std::string>();
}

Bytes encode_receipt(const ReceiptRecord& record) {
    const nlohmann::ordered_json json = record;
    const std::string text{json.dump()};
    return Bytes{text.begin(), text.end()};
}

}  // namespace silkproof::commitment
