// Copyright 2025 The Silkproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "commands.hpp"

#include <fstream>
#include <stdexcept>
#include <utility>

#include <magic_enum.hpp>
#include <nlohmann/json.hpp>

#include <silkproof/commitment/commitment.hpp>
#include <silkproof/commitment/receipt.hpp>
#include <silkproof/core/common/util.hpp>
#include <silkproof/core/merkle/proof.hpp>
#include <silkproof/core/merkle/tree.hpp>

namespace silkproof::cmd::toolbox {

static nlohmann::json read_json_file(const std::filesystem::path& path) {
    std::ifstream stream{path};
    if (!stream) {
        throw std::runtime_error("cannot open " + path.string());
    }
    return nlohmann::json::parse(stream);
}

static Bytes parse_hex(const std::string& hex) {
    auto bytes{from_hex(hex)};
    if (!bytes) {
        throw std::invalid_argument("invalid hex string: " + abridge(hex, 20));
    }
    return std::move(*bytes);
}

static Hash parse_hash(const std::string& hex) {
    const std::string_view digits{has_hex_prefix(hex) ? std::string_view{hex}.substr(2) : std::string_view{hex}};
    if (digits.size() != 2 * kHashLength) {
        throw std::invalid_argument("invalid digest: " + abridge(hex, 20));
    }
    return Hash{ByteView{parse_hex(hex)}};
}

static std::vector<Bytes> read_leaves(const std::filesystem::path& path) {
    std::vector<Bytes> leaves;
    for (const auto& item : read_json_file(path)) {
        leaves.push_back(parse_hex(item.get<std::string>()));
    }
    SILKPROOF_DEBUG << "Read " << leaves.size() << " leaves from " << path.string();
    return leaves;
}

static std::vector<Hash> read_hashes(const std::filesystem::path& path) {
    std::vector<Hash> hashes;
    for (const auto& item : read_json_file(path)) {
        hashes.push_back(parse_hash(item.get<std::string>()));
    }
    SILKPROOF_DEBUG << "Read " << hashes.size() << " hashes from " << path.string();
    return hashes;
}

static std::vector<commitment::ReceiptRecord> read_receipts(const std::filesystem::path& path) {
    return read_json_file(path).get<std::vector<commitment::ReceiptRecord>>();
}

static nlohmann::json to_json(const commitment::Selection& selection) {
    return {
        {"root", selection.root.hash.to_hex(/*with_prefix=*/true)},
        {"leaf", to_hex(selection.leaf, /*with_prefix=*/true)},
        {"proof", merkle::proof_to_hex(selection.proof)},
    };
}

static int root(const MerkleToolboxSettings& settings, std::ostream& out) {
    const auto tree{merkle::MerkleTree::build(read_leaves(settings.leaves_file))};
    const nlohmann::json result{
        {"root", tree.root().to_hex(/*with_prefix=*/true)},
        {"leaves", tree.leaf_count()},
        {"depth", tree.depth()},
    };
    out << result.dump(2) << "\n";
    return kExitSuccess;
}

static int prove(const MerkleToolboxSettings& settings, std::ostream& out) {
    const auto leaves{read_leaves(settings.leaves_file)};
    const auto tree{merkle::MerkleTree::build(leaves)};
    const auto& proof{tree.proof(settings.index)};
    const nlohmann::json result{
        {"root", tree.root().to_hex(/*with_prefix=*/true)},
        {"index", settings.index},
        {"leaf", to_hex(leaves[settings.index], /*with_prefix=*/true)},
        {"proof", merkle::proof_to_hex(proof)},
        {"encoded_proof", to_hex(merkle::encode_proof(proof), /*with_prefix=*/true)},
    };
    out << result.dump(2) << "\n";
    return kExitSuccess;
}

static int verify(const MerkleToolboxSettings& settings, std::ostream& out) {
    merkle::Proof proof;
    for (const auto& hex : settings.proof) {
        proof.push_back(parse_hash(hex));
    }
    const bool valid{merkle::verify(parse_hex(settings.leaf), proof, parse_hash(settings.root))};
    out << (valid ? "true" : "false") << "\n";
    if (!valid) {
        SILKPROOF_WARN << "Proof does not match root " << settings.root;
        return kExitProofMismatch;
    }
    return kExitSuccess;
}

static int receipts(const MerkleToolboxSettings& settings, std::ostream& out) {
    const commitment::ReceiptCommitment receipt_commitment{read_receipts(settings.receipts_file)};
    out << to_json(receipt_commitment.select(settings.tx_index)).dump(2) << "\n";
    return kExitSuccess;
}

static int identifiers(const MerkleToolboxSettings& settings, std::ostream& out) {
    const commitment::IdentifierCommitment identifier_commitment{read_hashes(settings.hashes_file),
                                                                 parse_hash(settings.aggregate)};
    std::optional<Hash> target;
    if (settings.target) {
        target = parse_hash(*settings.target);
    }
    out << to_json(identifier_commitment.select(target)).dump(2) << "\n";
    return kExitSuccess;
}

static int block(const MerkleToolboxSettings& settings, std::ostream& out) {
    const auto block_commitment{commitment::commit_block(settings.block_num,
                                                         read_receipts(settings.receipts_file),
                                                         read_hashes(settings.hashes_file),
                                                         parse_hash(settings.aggregate))};
    const nlohmann::json result{
        {"number", block_commitment.block_num},
        {"root", block_commitment.receipts_root.hash.to_hex(/*with_prefix=*/true)},
        {"tx_root", block_commitment.identifiers_root.hash.to_hex(/*with_prefix=*/true)},
    };
    out << result.dump(2) << "\n";
    return kExitSuccess;
}

int run(MerkleTool tool, const MerkleToolboxSettings& settings, std::ostream& out) {
    SILKPROOF_DEBUG << "Merkle toolbox running " << magic_enum::enum_name(tool);
    try {
        switch (tool) {
            case MerkleTool::root:
                return root(settings, out);
            case MerkleTool::prove:
                return prove(settings, out);
            case MerkleTool::verify:
                return verify(settings, out);
            case MerkleTool::receipts:
                return receipts(settings, out);
            case MerkleTool::identifiers:
                return identifiers(settings, out);
            case MerkleTool::block:
                return block(settings, out);
        }
        throw std::invalid_argument("unknown command " + std::to_string(static_cast<int>(tool)));
    } catch (const std::invalid_argument& ia) {
        SILKPROOF_ERROR << "Invalid input: " << ia.what();
        return kExitInvalidInput;
    } catch (const std::exception& e) {
        SILKPROOF_CRIT << "Merkle toolbox command " << magic_enum::enum_name(tool) << " failed: " << e.what();
        return kExitFailure;
    }
}

}  // namespace silkproof::cmd::toolbox
