// Copyright 2025 The Silkproof Authors
// SPDX-License-Identifier: Apache-2.0

#include <iostream>
#include <map>
#include <stdexcept>
#include <string>

#include <CLI/CLI.hpp>
#include <magic_enum.hpp>

#include <silkproof/infra/cli/common.hpp>
#include <silkproof/infra/common/log.hpp>

#include "toolbox/commands.hpp"

using namespace silkproof;
using namespace silkproof::cmd::common;
using namespace silkproof::cmd::toolbox;

void parse_command_line(int argc, char* argv[], CLI::App& app, MerkleToolboxSettings& settings) {
    add_logging_options(app, settings.log_settings);

    std::map<MerkleTool, CLI::App*> commands;
    for (auto& [tool, name] : magic_enum::enum_entries<MerkleTool>()) {
        commands[tool] = app.add_subcommand(std::string{name});
    }
    app.require_subcommand(1);

    commands[MerkleTool::root]->description("Compute the root of a list of hex leaves");
    commands[MerkleTool::prove]->description("Compute the inclusion proof of one leaf");
    commands[MerkleTool::verify]->description("Check an inclusion proof against a root");
    commands[MerkleTool::receipts]->description("Commit to a list of receipt records and prove one of them");
    commands[MerkleTool::identifiers]->description("Commit to a list of transaction hashes and prove one of them");
    commands[MerkleTool::block]->description("Compute both roots published for one block");

    for (auto& cmd : {commands[MerkleTool::root], commands[MerkleTool::prove]}) {
        cmd->add_option("--leaves", settings.leaves_file, "JSON file holding an array of hex leaves")
            ->required()
            ->check(CLI::ExistingFile);
    }
    commands[MerkleTool::prove]->add_option("--index", settings.index, "Position of the leaf to prove")
        ->capture_default_str();

    commands[MerkleTool::verify]->add_option("--leaf", settings.leaf, "Leaf as hex string")
        ->required()
        ->check(HexValidator{});
    commands[MerkleTool::verify]->add_option("--proof", settings.proof, "Proof digests leaf-to-root (comma separated)")
        ->delimiter(',')
        ->check(HashValidator{});
    commands[MerkleTool::verify]->add_option("--root", settings.root, "Root digest")
        ->required()
        ->check(HashValidator{});

    for (auto& cmd : {commands[MerkleTool::receipts], commands[MerkleTool::block]}) {
        cmd->add_option("--receipts", settings.receipts_file, "JSON file holding an array of receipt records")
            ->required()
            ->check(CLI::ExistingFile);
    }
    commands[MerkleTool::receipts]->add_option("--tx_index", settings.tx_index, "Transaction index of the receipt to prove");

    for (auto& cmd : {commands[MerkleTool::identifiers], commands[MerkleTool::block]}) {
        cmd->add_option("--hashes", settings.hashes_file, "JSON file holding an array of transaction hashes")
            ->required()
            ->check(CLI::ExistingFile);
        cmd->add_option("--aggregate", settings.aggregate, "Transactions root appended as last identifier")
            ->required()
            ->check(HashValidator{});
    }
    commands[MerkleTool::identifiers]->add_option("--target", settings.target, "Transaction hash to prove")
        ->check(HashValidator{});
    commands[MerkleTool::block]->add_option("--number", settings.block_num, "Block number")
        ->required();

    app.parse(argc, argv);
}

int main(int argc, char* argv[]) {
    CLI::App app{"Merkle commitment toolbox"};

    try {
        MerkleToolboxSettings settings;
        parse_command_line(argc, argv, app, settings);

        // Initialize logging with custom settings
        log::init(settings.log_settings);

        auto command_name = app.get_subcommands().front()->get_name();
        auto tool = magic_enum::enum_cast<MerkleTool>(command_name).value();
        return run(tool, settings, std::cout);
    } catch (const CLI::ParseError& pe) {
        return app.exit(pe);
    } catch (const std::exception& e) {
        SILKPROOF_CRIT << "Merkle toolbox exiting due to exception: " << e.what();
        return kExitFailure;
    }
}
