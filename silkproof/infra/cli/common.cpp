// Copyright 2025 The Silkproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "common.hpp"

#include <map>

#include <silkproof/core/common/util.hpp>
#include <silkproof/core/types/hash.hpp>

namespace silkproof::cmd::common {

void add_logging_options(CLI::App& cli, log::Settings& log_settings) {
    std::map<std::string, log::Level> level_mapping{
        {"critical", log::Level::kCritical},
        {"error", log::Level::kError},
        {"warning", log::Level::kWarning},
        {"info", log::Level::kInfo},
        {"debug", log::Level::kDebug},
        {"trace", log::Level::kTrace},
    };
    auto& log_opts = *cli.add_option_group("Log", "Logging options");
    log_opts.add_option("--log.verbosity", log_settings.log_verbosity, "Sets log verbosity")
        ->check(CLI::Range(log::Level::kCritical, log::Level::kTrace))
        ->transform(CLI::Transformer(level_mapping, CLI::ignore_case))
        ->default_val(log::Level::kWarning);
    log_opts.add_flag("--log.stdout", log_settings.log_std_out, "Outputs to std::out instead of std::err");
    log_opts.add_flag("--log.nocolor", log_settings.log_nocolor, "Disable colors on log lines");
    log_opts.add_flag("--log.utc", log_settings.log_utc, "Prints log timings in UTC");
    log_opts.add_flag("--log.threads", log_settings.log_threads, "Prints thread ids");
    log_opts.add_option("--log.file", log_settings.log_file, "Tee all log lines to given file name");
}

HexValidator::HexValidator(bool allow_empty) {
    func_ = [allow_empty](const std::string& value) -> std::string {
        const auto bytes{from_hex(value)};
        if (!bytes) {
            return "Value " + value + " is not a valid hex string";
        }
        if (!allow_empty && bytes->empty()) {
            return "Value must not be empty";
        }
        return {};
    };
}

HashValidator::HashValidator() {
    func_ = [](const std::string& value) -> std::string {
        const std::string_view digits{has_hex_prefix(value) ? std::string_view{value}.substr(2) : std::string_view{value}};
        if (digits.size() != 2 * Hash::size() || !from_hex(digits)) {
            return "Value " + value + " is not a valid 32-byte hex digest";
        }
        return {};
    };
}

}  // namespace silkproof::cmd::common
