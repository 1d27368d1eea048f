// Copyright 2025 The Silkproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <array>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <regex>
#include <stdexcept>
#include <thread>
#include <utility>

#include <absl/strings/str_cat.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

#include <silkproof/infra/common/terminal.hpp>

namespace silkproof::log {

//! Width of the message column before key/value pairs
static constexpr int kMessageWidth = 36;

struct LevelStyle {
    std::string_view tag;
    std::string_view color;
};

// Indexed by Level
static constexpr std::array<LevelStyle, 7> kLevelStyles{{
    {"     ", kColorReset},
    {" CRIT", kBackgroundRed},
    {"ERROR", kColorRed},
    {" WARN", kColorOrangeHigh},
    {" INFO", kColorGreen},
    {"DEBUG", kBackgroundPurple},
    {"TRACE", kColorCoal},
}};

static Settings settings_{};
static std::mutex out_mtx{};
static std::unique_ptr<std::ofstream> file_{nullptr};

void init(const Settings& settings) {
    settings_ = settings;
    file_.reset();
    if (!settings_.log_file.empty()) {
        tee_file(settings_.log_file);
    }
    const bool is_terminal{settings_.log_std_out ? is_terminal_stdout() : is_terminal_stderr()};
    settings_.log_nocolor = settings_.log_nocolor || !is_terminal;
}

void tee_file(const std::filesystem::path& path) {
    auto file{std::make_unique<std::ofstream>(path, std::ios::out | std::ios::app)};
    if (!file->is_open()) {
        throw std::runtime_error("Could not open log file " + path.string());
    }
    file_ = std::move(file);
}

const Settings& get_settings() { return settings_; }

Level get_verbosity() { return settings_.log_verbosity; }

void set_verbosity(Level level) { settings_.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= settings_.log_verbosity; }

static const LevelStyle& level_style(Level level) {
    return kLevelStyles.at(static_cast<size_t>(level));
}

std::string_view level_tag(Level level) { return level_style(level).tag; }

std::string strip_colors(std::string_view line) {
    static const std::regex kColorPattern("\x1b\\[[0-9;]+m");
    return std::regex_replace(std::string{line}, kColorPattern, "");
}

BufferBase::BufferBase(Level level) : should_print_(test_verbosity(level)) {
    if (!should_print_) return;

    const auto& [tag, color] = level_style(level);
    const absl::TimeZone tz{settings_.log_utc ? absl::UTCTimeZone() : absl::LocalTimeZone()};
    ss_ << kColorReset << " " << color << tag << kColorReset << " "
        << kColorWhite << "[" << absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), tz) << "] " << kColorReset;
    if (settings_.log_threads) {
        ss_ << "[" << std::this_thread::get_id() << "] ";
    }
}

BufferBase::BufferBase(Level level, std::string_view msg, const Args& args) : BufferBase(level) {
    append_message(msg);
    append_args(args);
}

void BufferBase::append_message(std::string_view msg) {
    if (!should_print_) return;
    ss_ << msg;
    if (msg.size() < kMessageWidth) {
        ss_ << std::string(kMessageWidth - msg.size(), ' ');
    }
}

void BufferBase::append_args(const Args& args) {
    if (!should_print_) return;
    for (size_t i{0}; i < args.size(); i += 2) {
        const std::string_view value{i + 1 < args.size() ? std::string_view{args[i + 1]} : std::string_view{}};
        ss_ << absl::StrCat(" ", kColorGreen, args[i], kColorReset, "=", kColorWhite, value, kColorReset);
    }
}

void BufferBase::flush() {
    if (!should_print_) return;

    const std::string line{ss_.str()};
    const std::string plain_line{settings_.log_nocolor || file_ ? strip_colors(line) : std::string{}};

    std::scoped_lock out_lck{out_mtx};
    auto& out = settings_.log_std_out ? std::cout : std::cerr;
    out << (settings_.log_nocolor ? plain_line : line) << '\n';
    if (file_) {
        *file_ << plain_line << '\n';
        file_->flush();
    }
}

}  // namespace silkproof::log
