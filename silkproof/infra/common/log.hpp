// Copyright 2025 The Silkproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace silkproof::log {

//! \brief Verbosity levels, from least to most verbose
enum class Level {
    kNone,      // Unconditional line without severity tag
    kCritical,  // Unrecoverable, the process is about to exit
    kError,     // The current command failed
    kWarning,   // Unexpected outcome the user may want to look at (e.g. a proof mismatch)
    kInfo,      // Commitments published
    kDebug,     // Trees and commitments built
    kTrace      // Per-leaf and per-selection details
};

//! \brief Logging configuration, populated from the command line
struct Settings {
    bool log_std_out{false};  // std::cout instead of std::cerr
    bool log_utc{true};       // UTC timestamps instead of local time
    bool log_nocolor{false};  // no ANSI escape sequences
    bool log_threads{false};  // thread id in each line
    Level log_verbosity{Level::kNone};
    std::string log_file;  // tee destination, empty for none
};

//! \brief Installs the provided settings
//! \note Not thread safe: call once at process start
//! \throws std::runtime_error if log_file is set and cannot be opened
void init(const Settings& settings = {});

//! \brief Current settings, including the effective color setting computed by init()
const Settings& get_settings();

Level get_verbosity();

//! \note Not thread safe: meant for process start and tests
void set_verbosity(Level level);

//! \brief Checks if lines at provided level are printed under current settings
bool test_verbosity(Level level);

//! \brief Appends every printed line (colors stripped) to the file at path
//! \throws std::runtime_error if the file cannot be opened
void tee_file(const std::filesystem::path& path);

//! \brief Fixed-width tag printed for lines at provided level
std::string_view level_tag(Level level);

//! \brief Removes ANSI color escape sequences from a log line
std::string strip_colors(std::string_view line);

//! Alternating keys and values, e.g. {"leaves", "8", "root", "0x..."}
using Args = std::vector<std::string>;

//! \brief One log line, accumulated in memory and written out on destruction
class BufferBase {
  public:
    explicit BufferBase(Level level);
    BufferBase(Level level, std::string_view msg, const Args& args);
    ~BufferBase() { flush(); }

    BufferBase(const BufferBase&) = delete;
    BufferBase& operator=(const BufferBase&) = delete;

    template <class T>
    BufferBase& operator<<(const T& t) {
        if (should_print_) ss_ << t;
        return *this;
    }
    BufferBase& operator<<(const Args& args) {
        append_args(args);
        return *this;
    }

  protected:
    void append_message(std::string_view msg);
    void append_args(const Args& args);
    void flush();

    const bool should_print_;
    std::ostringstream ss_;
};

template <Level level>
class LogBuffer : public BufferBase {
  public:
    LogBuffer() : BufferBase(level) {}
    explicit LogBuffer(std::string_view msg, const Args& args = {}) : BufferBase(level, msg, args) {}
};

}  // namespace silkproof::log

#define SILKPROOF_LOGBUFFER(level_, ...)           \
    if (!silkproof::log::test_verbosity(level_)) { \
    } else                                         \
        silkproof::log::LogBuffer<level_>(__VA_ARGS__)

#define SILKPROOF_TRACE_M(...) SILKPROOF_LOGBUFFER(silkproof::log::Level::kTrace, __VA_ARGS__)
#define SILKPROOF_DEBUG_M(...) SILKPROOF_LOGBUFFER(silkproof::log::Level::kDebug, __VA_ARGS__)
#define SILKPROOF_INFO_M(...) SILKPROOF_LOGBUFFER(silkproof::log::Level::kInfo, __VA_ARGS__)
#define SILKPROOF_WARN_M(...) SILKPROOF_LOGBUFFER(silkproof::log::Level::kWarning, __VA_ARGS__)
#define SILKPROOF_ERROR_M(...) SILKPROOF_LOGBUFFER(silkproof::log::Level::kError, __VA_ARGS__)
#define SILKPROOF_CRIT_M(...) SILKPROOF_LOGBUFFER(silkproof::log::Level::kCritical, __VA_ARGS__)
#define SILKPROOF_LOG_M(...) SILKPROOF_LOGBUFFER(silkproof::log::Level::kNone, __VA_ARGS__)

#define SILKPROOF_TRACE SILKPROOF_TRACE_M()
#define SILKPROOF_DEBUG SILKPROOF_DEBUG_M()
#define SILKPROOF_INFO SILKPROOF_INFO_M()
#define SILKPROOF_WARN SILKPROOF_WARN_M()
#define SILKPROOF_ERROR SILKPROOF_ERROR_M()
#define SILKPROOF_CRIT SILKPROOF_CRIT_M()
#define SILKPROOF_LOG SILKPROOF_LOG_M()
