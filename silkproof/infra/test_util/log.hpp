// Copyright 2025 The Silkproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>

#include <silkproof/infra/common/log.hpp>

namespace silkproof::test_util {

//! Utility class using RAII to change the log verbosity level (necessary to make tests work in shuffled order)
class SetLogVerbosityGuard {
  public:
    explicit SetLogVerbosityGuard(log::Level new_level) : current_level_(log::get_verbosity()) {
        log::set_verbosity(new_level);
    }
    ~SetLogVerbosityGuard() { log::set_verbosity(current_level_); }

  private:
    log::Level current_level_;
};

//! Utility class using RAII to restore every log setting after a test re-initializes logging
class LogSettingsGuard {
  public:
    LogSettingsGuard() : saved_(log::get_settings()) {}
    ~LogSettingsGuard() { log::init(saved_); }

  private:
    log::Settings saved_;
};

//! Utility class using RAII to swap the underlying buffers of the provided streams
class StreamSwap {
  public:
    StreamSwap(std::ostream& o1, std::ostream& o2) : buffer_(o1.rdbuf()), stream_(o1) { o1.rdbuf(o2.rdbuf()); }
    ~StreamSwap() { stream_.rdbuf(buffer_); }

  private:
    std::streambuf* buffer_;
    std::ostream& stream_;
};

}  // namespace silkproof::test_util
