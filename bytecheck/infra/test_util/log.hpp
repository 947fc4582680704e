// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

#include <bytecheck/infra/common/log.hpp>

namespace bytecheck::test_util {

//! Sets the log verbosity for the scope and restores the previous one, so tests do not depend on their order
class SetLogVerbosityGuard {
  public:
    explicit SetLogVerbosityGuard(log::Level level) : previous_level_{log::get_verbosity()} {
        log::set_verbosity(level);
    }
    ~SetLogVerbosityGuard() { log::set_verbosity(previous_level_); }

    SetLogVerbosityGuard(const SetLogVerbosityGuard&) = delete;
    SetLogVerbosityGuard& operator=(const SetLogVerbosityGuard&) = delete;

  private:
    log::Level previous_level_;
};

//! Collects the log lines written to a standard stream (std::cerr unless log_std_out is set) while in scope
class LogCapture {
  public:
    explicit LogCapture(log::Level level = log::Level::kTrace, std::ostream& stream = std::cerr)
        : verbosity_guard_{level}, stream_{stream}, previous_buffer_{stream.rdbuf(captured_.rdbuf())} {}
    ~LogCapture() { stream_.rdbuf(previous_buffer_); }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    std::string output() const { return captured_.str(); }
    bool contains(std::string_view text) const { return output().find(text) != std::string::npos; }

  private:
    SetLogVerbosityGuard verbosity_guard_;
    std::stringstream captured_;
    std::ostream& stream_;
    std::streambuf* previous_buffer_;
};

}  // namespace bytecheck::test_util
