// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <bytecheck/infra/common/terminal.hpp>

namespace bytecheck::log {

enum class Level {
    kNone,  // no severity tag
    kCritical,
    kError,
    kWarning,
    kInfo,
    kDebug,
    kTrace,
};

struct Settings {
    bool log_std_out{false};  // std::cerr otherwise, leaving std::cout to verification results
    bool log_utc{true};
    bool log_nocolor{false};
    Level log_verbosity{Level::kInfo};
    std::string log_file;  // tee destination, written without colours
};

//! \brief Applies the settings, opening the tee file if any
//! \note Not thread safe, call once at start of process
void init(const Settings& settings = {});

Level get_verbosity();

//! \note Not thread safe, meant for process start and tests
void set_verbosity(Level level);

//! \brief Checks if a line at the given level would be printed, letting callers skip expensive formatting
bool test_verbosity(Level level);

//! \throws std::runtime_error if the file cannot be opened for appending
void tee_file(const std::filesystem::path& path);

using Args = std::vector<std::string>;

class BufferBase {
  public:
    explicit BufferBase(Level level);
    explicit BufferBase(Level level, std::string_view msg, const Args& args);
    ~BufferBase() { flush(); }

    template <class T>
    void append(const T& t) {
        if (should_print_) ss_ << t;
    }
    template <class T>
    BufferBase& operator<<(const T& t) {
        append(t);
        return *this;
    }
    void append(const Args& args) {
        append("", args);
    }
    BufferBase& operator<<(const Args& args) {
        append(args);
        return *this;
    }

  protected:
    void append(std::string_view msg, const Args& args) {
        if (!should_print_) return;
        ss_ << std::left << std::setw(41) << std::setfill(' ') << msg;
        bool left{true};
        for (const auto& arg : args) {
            ss_ << (left ? kColorGreen : kColorWhite) << arg << kColorReset << (left ? "=" : " ") << kColorReset;
            left = !left;
        }
    }
    void flush();
    const bool should_print_;
    std::stringstream ss_;
};

template <Level level>
class LogBuffer : public BufferBase {
  public:
    explicit LogBuffer() : BufferBase(level) {}
    explicit LogBuffer(std::string_view msg, const Args& args = {}) : BufferBase(level, msg, args) {}
};

}  // namespace bytecheck::log

#define BYTECHECK_LOGBUFFER(level_, ...)           \
    if (!bytecheck::log::test_verbosity(level_)) { \
    } else                                         \
        bytecheck::log::LogBuffer<level_>(__VA_ARGS__)

#define BYTECHECK_TRACE_M(...) BYTECHECK_LOGBUFFER(bytecheck::log::Level::kTrace, __VA_ARGS__)
#define BYTECHECK_DEBUG_M(...) BYTECHECK_LOGBUFFER(bytecheck::log::Level::kDebug, __VA_ARGS__)
#define BYTECHECK_INFO_M(...) BYTECHECK_LOGBUFFER(bytecheck::log::Level::kInfo, __VA_ARGS__)
#define BYTECHECK_WARN_M(...) BYTECHECK_LOGBUFFER(bytecheck::log::Level::kWarning, __VA_ARGS__)
#define BYTECHECK_ERROR_M(...) BYTECHECK_LOGBUFFER(bytecheck::log::Level::kError, __VA_ARGS__)
#define BYTECHECK_CRIT_M(...) BYTECHECK_LOGBUFFER(bytecheck::log::Level::kCritical, __VA_ARGS__)

#define BYTECHECK_TRACE BYTECHECK_TRACE_M()
#define BYTECHECK_DEBUG BYTECHECK_DEBUG_M()
#define BYTECHECK_INFO BYTECHECK_INFO_M()
#define BYTECHECK_WARN BYTECHECK_WARN_M()
#define BYTECHECK_ERROR BYTECHECK_ERROR_M()
#define BYTECHECK_CRIT BYTECHECK_CRIT_M()
