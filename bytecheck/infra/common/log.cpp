// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <regex>
#include <stdexcept>
#include <utility>

#include <absl/time/clock.h>
#include <absl/time/time.h>

namespace bytecheck::log {

static Settings settings_{};
static std::mutex out_mtx{};
static std::unique_ptr<std::fstream> file_{nullptr};
static bool is_terminal{false};

void init(const Settings& settings) {
    settings_ = settings;
    if (settings_.log_file.empty()) {
        file_.reset();
    } else {
        tee_file(std::filesystem::path{settings_.log_file});
    }
    is_terminal = settings_.log_std_out ? is_terminal_stdout() : is_terminal_stderr();
    settings_.log_nocolor = settings_.log_nocolor || !is_terminal;
}

void tee_file(const std::filesystem::path& path) {
    file_ = std::make_unique<std::fstream>(path.string(), std::ios::out | std::ios::app);
    if (!file_->is_open()) {
        file_.reset();
        throw std::runtime_error("Could not open file " + path.string());
    }
}

Level get_verbosity() { return settings_.log_verbosity; }

void set_verbosity(Level level) { settings_.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= settings_.log_verbosity; }

static std::pair<std::string_view, std::string_view> get_level_settings(Level level) {
    switch (level) {
        case Level::kTrace:
            return {"TRACE", kColorCoal};
        case Level::kDebug:
            return {"DEBUG", kBackgroundPurple};
        case Level::kInfo:
            return {" INFO", kColorGreen};
        case Level::kWarning:
            return {" WARN", kColorOrangeHigh};
        case Level::kError:
            return {"ERROR", kColorRed};
        case Level::kCritical:
            return {" CRIT", kBackgroundRed};
        default:
            return {"     ", kColorReset};
    }
}

BufferBase::BufferBase(Level level) : should_print_(level <= settings_.log_verbosity) {
    if (!should_print_) return;

    const auto [log_tag, color] = get_level_settings(level);
    static const absl::TimeZone kTz{settings_.log_utc ? absl::UTCTimeZone() : absl::LocalTimeZone()};
    ss_ << kColorReset << " " << color << log_tag << kColorReset << " " << kColorWhite << "["
        << absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), kTz) << " " << kTz.name() << "] " << kColorReset;
}

BufferBase::BufferBase(Level level, std::string_view msg, const Args& args) : BufferBase(level) {
    append(msg, args);
}

static std::string strip_colors(const std::string& line) {
    static const std::regex kColorPattern{"(\\\x1b\\[[0-9;]{1,}m)"};
    return std::regex_replace(line, kColorPattern, "");
}

void BufferBase::flush() {
    if (!should_print_) return;

    const std::string line{ss_.str()};
    const std::string plain{strip_colors(line)};
    std::scoped_lock out_lck{out_mtx};
    auto& out = settings_.log_std_out ? std::cout : std::cerr;
    out << (settings_.log_nocolor ? plain : line) << '\n';
    if (file_) {
        *file_ << plain << std::endl;
    }
}

}  // namespace bytecheck::log
