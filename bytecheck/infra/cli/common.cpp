// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#include "common.hpp"

#include <map>
#include <string>

namespace bytecheck::cmd::common {

void add_logging_options(CLI::App& cli, log::Settings& log_settings) {
    const std::map<std::string, log::Level> level_mapping{
        {"none", log::Level::kNone},
        {"critical", log::Level::kCritical},
        {"error", log::Level::kError},
        {"warning", log::Level::kWarning},
        {"info", log::Level::kInfo},
        {"debug", log::Level::kDebug},
        {"trace", log::Level::kTrace},
    };
    auto& log_opts = *cli.add_option_group("Log", "Logging options, log lines go to std::cerr unless redirected");
    log_opts.add_option("--log.verbosity", log_settings.log_verbosity, "Log verbosity, trace also dumps JSON-RPC traffic")
        ->transform(CLI::CheckedTransformer(level_mapping, CLI::ignore_case))
        ->default_val(log::Level::kInfo);
    log_opts.add_flag("--log.stdout", log_settings.log_std_out, "Log to std::cout, interleaved with the results");
    log_opts.add_flag("--log.nocolor", log_settings.log_nocolor, "Disable colors on log lines");
    log_opts.add_flag("!--log.localtime", log_settings.log_utc, "Print log timestamps in local time instead of UTC");
    log_opts.add_option("--log.file", log_settings.log_file, "Append all log lines to the given file")
        ->check(CLI::NonexistentPath | CLI::ExistingFile);
}

}  // namespace bytecheck::cmd::common
