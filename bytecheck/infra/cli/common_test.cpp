// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#include "common.hpp"

#include <catch2/catch_test_macros.hpp>

namespace bytecheck::cmd::common {

TEST_CASE("add_logging_options", "[bytecheck][infra][cli]") {
    CLI::App cli;
    log::Settings settings;
    add_logging_options(cli, settings);

    SECTION("defaults") {
        cli.parse("", /*program_name_included=*/false);
        CHECK(settings.log_verbosity == log::Level::kInfo);
        CHECK(settings.log_utc);
        CHECK_FALSE(settings.log_std_out);
    }

    SECTION("verbosity names are case insensitive") {
        cli.parse("--log.verbosity DEBUG --log.localtime --log.nocolor", /*program_name_included=*/false);
        CHECK(settings.log_verbosity == log::Level::kDebug);
        CHECK_FALSE(settings.log_utc);
        CHECK(settings.log_nocolor);
    }

    SECTION("unknown verbosity") {
        CHECK_THROWS_AS(cli.parse("--log.verbosity chatty", /*program_name_included=*/false), CLI::ParseError);
    }
}

}  // namespace bytecheck::cmd::common
