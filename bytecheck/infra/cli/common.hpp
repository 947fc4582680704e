// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <CLI/CLI.hpp>

#include <bytecheck/infra/common/log.hpp>

namespace bytecheck::cmd::common {

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

}  // namespace bytecheck::cmd::common
