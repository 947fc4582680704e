// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include <bytecheck/verify/common/errors.hpp>

namespace bytecheck::verify {

//! Accepts only positive JSON integers fitting in 32 bits: strings, floats (even 1.0), booleans, zero and
//! negatives fail with kInvalidOptimizerRuns
VerificationResult<uint32_t> parse_optimizer_runs(const nlohmann::json& value);

//! Accepts only non-empty sequences of decimal digits denoting a positive 32-bit value
VerificationResult<uint32_t> parse_optimizer_runs(std::string_view value);

//! Command line rebuilding the project with the given optimizer runs, e.g. "forge build --optimizer-runs 1000"
std::string build_command(std::string_view build_tool, uint32_t optimizer_runs);

}  // namespace bytecheck::verify
