// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#include "optimizer_runs.hpp"

#include <charconv>
#include <limits>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

namespace bytecheck::verify {

VerificationResult<uint32_t> parse_optimizer_runs(const nlohmann::json& value) {
    if (!value.is_number_integer()) {
        return tl::unexpected{VerificationError::kInvalidOptimizerRuns};
    }
    if (value.is_number_unsigned()) {
        const auto runs{value.get<uint64_t>()};
        if (runs == 0 || runs > std::numeric_limits<uint32_t>::max()) {
            return tl::unexpected{VerificationError::kInvalidOptimizerRuns};
        }
        return static_cast<uint32_t>(runs);
    }
    const auto runs{value.get<int64_t>()};
    if (runs <= 0 || runs > int64_t{std::numeric_limits<uint32_t>::max()}) {
        return tl::unexpected{VerificationError::kInvalidOptimizerRuns};
    }
    return static_cast<uint32_t>(runs);
}

VerificationResult<uint32_t> parse_optimizer_runs(std::string_view value) {
    if (value.empty()) {
        return tl::unexpected{VerificationError::kInvalidOptimizerRuns};
    }
    for (const char c : value) {
        if (!absl::ascii_isdigit(static_cast<unsigned char>(c))) {
            return tl::unexpected{VerificationError::kInvalidOptimizerRuns};
        }
    }
    uint32_t runs{0};
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), runs);
    if (ec != std::errc{} || ptr != value.data() + value.size() || runs == 0) {
        return tl::unexpected{VerificationError::kInvalidOptimizerRuns};
    }
    return runs;
}

std::string build_command(std::string_view build_tool, uint32_t optimizer_runs) {
    return absl::StrCat(build_tool, " build --optimizer-runs ", optimizer_runs);
}

}  // namespace bytecheck::verify
