// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// The most common and basic constants.

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace bytecheck {

using namespace std::string_view_literals;

inline constexpr size_t kAddressLength{20};

inline constexpr size_t kHashLength{32};

// https://en.wikipedia.org/wiki/Binary_prefix
inline constexpr uint64_t kKibi{1024};
inline constexpr uint64_t kMebi{1024 * kKibi};

}  // namespace bytecheck
