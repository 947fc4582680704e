// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include <evmc/bytes.hpp>

namespace bytecheck {

using Bytes = evmc::bytes;

class ByteView : public evmc::bytes_view {
  public:
    constexpr ByteView() noexcept = default;

    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    constexpr ByteView(const evmc::bytes_view& other) noexcept
        : evmc::bytes_view{other.data(), other.size()} {}

    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    ByteView(const Bytes& str) noexcept : evmc::bytes_view{str.data(), str.size()} {}

    constexpr ByteView(const uint8_t* data, size_type size) noexcept
        : evmc::bytes_view{data, size} {}

    template <size_t N>
    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    constexpr ByteView(const uint8_t (&array)[N]) noexcept : evmc::bytes_view{array, N} {}

    template <size_t N>
    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    constexpr ByteView(const std::array<uint8_t, N>& array) noexcept
        : evmc::bytes_view{array.data(), N} {}

    template <size_t Extent>
    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    constexpr ByteView(std::span<const uint8_t, Extent> span) noexcept
        : evmc::bytes_view{span.data(), span.size()} {}

    bool is_null() const noexcept { return data() == nullptr; }

  private:
    // see code style P28
    using evmc::bytes_view::length;
};

// Cast between pointers to char and unsigned char (i.e. uint8_t)
inline const char* byte_ptr_cast(const uint8_t* ptr) { return reinterpret_cast<const char*>(ptr); }
inline const uint8_t* byte_ptr_cast(const char* ptr) { return reinterpret_cast<const uint8_t*>(ptr); }

inline Bytes string_to_bytes(std::string_view s) { return {byte_ptr_cast(s.data()), s.size()}; }
inline ByteView string_view_to_byte_view(std::string_view v) { return {byte_ptr_cast(v.data()), v.size()}; }
inline std::string_view byte_view_to_string_view(ByteView v) { return {byte_ptr_cast(v.data()), v.size()}; }

}  // namespace bytecheck
