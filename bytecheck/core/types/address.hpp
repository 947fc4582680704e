// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <evmc/evmc.hpp>

#include <bytecheck/core/common/bytes.hpp>

namespace bytecheck {

// Converts bytes to evmc::address; input is cropped if necessary.
// Short inputs are left-padded with 0s.
evmc::address bytes_to_address(ByteView bytes);

// Parses a 0x-prefixed 40 hex digits address, case-insensitive. No checksum validation.
std::optional<evmc::address> hex_to_address(std::string_view hex);

std::string address_to_hex(const evmc::address& address);

// Converts bytes to evmc::bytes32; input is cropped if necessary.
// Short inputs are left-padded with 0s.
evmc::bytes32 to_bytes32(ByteView bytes);

// Parses a 0x-prefixed 64 hex digits hash.
std::optional<evmc::bytes32> hex_to_bytes32(std::string_view hex);

std::string to_hex(const evmc::bytes32& value, bool with_prefix = false);

}  // namespace bytecheck

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::address& address);
std::ostream& operator<<(std::ostream& out, const evmc::bytes32& b32);

}  // namespace evmc
