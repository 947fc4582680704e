// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#include "address.hpp"

#include <algorithm>
#include <cstring>

#include <bytecheck/core/common/util.hpp>

namespace bytecheck {

evmc::address bytes_to_address(ByteView bytes) {
    evmc::address out;
    if (!bytes.empty()) {
        size_t n{std::min(bytes.size(), kAddressLength)};
        std::memcpy(out.bytes + kAddressLength - n, bytes.data(), n);
    }
    return out;
}

std::optional<evmc::address> hex_to_address(std::string_view hex) {
    if (!is_valid_address(hex)) {
        return std::nullopt;
    }
    const std::optional<Bytes> bytes{from_hex(hex)};
    if (!bytes) {
        return std::nullopt;
    }
    return bytes_to_address(*bytes);
}

std::string address_to_hex(const evmc::address& address) {
    return to_hex(ByteView{address.bytes}, /*with_prefix=*/true);
}

evmc::bytes32 to_bytes32(ByteView bytes) {
    evmc::bytes32 out;
    if (!bytes.empty()) {
        size_t n{std::min(bytes.size(), kHashLength)};
        std::memcpy(out.bytes + kHashLength - n, bytes.data(), n);
    }
    return out;
}

std::optional<evmc::bytes32> hex_to_bytes32(std::string_view hex) {
    if (!is_valid_hash(hex)) {
        return std::nullopt;
    }
    const std::optional<Bytes> bytes{from_hex(hex)};
    if (!bytes) {
        return std::nullopt;
    }
    return to_bytes32(*bytes);
}

std::string to_hex(const evmc::bytes32& value, bool with_prefix) {
    return to_hex(ByteView{value.bytes}, with_prefix);
}

}  // namespace bytecheck

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::address& address) {
    out << bytecheck::address_to_hex(address);
    return out;
}

std::ostream& operator<<(std::ostream& out, const evmc::bytes32& b32) {
    out << bytecheck::to_hex(b32, /*with_prefix=*/true);
    return out;
}

}  // namespace evmc
