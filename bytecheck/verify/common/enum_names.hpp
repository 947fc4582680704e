// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cctype>
#include <optional>
#include <string>
#include <string_view>

#include <magic_enum.hpp>

namespace bytecheck::verify {

//! Enumerator name without the leading 'k', e.g. kRuntimeBytecodeFull -> RuntimeBytecodeFull
template <typename E>
std::string_view enum_label(E value) {
    std::string_view name{magic_enum::enum_name(value)};
    if (name.size() > 1 && name.front() == 'k') {
        name.remove_prefix(1);
    }
    return name;
}

//! Lower camel case name used in JSON documents and on the command line, e.g. kOpMainnet -> opMainnet
template <typename E>
std::string enum_json_name(E value) {
    std::string name{enum_label(value)};
    if (!name.empty()) {
        name.front() = static_cast<char>(std::tolower(static_cast<unsigned char>(name.front())));
    }
    return name;
}

//! Inverse of enum_json_name, matching is case-sensitive
template <typename E>
std::optional<E> enum_from_json_name(std::string_view name) {
    if (name.empty() || std::isupper(static_cast<unsigned char>(name.front()))) {
        return std::nullopt;
    }
    std::string enumerator{"k"};
    enumerator.append(name);
    enumerator[1] = static_cast<char>(std::toupper(static_cast<unsigned char>(enumerator[1])));
    return magic_enum::enum_cast<E>(enumerator);
}

}  // namespace bytecheck::verify
