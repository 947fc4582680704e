// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace bytecheck::verify {

enum class BytecodeInputType {
    kConstructorCode,
    kRuntimeBytecodePartial,
    kRuntimeBytecodeFull,
    kMetadataHash,
};

std::string_view to_string(BytecodeInputType type);

struct ConstructorCodeCheck {
    static constexpr BytecodeInputType kType{BytecodeInputType::kConstructorCode};
    bool equal{false};

    bool operator==(const ConstructorCodeCheck&) const = default;
};

struct RuntimeBytecodePartialCheck {
    static constexpr BytecodeInputType kType{BytecodeInputType::kRuntimeBytecodePartial};
    bool equal{false};

    bool operator==(const RuntimeBytecodePartialCheck&) const = default;
};

struct RuntimeBytecodeFullCheck {
    static constexpr BytecodeInputType kType{BytecodeInputType::kRuntimeBytecodeFull};
    bool equal{false};

    bool operator==(const RuntimeBytecodeFullCheck&) const = default;
};

struct MetadataHashCheck {
    static constexpr BytecodeInputType kType{BytecodeInputType::kMetadataHash};
    bool equal{false};

    bool operator==(const MetadataHashCheck&) const = default;
};

using ComparisonResult = std::variant<ConstructorCodeCheck, RuntimeBytecodePartialCheck, RuntimeBytecodeFullCheck,
                                      MetadataHashCheck>;

//! Results in check order: constructor code, runtime bytecode, metadata hash
using ComparisonResults = std::vector<ComparisonResult>;

inline BytecodeInputType input_type(const ComparisonResult& result) {
    return std::visit([](const auto& check) { return check.kType; }, result);
}

inline bool is_equal(const ComparisonResult& result) {
    return std::visit([](const auto& check) { return check.equal; }, result);
}

bool all_equal(const ComparisonResults& results);

//! {"type": "RuntimeBytecodePartial", "equal": true}
void to_json(nlohmann::json& json, const ComparisonResult& result);

std::ostream& operator<<(std::ostream& out, const ComparisonResult& result);

}  // namespace bytecheck::verify
