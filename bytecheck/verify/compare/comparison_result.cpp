// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#include "comparison_result.hpp"

#include <algorithm>
#include <string>

#include <bytecheck/verify/common/enum_names.hpp>

namespace bytecheck::verify {

std::string_view to_string(BytecodeInputType type) {
    return enum_label(type);
}

bool all_equal(const ComparisonResults& results) {
    return std::all_of(results.cbegin(), results.cend(), [](const auto& result) { return is_equal(result); });
}

void to_json(nlohmann::json& json, const ComparisonResult& result) {
    json["type"] = std::string{to_string(input_type(result))};
    json["equal"] = is_equal(result);
}

std::ostream& operator<<(std::ostream& out, const ComparisonResult& result) {
    out << to_string(input_type(result)) << ": " << (is_equal(result) ? "equal" : "not equal");
    return out;
}

}  // namespace bytecheck::verify
