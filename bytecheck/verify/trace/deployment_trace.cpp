// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#include "deployment_trace.hpp"

#include <stack>
#include <utility>

#include <bytecheck/core/common/util.hpp>
#include <bytecheck/core/types/address.hpp>
#include <bytecheck/infra/common/log.hpp>

namespace bytecheck::verify {

CallType call_type_from_string(std::string_view type) {
    static constexpr std::pair<std::string_view, CallType> kCallTypes[]{
        {"CALL", CallType::kCall},
        {"STATICCALL", CallType::kStaticCall},
        {"DELEGATECALL", CallType::kDelegateCall},
        {"CALLCODE", CallType::kCallCode},
        {"CREATE", CallType::kCreate},
        {"CREATE2", CallType::kCreate2},
        {"SELFDESTRUCT", CallType::kSelfDestruct},
    };
    for (const auto& [name, call_type] : kCallTypes) {
        if (iequals(name, type)) {
            return call_type;
        }
    }
    return CallType::kOther;
}

static std::optional<CallFrame> parse_frame(const nlohmann::json& json) {
    if (!json.is_object() || !json.contains("type") || !json["type"].is_string()) {
        return std::nullopt;
    }
    CallFrame frame;
    frame.type_name = json["type"].get<std::string>();
    frame.type = call_type_from_string(frame.type_name);

    for (const auto& [key, field] : {std::pair{"from", &frame.from}, std::pair{"to", &frame.to}}) {
        if (!json.contains(key) || json[key].is_null()) continue;
        if (!json[key].is_string()) return std::nullopt;
        const auto address{hex_to_address(json[key].get<std::string>())};
        if (!address) return std::nullopt;
        *field = *address;
    }
    if (json.contains("input")) {
        if (!json["input"].is_string()) return std::nullopt;
        auto input{from_hex(json["input"].get<std::string>())};
        if (!input) return std::nullopt;
        frame.input = std::move(*input);
    }
    if (json.contains("error") && json["error"].is_string()) {
        frame.error = json["error"].get<std::string>();
    }
    if (json.contains("calls") && !json["calls"].is_null() && !json["calls"].is_array()) {
        return std::nullopt;
    }
    return frame;
}

VerificationResult<DeploymentTrace> DeploymentTrace::from_json(const nlohmann::json& json) {
    const nlohmann::json* root_json{&json};
    if (json.is_object() && !json.contains("type") && json.contains("result")) {
        root_json = &json["result"];
    }

    DeploymentTrace trace;
    std::stack<std::pair<const nlohmann::json*, std::optional<size_t>>> pending;
    pending.emplace(root_json, std::nullopt);
    while (!pending.empty()) {
        const auto [frame_json, parent] = pending.top();
        pending.pop();

        auto frame{parse_frame(*frame_json)};
        if (!frame) {
            BYTECHECK_ERROR << "DeploymentTrace: malformed call frame at position " << trace.frames_.size();
            return tl::unexpected{VerificationError::kMalformedTrace};
        }
        const size_t index{trace.frames_.size()};
        frame->parent = parent;
        if (parent) {
            trace.frames_[*parent].children.push_back(index);
        }
        trace.frames_.push_back(std::move(*frame));

        if (frame_json->contains("calls") && (*frame_json)["calls"].is_array()) {
            const auto& calls{(*frame_json)["calls"]};
            // Reverse push so that children are popped in recorded order
            for (auto it = calls.rbegin(); it != calls.rend(); ++it) {
                pending.emplace(&*it, index);
            }
        }
    }
    BYTECHECK_DEBUG << "DeploymentTrace: " << trace.frames_.size() << " call frames";
    return trace;
}

void for_each_pre_order(const DeploymentTrace& trace, absl::FunctionRef<bool(size_t, const CallFrame&)> visitor) {
    if (trace.size() == 0) return;

    std::stack<size_t> pending;
    pending.push(0);
    while (!pending.empty()) {
        const size_t index{pending.top()};
        pending.pop();
        const CallFrame& frame{trace.frame(index)};
        if (!visitor(index, frame)) {
            return;
        }
        for (auto it = frame.children.rbegin(); it != frame.children.rend(); ++it) {
            pending.push(*it);
        }
    }
}

}  // namespace bytecheck::verify
