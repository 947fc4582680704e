// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <absl/functional/function_ref.h>
#include <evmc/evmc.hpp>
#include <nlohmann/json.hpp>

#include <bytecheck/core/common/bytes.hpp>
#include <bytecheck/verify/common/errors.hpp>

namespace bytecheck::verify {

enum class CallType {
    kCall,
    kStaticCall,
    kDelegateCall,
    kCallCode,
    kCreate,
    kCreate2,
    kSelfDestruct,
    kOther,
};

CallType call_type_from_string(std::string_view type);

inline bool is_creation(CallType type) {
    return type == CallType::kCreate || type == CallType::kCreate2;
}

//! Single frame of a call trace. For creations `to` is the address of the deployed contract
struct CallFrame {
    CallType type{CallType::kCall};
    std::string type_name;
    std::optional<evmc::address> from;
    std::optional<evmc::address> to;
    Bytes input;
    std::optional<std::string> error;
    std::optional<size_t> parent;
    std::vector<size_t> children;  // recorded order
};

//! Immutable call tree stored as an arena of frames linked by indices. Index 0 is the root frame.
class DeploymentTrace {
  public:
    //! \brief Builds the arena from a geth callTracer result, with or without the JSON-RPC envelope
    //! \details Construction is iterative, nesting depth is not limited
    static VerificationResult<DeploymentTrace> from_json(const nlohmann::json& json);

    const std::vector<CallFrame>& frames() const noexcept { return frames_; }
    const CallFrame& frame(size_t index) const { return frames_.at(index); }
    const CallFrame& root() const { return frames_.front(); }
    size_t size() const noexcept { return frames_.size(); }

  private:
    DeploymentTrace() = default;

    std::vector<CallFrame> frames_;
};

//! \brief Depth-first pre-order walk, children visited in recorded order
//! \param visitor returns false to stop the walk
void for_each_pre_order(const DeploymentTrace& trace, absl::FunctionRef<bool(size_t, const CallFrame&)> visitor);

}  // namespace bytecheck::verify
