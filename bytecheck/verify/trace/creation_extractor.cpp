// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#include "creation_extractor.hpp"

#include <bytecheck/core/types/address.hpp>
#include <bytecheck/infra/common/log.hpp>

namespace bytecheck::verify {

std::optional<size_t> find_creation_frame(const DeploymentTrace& trace, const evmc::address& address) {
    std::optional<size_t> found;
    for_each_pre_order(trace, [&](size_t index, const CallFrame& frame) {
        if (is_creation(frame.type) && frame.to == address) {
            found = index;
            return false;
        }
        return true;
    });
    return found;
}

VerificationResult<Bytes> find_creation_input(const DeploymentTrace& trace, const evmc::address& address) {
    const auto index{find_creation_frame(trace, address)};
    if (!index) {
        return tl::unexpected{VerificationError::kCreationNotFound};
    }
    const CallFrame& frame{trace.frame(*index)};
    if (frame.error) {
        BYTECHECK_WARN << "Creation frame for " << address << " reports error: " << *frame.error;
    }
    BYTECHECK_DEBUG << "Creation frame #" << *index << " (" << frame.type_name << ") for " << address
                    << " input size: " << frame.input.size();
    return frame.input;
}

Bytes extract_bytecode_from_geth_traces(const DeploymentTrace& trace, const evmc::address& address) {
    return unwrap_or_throw(find_creation_input(trace, address), Stage::kTrace,
                           "no creation frame for " + address_to_hex(address));
}

Bytes extract_bytecode_from_geth_traces(const nlohmann::json& trace_json, const evmc::address& address) {
    const auto trace{unwrap_or_throw(DeploymentTrace::from_json(trace_json), Stage::kTrace)};
    return extract_bytecode_from_geth_traces(trace, address);
}

}  // namespace bytecheck::verify
