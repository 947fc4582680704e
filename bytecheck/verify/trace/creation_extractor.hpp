// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <evmc/evmc.hpp>
#include <nlohmann/json.hpp>

#include <bytecheck/core/common/bytes.hpp>
#include <bytecheck/verify/common/errors.hpp>
#include <bytecheck/verify/trace/deployment_trace.hpp>

namespace bytecheck::verify {

//! Index of the first creation frame in pre-order whose `to` equals the given address
std::optional<size_t> find_creation_frame(const DeploymentTrace& trace, const evmc::address& address);

VerificationResult<Bytes> find_creation_input(const DeploymentTrace& trace, const evmc::address& address);

//! \brief Recovers the creation bytecode (init code plus constructor arguments) of the contract deployed at address
//! \throws VerificationException with kCreationNotFound if no creation frame targets the address
Bytes extract_bytecode_from_geth_traces(const DeploymentTrace& trace, const evmc::address& address);

//! \throws VerificationException with kMalformedTrace if the JSON is not a valid callTracer result
Bytes extract_bytecode_from_geth_traces(const nlohmann::json& trace_json, const evmc::address& address);

}  // namespace bytecheck::verify
