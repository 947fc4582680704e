// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <evmc/evmc.hpp>
#include <nlohmann/json.hpp>

#include <bytecheck/core/common/bytes.hpp>
#include <bytecheck/verify/chain/types.hpp>

namespace bytecheck::verify {

//! Read access to a node. Failures of the node itself propagate as exceptions, never as empty results.
class RpcProvider {
  public:
    virtual ~RpcProvider() = default;

    //! Code deployed at the address in the latest block, empty if none
    virtual Bytes code_at(const evmc::address& address) = 0;

    virtual std::optional<Transaction> transaction(const evmc::bytes32& tx_hash) = 0;

    virtual std::optional<TransactionReceipt> receipt(const evmc::bytes32& tx_hash) = 0;

    //! Result of debug_traceTransaction with the callTracer
    virtual nlohmann::json debug_trace(const evmc::bytes32& tx_hash) = 0;
};

}  // namespace bytecheck::verify
