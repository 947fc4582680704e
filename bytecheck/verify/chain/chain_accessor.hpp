// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>

#include <evmc/evmc.hpp>

#include <bytecheck/core/common/bytes.hpp>
#include <bytecheck/verify/chain/rpc_provider.hpp>
#include <bytecheck/verify/request/verification_request.hpp>
#include <bytecheck/verify/trace/deployment_trace.hpp>

namespace bytecheck::verify {

//! Retrieves the on-chain side of a verification. Data errors are raised as VerificationException,
//! provider failures propagate unchanged.
class ChainAccessor {
  public:
    explicit ChainAccessor(RpcProvider& provider) : provider_{provider} {}

    //! \throws VerificationException with kNoCodeAtAddress if nothing is deployed at the address
    Bytes get_runtime_code(const evmc::address& address);

    //! \brief Reads a runtime bytecode capture: hex with optional 0x prefix, surrounding whitespace ignored
    //! \throws VerificationException with kInvalidBytecodeFile
    static Bytes load_runtime_code(const std::filesystem::path& path);

    //! \throws VerificationException with kTransactionNotFound
    Bytes get_creation_input(const evmc::bytes32& tx_hash);

    //! \throws VerificationException with kMalformedTrace
    DeploymentTrace get_trace(const evmc::bytes32& tx_hash);

    //! \brief Creation code (init code plus constructor arguments) of the contract deployed at the address
    Bytes get_creation_code(const evmc::bytes32& tx_hash, const evmc::address& address, DeploymentPath path);

  private:
    Transaction get_transaction(const evmc::bytes32& tx_hash);
    void check_receipt(const evmc::bytes32& tx_hash, const evmc::address& address);

    RpcProvider& provider_;
};

}  // namespace bytecheck::verify
