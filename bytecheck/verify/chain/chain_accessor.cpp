// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#include "chain_accessor.hpp"

#include <fstream>
#include <sstream>
#include <string>

#include <absl/strings/ascii.h>

#include <bytecheck/core/common/util.hpp>
#include <bytecheck/core/types/address.hpp>
#include <bytecheck/infra/common/log.hpp>
#include <bytecheck/verify/common/enum_names.hpp>
#include <bytecheck/verify/trace/creation_extractor.hpp>

namespace bytecheck::verify {

Bytes ChainAccessor::get_runtime_code(const evmc::address& address) {
    Bytes code{provider_.code_at(address)};
    if (code.empty()) {
        throw VerificationException{VerificationError::kNoCodeAtAddress, Stage::kChain, address_to_hex(address)};
    }
    BYTECHECK_DEBUG << "Runtime code at " << address << " size: " << code.size();
    return code;
}

Bytes ChainAccessor::load_runtime_code(const std::filesystem::path& path) {
    std::ifstream file{path};
    if (!file) {
        throw VerificationException{VerificationError::kInvalidBytecodeFile, Stage::kChain, "cannot read " + path.string()};
    }
    std::stringstream content;
    content << file.rdbuf();
    const std::string text{content.str()};
    const std::string_view hex{absl::StripAsciiWhitespace(text)};
    const std::string_view digits{has_hex_prefix(hex) ? hex.substr(2) : hex};
    const auto code{digits.size() % 2 == 0 ? from_hex(digits) : std::nullopt};
    if (!code || code->empty()) {
        throw VerificationException{VerificationError::kInvalidBytecodeFile, Stage::kChain, path.string()};
    }
    BYTECHECK_DEBUG << "Runtime code from " << path.string() << " size: " << code->size();
    return *code;
}

Transaction ChainAccessor::get_transaction(const evmc::bytes32& tx_hash) {
    auto transaction{provider_.transaction(tx_hash)};
    if (!transaction) {
        throw VerificationException{VerificationError::kTransactionNotFound, Stage::kChain, to_hex(tx_hash, true)};
    }
    return std::move(*transaction);
}

Bytes ChainAccessor::get_creation_input(const evmc::bytes32& tx_hash) {
    return get_transaction(tx_hash).input;
}

DeploymentTrace ChainAccessor::get_trace(const evmc::bytes32& tx_hash) {
    const auto trace_json = provider_.debug_trace(tx_hash);
    return unwrap_or_throw(DeploymentTrace::from_json(trace_json), Stage::kTrace, to_hex(tx_hash, true));
}

void ChainAccessor::check_receipt(const evmc::bytes32& tx_hash, const evmc::address& address) {
    const auto receipt{provider_.receipt(tx_hash)};
    if (receipt && receipt->contract_address && *receipt->contract_address != address) {
        BYTECHECK_WARN << "Transaction " << tx_hash << " created " << *receipt->contract_address
                       << " instead of " << address;
    }
}

Bytes ChainAccessor::get_creation_code(const evmc::bytes32& tx_hash, const evmc::address& address,
                                       DeploymentPath path) {
    DeploymentPath effective_path{path};
    Transaction transaction;
    if (path != DeploymentPath::kInternal) {
        transaction = get_transaction(tx_hash);
        if (path == DeploymentPath::kAuto) {
            effective_path = transaction.to ? DeploymentPath::kInternal : DeploymentPath::kDirect;
        }
    }
    BYTECHECK_DEBUG << "Creation code of " << address << " via " << enum_json_name(effective_path) << " path";

    if (effective_path == DeploymentPath::kDirect) {
        check_receipt(tx_hash, address);
        return std::move(transaction.input);
    }
    return extract_bytecode_from_geth_traces(get_trace(tx_hash), address);
}

}  // namespace bytecheck::verify
