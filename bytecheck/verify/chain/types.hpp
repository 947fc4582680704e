// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <evmc/evmc.hpp>
#include <nlohmann/json.hpp>

#include <bytecheck/core/common/bytes.hpp>

namespace bytecheck::verify {

struct Transaction {
    evmc::bytes32 hash;
    std::optional<evmc::address> from;
    std::optional<evmc::address> to;  // absent for contract creation transactions
    Bytes input;
};

struct TransactionReceipt {
    evmc::bytes32 tx_hash;
    std::optional<evmc::address> contract_address;
    bool success{false};
};

//! Decoding of eth_getTransactionByHash and eth_getTransactionReceipt results
//! \throws std::system_error with invalid_argument on malformed fields
void from_json(const nlohmann::json& json, Transaction& transaction);
void to_json(nlohmann::json& json, const Transaction& transaction);

void from_json(const nlohmann::json& json, TransactionReceipt& receipt);
void to_json(nlohmann::json& json, const TransactionReceipt& receipt);

}  // namespace bytecheck::verify
