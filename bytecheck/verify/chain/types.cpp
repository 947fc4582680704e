// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#include "types.hpp"

#include <string>
#include <system_error>

#include <bytecheck/core/common/util.hpp>
#include <bytecheck/core/types/address.hpp>

namespace bytecheck::verify {

static std::system_error invalid_field(const char* type, const char* field) {
    return std::system_error{std::make_error_code(std::errc::invalid_argument),
                             std::string{type} + ": invalid " + field};
}

static std::optional<evmc::address> optional_address(const nlohmann::json& json, const char* type, const char* field) {
    if (!json.contains(field) || json[field].is_null()) {
        return std::nullopt;
    }
    const auto address{json[field].is_string() ? hex_to_address(json[field].get<std::string>()) : std::nullopt};
    if (!address) {
        throw invalid_field(type, field);
    }
    return address;
}

static evmc::bytes32 required_hash(const nlohmann::json& json, const char* type, const char* field) {
    const auto hash{json.contains(field) && json[field].is_string() ? hex_to_bytes32(json[field].get<std::string>())
                                                                    : std::nullopt};
    if (!hash) {
        throw invalid_field(type, field);
    }
    return *hash;
}

void from_json(const nlohmann::json& json, Transaction& transaction) {
    if (!json.is_object()) {
        throw std::system_error{std::make_error_code(std::errc::invalid_argument), "Transaction: object expected"};
    }
    transaction.hash = required_hash(json, "Transaction", "hash");
    transaction.from = optional_address(json, "Transaction", "from");
    transaction.to = optional_address(json, "Transaction", "to");
    // Some clients still use the legacy "data" name
    const char* input_field{json.contains("input") ? "input" : "data"};
    const auto input{json.contains(input_field) && json[input_field].is_string()
                         ? from_hex(json[input_field].get<std::string>())
                         : std::nullopt};
    if (!input) {
        throw invalid_field("Transaction", "input");
    }
    transaction.input = *input;
}

void to_json(nlohmann::json& json, const Transaction& transaction) {
    json["hash"] = to_hex(transaction.hash, /*with_prefix=*/true);
    json["from"] = transaction.from ? nlohmann::json(address_to_hex(*transaction.from)) : nlohmann::json{};
    json["to"] = transaction.to ? nlohmann::json(address_to_hex(*transaction.to)) : nlohmann::json{};
    json["input"] = to_hex(transaction.input, /*with_prefix=*/true);
}

void from_json(const nlohmann::json& json, TransactionReceipt& receipt) {
    if (!json.is_object()) {
        throw std::system_error{std::make_error_code(std::errc::invalid_argument), "Receipt: object expected"};
    }
    receipt.tx_hash = required_hash(json, "Receipt", "transactionHash");
    receipt.contract_address = optional_address(json, "Receipt", "contractAddress");
    receipt.success = json.contains("status") && json["status"] == "0x1";
}

void to_json(nlohmann::json& json, const TransactionReceipt& receipt) {
    json["transactionHash"] = to_hex(receipt.tx_hash, /*with_prefix=*/true);
    json["contractAddress"] =
        receipt.contract_address ? nlohmann::json(address_to_hex(*receipt.contract_address)) : nlohmann::json{};
    json["status"] = receipt.success ? "0x1" : "0x0";
}

}  // namespace bytecheck::verify
