// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#include "verification_request.hpp"

#include <algorithm>
#include <array>
#include <string_view>

#include <absl/strings/str_cat.h>

#include <bytecheck/core/types/address.hpp>
#include <bytecheck/verify/build/optimizer_runs.hpp>
#include <bytecheck/verify/common/enum_names.hpp>
#include <bytecheck/verify/common/errors.hpp>

namespace bytecheck::verify {

static constexpr std::array<std::string_view, 12> kRequestFields{
    "contractName",
    "libraryName",
    "contractAddress",
    "verificationType",
    "contractCreationTxHash",
    "onchainBytecodeFilePath",
    "metadataFilePath",
    "libraryAddress",
    "isLibrary",
    "artifactType",
    "optimizerRuns",
    "deploymentPath",
};

void VerificationRequest::validate() const {
    if (contract_name.empty()) {
        throw RequestValidationError{"contractName", "must not be empty"};
    }
    if (library_address && !library_name) {
        throw RequestValidationError{"libraryAddress", "requires libraryName"};
    }
    if (library_name && !library_address) {
        throw RequestValidationError{"libraryName", "requires libraryAddress"};
    }
    if (library_name && library_name->empty()) {
        throw RequestValidationError{"libraryName", "must not be empty"};
    }
    if (is_library && artifact_type != ArtifactType::kDefault) {
        throw RequestValidationError{"artifactType", "not supported for libraries"};
    }
    if (optimizer_runs) {
        if (*optimizer_runs == 0) {
            throw RequestValidationError{"optimizerRuns", "must be positive", VerificationError::kInvalidOptimizerRuns};
        }
        if (artifact_type != ArtifactType::kDefault) {
            throw RequestValidationError{"optimizerRuns", "alternative artifacts are never rebuilt",
                                         VerificationError::kInvalidOptimizerRuns};
        }
    }
    if (deployment_path != DeploymentPath::kAuto && !creation_tx_hash) {
        throw RequestValidationError{"deploymentPath", "requires contractCreationTxHash"};
    }
}

static std::string expect_string(const nlohmann::json& json, std::string_view field) {
    const auto& value{json.at(std::string{field})};
    if (!value.is_string()) {
        throw RequestValidationError{std::string{field}, absl::StrCat("expected a string, got ", value.dump())};
    }
    return value.get<std::string>();
}

static std::optional<std::string> optional_string(const nlohmann::json& json, std::string_view field) {
    const std::string key{field};
    if (!json.contains(key) || json[key].is_null()) {
        return std::nullopt;
    }
    return expect_string(json, field);
}

static evmc::address parse_address(const std::string& hex, std::string_view field) {
    const auto address{hex_to_address(hex)};
    if (!address) {
        throw RequestValidationError{std::string{field}, absl::StrCat("not a 20-byte hex address: ", hex)};
    }
    return *address;
}

template <typename E>
static E parse_enum(const std::string& name, std::string_view field) {
    const auto value{enum_from_json_name<E>(name)};
    if (!value) {
        throw RequestValidationError{std::string{field}, absl::StrCat("unknown value ", name)};
    }
    return *value;
}

void from_json(const nlohmann::json& json, VerificationRequest& request) {
    if (!json.is_object()) {
        throw RequestValidationError{"request", "expected a JSON object"};
    }
    for (const auto& [key, value] : json.items()) {
        if (std::find(kRequestFields.begin(), kRequestFields.end(), key) == kRequestFields.end()) {
            throw RequestValidationError{key, "unknown field"};
        }
    }

    request = VerificationRequest{};
    if (!json.contains("contractName")) {
        throw RequestValidationError{"contractName", "missing"};
    }
    request.contract_name = expect_string(json, "contractName");
    if (!json.contains("contractAddress")) {
        throw RequestValidationError{"contractAddress", "missing"};
    }
    request.contract_address = parse_address(expect_string(json, "contractAddress"), "contractAddress");

    if (const auto type{optional_string(json, "verificationType")}) {
        request.verification_type = parse_enum<VerificationType>(*type, "verificationType");
    }
    if (const auto hash{optional_string(json, "contractCreationTxHash")}) {
        const auto tx_hash{hex_to_bytes32(*hash)};
        if (!tx_hash) {
            throw RequestValidationError{"contractCreationTxHash", absl::StrCat("not a 32-byte hex hash: ", *hash)};
        }
        request.creation_tx_hash = *tx_hash;
    }
    if (const auto path{optional_string(json, "onchainBytecodeFilePath")}) {
        request.onchain_bytecode_file = *path;
    }
    if (const auto path{optional_string(json, "metadataFilePath")}) {
        request.metadata_file = *path;
    }
    request.library_name = optional_string(json, "libraryName");
    if (const auto address{optional_string(json, "libraryAddress")}) {
        request.library_address = parse_address(*address, "libraryAddress");
    }
    if (json.contains("isLibrary") && !json["isLibrary"].is_null()) {
        if (!json["isLibrary"].is_boolean()) {
            throw RequestValidationError{"isLibrary", "expected a boolean"};
        }
        request.is_library = json["isLibrary"].get<bool>();
    }
    if (const auto type{optional_string(json, "artifactType")}) {
        request.artifact_type = parse_enum<ArtifactType>(*type, "artifactType");
    }
    if (json.contains("optimizerRuns") && !json["optimizerRuns"].is_null()) {
        const auto& runs{json["optimizerRuns"]};
        const auto parsed{parse_optimizer_runs(runs)};
        if (!parsed) {
            throw RequestValidationError{"optimizerRuns", runs.dump(), parsed.error()};
        }
        request.optimizer_runs = *parsed;
    }
    if (const auto path{optional_string(json, "deploymentPath")}) {
        request.deployment_path = parse_enum<DeploymentPath>(*path, "deploymentPath");
    }

    request.validate();
}

void to_json(nlohmann::json& json, const VerificationRequest& request) {
    json = nlohmann::json::object();
    json["contractName"] = request.contract_name;
    json["contractAddress"] = address_to_hex(request.contract_address);
    json["verificationType"] = enum_json_name(request.verification_type);
    if (request.creation_tx_hash) {
        json["contractCreationTxHash"] = to_hex(*request.creation_tx_hash, /*with_prefix=*/true);
    }
    if (request.onchain_bytecode_file) {
        json["onchainBytecodeFilePath"] = request.onchain_bytecode_file->string();
    }
    if (request.metadata_file) {
        json["metadataFilePath"] = request.metadata_file->string();
    }
    if (request.library_name) {
        json["libraryName"] = *request.library_name;
    }
    if (request.library_address) {
        json["libraryAddress"] = address_to_hex(*request.library_address);
    }
    if (request.is_library) {
        json["isLibrary"] = true;
    }
    json["artifactType"] = enum_json_name(request.artifact_type);
    if (request.optimizer_runs) {
        json["optimizerRuns"] = *request.optimizer_runs;
    }
    json["deploymentPath"] = enum_json_name(request.deployment_path);
}

}  // namespace bytecheck::verify
