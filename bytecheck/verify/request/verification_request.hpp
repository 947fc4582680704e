// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <evmc/evmc.hpp>
#include <nlohmann/json.hpp>

#include <bytecheck/verify/artifact/alternative_artifacts.hpp>

namespace bytecheck::verify {

enum class VerificationType {
    kPartial,  // metadata trailer excluded from the runtime comparison
    kFull,
};

//! How the creation code is obtained from the creation transaction
enum class DeploymentPath {
    kAuto,      // transaction input for contract creation transactions, execution trace otherwise
    kDirect,    // transaction input
    kInternal,  // execution trace
};

struct VerificationRequest {
    std::string contract_name;
    evmc::address contract_address;
    VerificationType verification_type{VerificationType::kPartial};
    std::optional<evmc::bytes32> creation_tx_hash;
    std::optional<std::filesystem::path> onchain_bytecode_file;
    std::optional<std::filesystem::path> metadata_file;
    std::optional<std::string> library_name;
    std::optional<evmc::address> library_address;
    bool is_library{false};
    ArtifactType artifact_type{ArtifactType::kDefault};
    std::optional<uint32_t> optimizer_runs;
    DeploymentPath deployment_path{DeploymentPath::kAuto};

    //! \brief Checks field combinations
    //! \throws RequestValidationError naming the offending field
    void validate() const;
};

//! \brief Loads and validates a request document with camelCase keys, unknown keys are rejected
//! \throws RequestValidationError naming the offending field
void from_json(const nlohmann::json& json, VerificationRequest& request);
void to_json(nlohmann::json& json, const VerificationRequest& request);

}  // namespace bytecheck::verify
