// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include <bytecheck/core/common/bytes.hpp>
#include <bytecheck/verify/bytecode/placeholder.hpp>
#include <bytecheck/verify/common/errors.hpp>

namespace bytecheck::verify {

//! On-disk organisation of compiler output
enum class ArtifactLayout {
    kFoundry,  // <out>/<Source>.sol/<Contract>.json
    kHardhat,  // <artifacts>/<path>/<Source>.sol/<Contract>.json plus build-info
};

//! Compiler output for one contract, shared read-only once loaded
struct CompiledArtifact {
    std::string contract_name;
    std::string source_name;
    Bytes creation_code;
    Bytes runtime_code;
    std::vector<LinkReference> creation_link_references;
    std::vector<LinkReference> runtime_link_references;
    std::vector<ImmutableReference> runtime_immutable_references;
    std::optional<std::string> raw_metadata;
};

//! Splits "path/File.sol:Contract" into source and contract names; plain names have an empty source
std::pair<std::string_view, std::string_view> split_qualified_name(std::string_view name);

//! \brief Builds the artifact from a Foundry or Hardhat artifact document
//! \details Bytecode may be given as a hex string or as an object with an "object" hex field
VerificationResult<CompiledArtifact> parse_artifact(const nlohmann::json& json, std::string_view contract_name);

//! \brief Loads the artifact file, completing Hardhat artifacts with the data found in their build-info
VerificationResult<CompiledArtifact> load_artifact(const std::filesystem::path& path, std::string_view contract_name);

std::vector<LinkReference> link_references_from_json(const nlohmann::json& json);
std::vector<ImmutableReference> immutable_references_from_json(const nlohmann::json& json);

}  // namespace bytecheck::verify
