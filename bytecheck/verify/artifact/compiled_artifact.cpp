// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#include "compiled_artifact.hpp"

#include <fstream>
#include <utility>

#include <bytecheck/infra/common/log.hpp>

namespace bytecheck::verify {

namespace fs = std::filesystem;

std::pair<std::string_view, std::string_view> split_qualified_name(std::string_view name) {
    const auto colon{name.rfind(':')};
    if (colon == std::string_view::npos) {
        return {std::string_view{}, name};
    }
    return {name.substr(0, colon), name.substr(colon + 1)};
}

std::vector<LinkReference> link_references_from_json(const nlohmann::json& json) {
    // {"<source>": {"<library>": [{"start": N, "length": 20}, ...]}}
    std::vector<LinkReference> references;
    for (const auto& [source, libraries] : json.items()) {
        for (const auto& [library, positions] : libraries.items()) {
            for (const auto& position : positions) {
                references.push_back({source, library, position.at("start").get<size_t>(),
                                      position.at("length").get<size_t>()});
            }
        }
    }
    return references;
}

std::vector<ImmutableReference> immutable_references_from_json(const nlohmann::json& json) {
    // {"<ast id>": [{"start": N, "length": 32}, ...]}
    std::vector<ImmutableReference> references;
    for (const auto& [id, positions] : json.items()) {
        for (const auto& position : positions) {
            references.push_back({position.at("start").get<size_t>(), position.at("length").get<size_t>()});
        }
    }
    return references;
}

static VerificationResult<Bytes> bytecode_from_json(const nlohmann::json& field) {
    const nlohmann::json& hex{field.is_object() ? field.at("object") : field};
    if (!hex.is_string()) {
        return tl::unexpected{VerificationError::kInvalidArtifact};
    }
    auto unlinked{decode_unlinked_hex(hex.get<std::string>())};
    if (!unlinked) {
        return tl::unexpected{unlinked.error()};
    }
    return std::move(unlinked->code);
}

// Link references are either nested in the bytecode object (Foundry) or top level (Hardhat)
static std::vector<LinkReference> link_references_of(const nlohmann::json& json, const char* bytecode_key,
                                                     const char* top_level_key) {
    const auto& bytecode{json.at(bytecode_key)};
    if (bytecode.is_object() && bytecode.contains("linkReferences")) {
        return link_references_from_json(bytecode["linkReferences"]);
    }
    if (json.contains(top_level_key)) {
        return link_references_from_json(json[top_level_key]);
    }
    return {};
}

VerificationResult<CompiledArtifact> parse_artifact(const nlohmann::json& json, std::string_view contract_name) {
    if (!json.is_object() || !json.contains("bytecode") || !json.contains("deployedBytecode")) {
        BYTECHECK_ERROR << "Artifact for " << contract_name << " has no bytecode";
        return tl::unexpected{VerificationError::kInvalidArtifact};
    }
    try {
        CompiledArtifact artifact;
        artifact.contract_name = json.value("contractName", std::string{split_qualified_name(contract_name).second});
        artifact.source_name = json.value("sourceName", std::string{split_qualified_name(contract_name).first});

        auto creation_code{bytecode_from_json(json["bytecode"])};
        auto runtime_code{bytecode_from_json(json["deployedBytecode"])};
        if (!creation_code || !runtime_code) {
            BYTECHECK_ERROR << "Artifact for " << contract_name << " contains invalid bytecode hex";
            return tl::unexpected{VerificationError::kInvalidArtifact};
        }
        artifact.creation_code = std::move(*creation_code);
        artifact.runtime_code = std::move(*runtime_code);

        artifact.creation_link_references = link_references_of(json, "bytecode", "linkReferences");
        artifact.runtime_link_references = link_references_of(json, "deployedBytecode", "deployedLinkReferences");
        const auto& deployed{json["deployedBytecode"]};
        if (deployed.is_object() && deployed.contains("immutableReferences")) {
            artifact.runtime_immutable_references = immutable_references_from_json(deployed["immutableReferences"]);
        }

        if (json.contains("rawMetadata") && json["rawMetadata"].is_string()) {
            artifact.raw_metadata = json["rawMetadata"].get<std::string>();
        } else if (json.contains("metadata") && json["metadata"].is_string()) {
            artifact.raw_metadata = json["metadata"].get<std::string>();
        }
        return artifact;
    } catch (const nlohmann::json::exception& e) {
        BYTECHECK_ERROR << "Artifact for " << contract_name << " is malformed: " << e.what();
        return tl::unexpected{VerificationError::kInvalidArtifact};
    }
}

static std::optional<nlohmann::json> read_json_file(const fs::path& path) {
    std::ifstream file{path};
    if (!file) {
        return std::nullopt;
    }
    auto json = nlohmann::json::parse(file, nullptr, /*allow_exceptions=*/false);
    if (json.is_discarded()) {
        return std::nullopt;
    }
    return json;
}

// Hardhat keeps immutable references and metadata only in the build-info referenced by <Contract>.dbg.json
static void complete_from_build_info(const fs::path& artifact_path, CompiledArtifact& artifact) {
    fs::path dbg_path{artifact_path};
    dbg_path.replace_extension(".dbg.json");
    const auto dbg{read_json_file(dbg_path)};
    if (!dbg || !dbg->contains("buildInfo") || !(*dbg)["buildInfo"].is_string()) {
        return;
    }
    const fs::path build_info_path{artifact_path.parent_path() / (*dbg)["buildInfo"].get<std::string>()};
    const auto build_info{read_json_file(build_info_path)};
    if (!build_info) {
        BYTECHECK_WARN << "Cannot read build info " << build_info_path.string();
        return;
    }
    const auto pointer{nlohmann::json::json_pointer{"/output/contracts"} / artifact.source_name / artifact.contract_name};
    if (!build_info->contains(pointer)) {
        BYTECHECK_WARN << "Build info " << build_info_path.string() << " has no output for " << pointer.to_string();
        return;
    }
    const auto& output{(*build_info)[pointer]};
    const nlohmann::json::json_pointer immutables{"/evm/deployedBytecode/immutableReferences"};
    if (artifact.runtime_immutable_references.empty() && output.contains(immutables)) {
        artifact.runtime_immutable_references = immutable_references_from_json(output[immutables]);
    }
    if (!artifact.raw_metadata && output.contains("metadata") && output["metadata"].is_string()) {
        artifact.raw_metadata = output["metadata"].get<std::string>();
    }
}

VerificationResult<CompiledArtifact> load_artifact(const fs::path& path, std::string_view contract_name) {
    const auto json{read_json_file(path)};
    if (!json) {
        BYTECHECK_ERROR << "Cannot read artifact " << path.string();
        return tl::unexpected{VerificationError::kInvalidArtifact};
    }
    auto artifact{parse_artifact(*json, contract_name)};
    if (!artifact) {
        return artifact;
    }
    if (json->contains("_format")) {
        try {
            complete_from_build_info(path, *artifact);
        } catch (const nlohmann::json::exception& e) {
            BYTECHECK_ERROR << "Build info for " << path.string() << " is malformed: " << e.what();
            return tl::unexpected{VerificationError::kInvalidArtifact};
        }
    }
    BYTECHECK_DEBUG << "Loaded artifact " << path.string() << " creation size: " << artifact->creation_code.size()
                    << " runtime size: " << artifact->runtime_code.size();
    return artifact;
}

}  // namespace bytecheck::verify
