// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#include "alternative_artifacts.hpp"

#include <string>

#include <bytecheck/infra/common/log.hpp>

namespace bytecheck::verify {

std::string_view AlternativeArtifacts::directory_name(ArtifactType type) {
    switch (type) {
        case ArtifactType::kOpMainnet:
            return "op-mainnet";
        case ArtifactType::kDefault:
            break;
    }
    return {};
}

std::filesystem::path AlternativeArtifacts::artifact_path(ArtifactType type, std::string_view contract_name) const {
    const auto contract{split_qualified_name(contract_name).second};
    return root_ / directory_name(type) / (std::string{contract} + ".json");
}

VerificationResult<CompiledArtifact> AlternativeArtifacts::load(ArtifactType type, std::string_view contract_name) const {
    if (type == ArtifactType::kDefault) {
        return tl::unexpected{VerificationError::kArtifactNotFound};
    }
    const auto path{artifact_path(type, contract_name)};
    if (!std::filesystem::is_regular_file(path)) {
        BYTECHECK_ERROR << "No alternative artifact " << path.string() << " for " << contract_name;
        return tl::unexpected{VerificationError::kArtifactNotFound};
    }
    BYTECHECK_INFO << "Using alternative artifact " << path.string();
    return load_artifact(path, contract_name);
}

}  // namespace bytecheck::verify
