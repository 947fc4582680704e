// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <string_view>
#include <utility>

#include <bytecheck/verify/artifact/compiled_artifact.hpp>
#include <bytecheck/verify/common/errors.hpp>

namespace bytecheck::verify {

//! Origin of the compiled artifact used for comparison
enum class ArtifactType {
    kDefault,    // compiler output of the project
    kOpMainnet,  // artifact used for the OP Mainnet deployment, never rebuilt
};

//! \brief Registry of prebuilt artifacts, one subdirectory per alternative artifact type
//! \details Layout: <root>/<type directory>/<Contract>.json, e.g. alternative/op-mainnet/FiatTokenProxy.json
class AlternativeArtifacts {
  public:
    explicit AlternativeArtifacts(std::filesystem::path root) : root_{std::move(root)} {}

    static std::string_view directory_name(ArtifactType type);

    std::filesystem::path artifact_path(ArtifactType type, std::string_view contract_name) const;

    VerificationResult<CompiledArtifact> load(ArtifactType type, std::string_view contract_name) const;

  private:
    std::filesystem::path root_;
};

}  // namespace bytecheck::verify
