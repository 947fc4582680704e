// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>

#include <bytecheck/core/common/bytes.hpp>
#include <bytecheck/verify/artifact/compiled_artifact.hpp>
#include <bytecheck/verify/bytecode/placeholder.hpp>
#include <bytecheck/verify/compare/comparison_result.hpp>
#include <bytecheck/verify/request/verification_request.hpp>

namespace bytecheck::verify {

//! On-chain side of a comparison
struct OnchainBytecode {
    Bytes runtime_code;
    std::optional<Bytes> creation_code;  // creation transaction input or internal CREATE/CREATE2 input
};

//! Compares compiled output against deployed bytecode once both sides are normalized
class Comparator {
  public:
    explicit Comparator(const VerificationRequest& request) : request_{request} {}

    //! \brief Runs the checks in order: constructor code (when creation code is known), runtime bytecode,
    //! metadata hash (when a metadata document is supplied for a partial verification)
    //! \throws VerificationException on processing errors, which are never reported as mismatches
    ComparisonResults compare(const CompiledArtifact& artifact, const OnchainBytecode& onchain,
                              const std::optional<std::string>& raw_metadata) const;

    ConstructorCodeCheck compare_constructor_code(const CompiledArtifact& artifact, ByteView creation_code) const;
    ComparisonResult compare_runtime_code(const CompiledArtifact& artifact, ByteView runtime_code) const;
    MetadataHashCheck compare_metadata_hash(ByteView runtime_code, const std::string& raw_metadata) const;

    Linkages creation_linkages(const CompiledArtifact& artifact) const;
    Linkages runtime_linkages(const CompiledArtifact& artifact) const;

  private:
    //! \throws VerificationException when the requested library matches no link reference of the artifact
    void ensure_library_referenced(const CompiledArtifact& artifact) const;
    std::vector<LibraryLink> library_links(const std::vector<LinkReference>& references) const;

    const VerificationRequest& request_;
};

}  // namespace bytecheck::verify
