// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#include "comparator.hpp"

#include <algorithm>

#include <absl/strings/str_cat.h>

#include <bytecheck/core/common/util.hpp>
#include <bytecheck/infra/common/log.hpp>
#include <bytecheck/verify/metadata/content_hash.hpp>
#include <bytecheck/verify/metadata/metadata.hpp>

namespace bytecheck::verify {

namespace {

    bool matches_library(const LinkReference& reference, std::string_view name) {
        return name == reference.library || name == absl::StrCat(reference.source, ":", reference.library);
    }

}  // namespace

void Comparator::ensure_library_referenced(const CompiledArtifact& artifact) const {
    if (!request_.library_name) return;
    const auto referenced = [&](const std::vector<LinkReference>& references) {
        return std::any_of(references.cbegin(), references.cend(),
                           [&](const LinkReference& ref) { return matches_library(ref, *request_.library_name); });
    };
    if (!referenced(artifact.creation_link_references) && !referenced(artifact.runtime_link_references)) {
        throw VerificationException{VerificationError::kInvalidRequest, Stage::kNormalize,
                                    absl::StrCat("library ", *request_.library_name, " is not linked by ",
                                                 artifact.contract_name)};
    }
}

std::vector<LibraryLink> Comparator::library_links(const std::vector<LinkReference>& references) const {
    std::vector<LibraryLink> links;
    links.reserve(references.size());
    for (const auto& reference : references) {
        LibraryLink link{.reference = reference, .address = std::nullopt};
        if (request_.library_name && matches_library(reference, *request_.library_name)) {
            link.address = request_.library_address;
        }
        links.push_back(std::move(link));
    }
    return links;
}

Linkages Comparator::creation_linkages(const CompiledArtifact& artifact) const {
    return Linkages{
        .libraries = library_links(artifact.creation_link_references),
        .immutables = {},
        .library_self_reference = false,
    };
}

Linkages Comparator::runtime_linkages(const CompiledArtifact& artifact) const {
    return Linkages{
        .libraries = library_links(artifact.runtime_link_references),
        .immutables = artifact.runtime_immutable_references,
        .library_self_reference = request_.is_library,
    };
}

ConstructorCodeCheck Comparator::compare_constructor_code(const CompiledArtifact& artifact, ByteView creation_code) const {
    ensure_library_referenced(artifact);
    const Linkages linkages{creation_linkages(artifact)};
    unwrap_or_throw(validate_references(artifact.creation_code, linkages), Stage::kNormalize,
                    absl::StrCat(artifact.contract_name, " creation code"));

    const Bytes compiled{normalize(artifact.creation_code, linkages)};
    const Bytes deployed{normalize(creation_code, linkages)};
    BYTECHECK_DEBUG << "Constructor code: compiled " << compiled.size() << " bytes, on-chain " << deployed.size() << " bytes";

    // Trailing bytes are the ABI-encoded constructor arguments
    const size_t common{prefix_length(compiled, deployed)};
    if (common < compiled.size()) {
        BYTECHECK_DEBUG << "Constructor code differs at byte " << common;
        return ConstructorCodeCheck{.equal = false};
    }
    return ConstructorCodeCheck{.equal = true};
}

ComparisonResult Comparator::compare_runtime_code(const CompiledArtifact& artifact, ByteView runtime_code) const {
    ensure_library_referenced(artifact);
    const Linkages linkages{runtime_linkages(artifact)};
    unwrap_or_throw(validate_references(artifact.runtime_code, linkages), Stage::kNormalize,
                    absl::StrCat(artifact.contract_name, " runtime code"));

    const Bytes compiled{normalize(artifact.runtime_code, linkages)};
    const Bytes deployed{normalize(runtime_code, linkages)};

    if (request_.verification_type == VerificationType::kFull) {
        return RuntimeBytecodeFullCheck{.equal = compiled == deployed};
    }

    const auto compiled_split{unwrap_or_throw(split_metadata(compiled), Stage::kMetadata, "compiled runtime code")};
    const auto deployed_split{unwrap_or_throw(split_metadata(deployed), Stage::kMetadata, "on-chain runtime code")};
    BYTECHECK_DEBUG << "Runtime code without metadata: compiled " << compiled_split.code_without_metadata.size()
                    << " bytes, on-chain " << deployed_split.code_without_metadata.size() << " bytes";
    return RuntimeBytecodePartialCheck{.equal = compiled_split.code_without_metadata == deployed_split.code_without_metadata};
}

MetadataHashCheck Comparator::compare_metadata_hash(ByteView runtime_code, const std::string& raw_metadata) const {
    const auto split{unwrap_or_throw(split_metadata(runtime_code), Stage::kMetadata, "on-chain runtime code")};
    const auto metadata{unwrap_or_throw(decode_metadata(split.metadata_bytes), Stage::kMetadata, "on-chain metadata trailer")};
    const auto hash{unwrap_or_throw(content_hash(metadata.scheme, raw_metadata), Stage::kMetadata, "metadata document")};
    if (metadata.experimental) {
        BYTECHECK_WARN << "On-chain metadata flags experimental compiler features";
    }
    if (metadata.scheme == ContentHashScheme::kIpfs) {
        BYTECHECK_DEBUG << "Metadata hash: on-chain " << to_base58(metadata.content_hash) << " computed " << to_base58(hash)
                        << " solc " << metadata.compiler_version.value_or("unknown");
    } else {
        BYTECHECK_DEBUG << "Metadata hash: on-chain " << to_hex(metadata.content_hash) << " computed " << to_hex(hash)
                        << " solc " << metadata.compiler_version.value_or("unknown");
    }
    return MetadataHashCheck{.equal = verify::equal(ByteView{metadata.content_hash}, ByteView{hash})};
}

ComparisonResults Comparator::compare(const CompiledArtifact& artifact, const OnchainBytecode& onchain,
                                      const std::optional<std::string>& raw_metadata) const {
    ComparisonResults results;
    if (onchain.creation_code) {
        results.emplace_back(compare_constructor_code(artifact, *onchain.creation_code));
    }
    results.push_back(compare_runtime_code(artifact, onchain.runtime_code));
    if (raw_metadata) {
        if (artifact.raw_metadata && *artifact.raw_metadata != *raw_metadata) {
            BYTECHECK_WARN << "Metadata document differs from the metadata compiled into " << artifact.contract_name;
        }
        if (request_.verification_type == VerificationType::kPartial) {
            results.emplace_back(compare_metadata_hash(onchain.runtime_code, *raw_metadata));
        } else {
            BYTECHECK_DEBUG << "Metadata document ignored for full verification";
        }
    }
    return results;
}

}  // namespace bytecheck::verify
