// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#include "artifact_locator.hpp"

#include <string>
#include <vector>

#include <bytecheck/infra/common/log.hpp>

namespace bytecheck::verify {

namespace fs = std::filesystem;

static constexpr std::string_view kBuildInfoDirectory{"build-info"};
static constexpr std::string_view kDebugSuffix{".dbg.json"};

static bool is_artifact_file(const fs::path& path, const std::string& file_name) {
    const std::string name{path.filename().string()};
    return name == file_name && !name.ends_with(kDebugSuffix) && path.parent_path().extension() == ".sol";
}

// Foundry output is flat: one <Source>.sol directory per source file
static std::vector<fs::path> foundry_candidates(const fs::path& out_dir, const std::string& file_name) {
    std::vector<fs::path> candidates;
    for (const auto& entry : fs::directory_iterator{out_dir}) {
        if (!entry.is_directory() || entry.path().extension() != ".sol") continue;
        const fs::path candidate{entry.path() / file_name};
        if (fs::is_regular_file(candidate)) {
            candidates.push_back(candidate);
        }
    }
    return candidates;
}

static std::vector<fs::path> hardhat_candidates(const fs::path& artifacts_dir, const std::string& file_name) {
    std::vector<fs::path> candidates;
    for (auto it{fs::recursive_directory_iterator{artifacts_dir}}; it != fs::recursive_directory_iterator{}; ++it) {
        if (it->is_directory() && it->path().filename() == kBuildInfoDirectory) {
            it.disable_recursion_pending();
            continue;
        }
        if (it->is_regular_file() && is_artifact_file(it->path(), file_name)) {
            candidates.push_back(it->path());
        }
    }
    return candidates;
}

VerificationResult<fs::path> locate_artifact(const fs::path& artifacts_dir, ArtifactLayout layout,
                                             std::string_view contract_name) {
    const auto [source, contract] = split_qualified_name(contract_name);
    const std::string file_name{std::string{contract} + ".json"};
    if (contract.empty() || !fs::is_directory(artifacts_dir)) {
        BYTECHECK_ERROR << "No artifact directory " << artifacts_dir.string() << " for " << contract_name;
        return tl::unexpected{VerificationError::kArtifactNotFound};
    }

    if (!source.empty()) {
        const fs::path source_path{source};
        const fs::path qualified{layout == ArtifactLayout::kFoundry ? artifacts_dir / source_path.filename() / file_name
                                                                    : artifacts_dir / source_path / file_name};
        if (!fs::is_regular_file(qualified)) {
            BYTECHECK_ERROR << "Artifact " << qualified.string() << " not found";
            return tl::unexpected{VerificationError::kArtifactNotFound};
        }
        return qualified;
    }

    const auto candidates{layout == ArtifactLayout::kFoundry ? foundry_candidates(artifacts_dir, file_name)
                                                             : hardhat_candidates(artifacts_dir, file_name)};
    if (candidates.empty()) {
        BYTECHECK_ERROR << "No artifact for " << contract_name << " in " << artifacts_dir.string();
        return tl::unexpected{VerificationError::kArtifactNotFound};
    }
    if (candidates.size() > 1) {
        BYTECHECK_ERROR << "Ambiguous artifact for " << contract_name << ": " << candidates.size()
                        << " candidates, use a fully qualified name";
        return tl::unexpected{VerificationError::kAmbiguousArtifact};
    }
    BYTECHECK_DEBUG << "Artifact for " << contract_name << ": " << candidates.front().string();
    return candidates.front();
}

}  // namespace bytecheck::verify
