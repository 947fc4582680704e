// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>

#include <bytecheck/verify/artifact/compiled_artifact.hpp>
#include <bytecheck/verify/build/artifact_cache.hpp>
#include <bytecheck/verify/build/compiler_invoker.hpp>
#include <bytecheck/verify/request/verification_request.hpp>

namespace bytecheck::verify {

struct BuildSettings {
    std::string build_tool{"forge"};
    std::filesystem::path project_dir{"."};
    std::filesystem::path artifacts_dir{"out"};  // relative to the project directory unless absolute
    ArtifactLayout artifact_layout{ArtifactLayout::kFoundry};
    std::filesystem::path alternative_artifacts_dir{"alternative-artifacts"};  // idem
};

//! Produces the compiled artifact a request must be compared against
class BuildOrchestrator {
  public:
    BuildOrchestrator(BuildSettings settings, std::shared_ptr<CompilerInvoker> invoker);

    BuildOrchestrator(const BuildOrchestrator&) = delete;
    BuildOrchestrator& operator=(const BuildOrchestrator&) = delete;

    //! \brief Returns the alternative artifact, the rebuilt artifact for the requested optimizer runs or the
    //! artifact already on disk, in this order of precedence
    //! \throws RequestValidationError before any compiler invocation, VerificationException for artifact
    //! errors and CompilerInvocationError for failed builds
    ArtifactCache::ArtifactPtr ensure_artifact(const VerificationRequest& request);

    std::filesystem::path artifacts_dir() const;
    std::filesystem::path alternative_artifacts_dir() const;
    const ArtifactCache& cache() const { return cache_; }

  private:
    CompiledArtifact load_project_artifact(std::string_view contract_name) const;

    BuildSettings settings_;
    std::shared_ptr<CompilerInvoker> invoker_;
    ArtifactCache cache_;
    // Builds rewrite the shared compiler output directory: exclusive for builds, shared for reads
    std::shared_mutex output_mutex_;
};

}  // namespace bytecheck::verify
