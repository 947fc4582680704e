// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#include "build_orchestrator.hpp"

#include <mutex>
#include <utility>

#include <bytecheck/infra/common/log.hpp>
#include <bytecheck/verify/artifact/alternative_artifacts.hpp>
#include <bytecheck/verify/artifact/artifact_locator.hpp>
#include <bytecheck/verify/build/optimizer_runs.hpp>
#include <bytecheck/verify/common/enum_names.hpp>

namespace bytecheck::verify {

namespace fs = std::filesystem;

static fs::path resolve(const fs::path& base, const fs::path& path) {
    return path.is_absolute() ? path : base / path;
}

BuildOrchestrator::BuildOrchestrator(BuildSettings settings, std::shared_ptr<CompilerInvoker> invoker)
    : settings_{std::move(settings)}, invoker_{std::move(invoker)} {}

fs::path BuildOrchestrator::artifacts_dir() const {
    return resolve(settings_.project_dir, settings_.artifacts_dir);
}

fs::path BuildOrchestrator::alternative_artifacts_dir() const {
    return resolve(settings_.project_dir, settings_.alternative_artifacts_dir);
}

CompiledArtifact BuildOrchestrator::load_project_artifact(std::string_view contract_name) const {
    const std::string name{contract_name};
    const auto path{unwrap_or_throw(locate_artifact(artifacts_dir(), settings_.artifact_layout, contract_name),
                                    Stage::kArtifact, name)};
    return unwrap_or_throw(load_artifact(path, contract_name), Stage::kArtifact, path.string());
}

ArtifactCache::ArtifactPtr BuildOrchestrator::ensure_artifact(const VerificationRequest& request) {
    request.validate();

    if (request.artifact_type != ArtifactType::kDefault) {
        const AlternativeArtifacts registry{alternative_artifacts_dir()};
        auto artifact{unwrap_or_throw(registry.load(request.artifact_type, request.contract_name), Stage::kArtifact,
                                      enum_json_name(request.artifact_type))};
        return std::make_shared<const CompiledArtifact>(std::move(artifact));
    }

    if (request.optimizer_runs) {
        const uint32_t runs{*request.optimizer_runs};
        return cache_.get_or_build(request.contract_name, runs, [&]() {
            std::unique_lock lock{output_mutex_};
            invoker_->run(build_command(settings_.build_tool, runs));
            return load_project_artifact(request.contract_name);
        });
    }

    BYTECHECK_DEBUG << "Reusing compiler output in " << artifacts_dir().string();
    std::shared_lock lock{output_mutex_};
    return std::make_shared<const CompiledArtifact>(load_project_artifact(request.contract_name));
}

}  // namespace bytecheck::verify
