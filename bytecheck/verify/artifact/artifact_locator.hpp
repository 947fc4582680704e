// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <string_view>

#include <bytecheck/verify/artifact/compiled_artifact.hpp>
#include <bytecheck/verify/common/errors.hpp>

namespace bytecheck::verify {

//! \brief Finds the artifact file of the contract in the compiler output directory
//! \details The contract name may be fully qualified ("path/File.sol:Contract") to disambiguate.
//! Fails with kArtifactNotFound when nothing matches and kAmbiguousArtifact for more than one candidate.
VerificationResult<std::filesystem::path> locate_artifact(const std::filesystem::path& artifacts_dir,
                                                          ArtifactLayout layout,
                                                          std::string_view contract_name);

}  // namespace bytecheck::verify
