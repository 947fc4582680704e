// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <tl/expected.hpp>

namespace bytecheck::verify {

//! Data and validation error codes. External dependency failures (RPC, compiler) are not listed here:
//! they propagate with their own exception types.
enum class [[nodiscard]] VerificationError {
    kInvalidRequest,
    kInvalidOptimizerRuns,
    kArtifactNotFound,
    kAmbiguousArtifact,
    kInvalidArtifact,
    kNoCodeAtAddress,
    kTransactionNotFound,
    kInvalidBytecodeFile,
    kCreationNotFound,
    kMalformedTrace,
    kMetadataOutOfBounds,  // trailer length field exceeds the available bytecode
    kMalformedMetadata,
    kUnsupportedMetadataHash,
    kInvalidMetadataDocument,
};

//! Pipeline stage a failure is attributed to
enum class Stage {
    kRequest,
    kBuild,
    kArtifact,
    kChain,
    kTrace,
    kNormalize,
    kMetadata,
    kCompare,
};

// TODO(C++23) Switch to std::expected
template <class T>
using VerificationResult = tl::expected<T, VerificationError>;

std::string_view to_string(VerificationError err);
std::string_view to_string(Stage stage);

class VerificationException : public std::runtime_error {
  public:
    explicit VerificationException(VerificationError err, Stage stage, const std::string& message = "");

    VerificationError err() const noexcept { return err_; }
    Stage stage() const noexcept { return stage_; }

  private:
    VerificationError err_;
    Stage stage_;
};

//! Raised synchronously before any network or compiler call, identifying the offending request field
class RequestValidationError : public VerificationException {
  public:
    RequestValidationError(std::string field, const std::string& message,
                           VerificationError err = VerificationError::kInvalidRequest);

    const std::string& field() const noexcept { return field_; }

  private:
    std::string field_;
};

template <class T>
inline T unwrap_or_throw(VerificationResult<T> res, Stage stage, const std::string& error_message = "") {
    if (!res) {
        throw VerificationException(res.error(), stage, error_message);
    }
    return std::move(*res);
}

inline void unwrap_or_throw(VerificationResult<void> res, Stage stage, const std::string& error_message = "") {
    if (!res) {
        throw VerificationException(res.error(), stage, error_message);
    }
}

}  // namespace bytecheck::verify
