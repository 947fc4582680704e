// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#include "errors.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_exception.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

namespace bytecheck::verify {

using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::Message;

TEST_CASE("VerificationException names stage and error") {
    const VerificationException ex{VerificationError::kCreationNotFound, Stage::kTrace, "0x4b21"};
    CHECK(ex.err() == VerificationError::kCreationNotFound);
    CHECK(ex.stage() == Stage::kTrace);
    CHECK(std::string{ex.what()} == "Trace stage failed: CreationNotFound (0x4b21)");
}

TEST_CASE("RequestValidationError identifies the field") {
    const RequestValidationError ex{"optimizerRuns", "1.1", VerificationError::kInvalidOptimizerRuns};
    CHECK(ex.field() == "optimizerRuns");
    CHECK(ex.stage() == Stage::kRequest);
    CHECK(ex.err() == VerificationError::kInvalidOptimizerRuns);
    CHECK_THAT(std::string{ex.what()}, ContainsSubstring("invalid optimizerRuns: 1.1"));
}

TEST_CASE("unwrap_or_throw") {
    CHECK(unwrap_or_throw(VerificationResult<int>{42}, Stage::kMetadata) == 42);
    CHECK_THROWS_AS(unwrap_or_throw(VerificationResult<int>{tl::unexpected{VerificationError::kMalformedMetadata}}, Stage::kMetadata),
                    VerificationException);
    CHECK_THROWS_MATCHES(unwrap_or_throw(VerificationResult<int>{tl::unexpected{VerificationError::kMetadataOutOfBounds}}, Stage::kMetadata),
                         VerificationException, Message("Metadata stage failed: MetadataOutOfBounds"));
}

}  // namespace bytecheck::verify
