// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>

#include <bytecheck/verify/build/build_orchestrator.hpp>
#include <bytecheck/verify/chain/rpc_provider.hpp>
#include <bytecheck/verify/compare/comparator.hpp>
#include <bytecheck/verify/request/verification_request.hpp>

namespace bytecheck::verify {

//! Runs one verification request end to end
class Verifier {
  public:
    Verifier(BuildOrchestrator& orchestrator, RpcProvider& provider)
        : orchestrator_{orchestrator}, provider_{provider} {}

    //! \brief Validates the request, obtains both sides and compares them
    //! \throws RequestValidationError before any compiler or provider call, VerificationException for data errors
    //! while compiler and provider failures propagate with their own types
    ComparisonResults verify(const VerificationRequest& request);

  private:
    OnchainBytecode fetch_onchain_bytecode(const VerificationRequest& request);
    static std::optional<std::string> load_metadata_document(const VerificationRequest& request);

    BuildOrchestrator& orchestrator_;
    RpcProvider& provider_;
};

}  // namespace bytecheck::verify
