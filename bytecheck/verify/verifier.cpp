// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#include "verifier.hpp"

#include <bytecheck/core/types/address.hpp>
#include <bytecheck/infra/common/log.hpp>
#include <bytecheck/verify/chain/chain_accessor.hpp>
#include <bytecheck/verify/metadata/metadata.hpp>

namespace bytecheck::verify {

OnchainBytecode Verifier::fetch_onchain_bytecode(const VerificationRequest& request) {
    ChainAccessor chain{provider_};
    OnchainBytecode onchain;
    if (request.onchain_bytecode_file) {
        BYTECHECK_INFO << "Reading runtime bytecode from " << request.onchain_bytecode_file->string();
        onchain.runtime_code = ChainAccessor::load_runtime_code(*request.onchain_bytecode_file);
    } else {
        onchain.runtime_code = chain.get_runtime_code(request.contract_address);
    }
    if (request.creation_tx_hash) {
        onchain.creation_code =
            chain.get_creation_code(*request.creation_tx_hash, request.contract_address, request.deployment_path);
    }
    return onchain;
}

std::optional<std::string> Verifier::load_metadata_document(const VerificationRequest& request) {
    if (!request.metadata_file) {
        return std::nullopt;
    }
    return unwrap_or_throw(load_raw_metadata(*request.metadata_file), Stage::kMetadata,
                           request.metadata_file->string());
}

ComparisonResults Verifier::verify(const VerificationRequest& request) {
    request.validate();
    BYTECHECK_INFO_M("Verifying", {"contract", request.contract_name,
                                   "address", address_to_hex(request.contract_address),
                                   "type", request.verification_type == VerificationType::kFull ? "full" : "partial"});

    const auto artifact{orchestrator_.ensure_artifact(request)};
    const OnchainBytecode onchain{fetch_onchain_bytecode(request)};
    const auto raw_metadata{load_metadata_document(request)};

    const Comparator comparator{request};
    ComparisonResults results{comparator.compare(*artifact, onchain, raw_metadata)};
    for (const auto& result : results) {
        BYTECHECK_INFO_M("Verification result", {"contract", request.contract_name,
                                                 "check", std::string{to_string(input_type(result))},
                                                 "equal", is_equal(result) ? "true" : "false"});
    }
    return results;
}

}  // namespace bytecheck::verify
