// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include <bytecheck/core/common/bytes.hpp>
#include <bytecheck/core/common/util.hpp>
#include <bytecheck/verify/test_util/sample_bytecode.hpp>

namespace bytecheck::verify::test_util {

//! Init code of the sample contract, followed by the runtime code
inline constexpr std::string_view kSampleInitCode{"608060405234801561001057600080fd5b50610150806100206000396000f3fe"};
//! Runtime code of the sample contract, without the metadata trailer
inline constexpr std::string_view kSampleRuntimeBody{
    "6080604052600436106100295760003560e01c80635c60da1b1461003357806390ac21cd14610048575b610031610058565b005b"};

struct SampleContract {
    Bytes creation_code;
    Bytes runtime_code;
    std::string raw_metadata;
};

inline SampleContract make_sample_contract(std::string_view raw_metadata = kSampleRawMetadata) {
    SampleContract contract;
    contract.raw_metadata = raw_metadata;
    contract.runtime_code = hex_bytes(kSampleRuntimeBody);
    contract.runtime_code.append(make_metadata_trailer(raw_metadata));
    contract.creation_code = hex_bytes(kSampleInitCode);
    contract.creation_code.append(contract.runtime_code);
    return contract;
}

//! Foundry artifact: bytecode objects carrying their own link and immutable references
inline nlohmann::json make_foundry_artifact(const SampleContract& contract) {
    return {
        {"abi", nlohmann::json::array()},
        {"bytecode", {{"object", to_hex(contract.creation_code, true)}, {"linkReferences", nlohmann::json::object()}}},
        {"deployedBytecode",
         {{"object", to_hex(contract.runtime_code, true)},
          {"linkReferences", nlohmann::json::object()},
          {"immutableReferences", nlohmann::json::object()}}},
        {"rawMetadata", contract.raw_metadata},
    };
}

//! Hardhat artifact: plain hex strings, metadata only available through build-info
inline nlohmann::json make_hardhat_artifact(const SampleContract& contract, std::string_view contract_name,
                                            std::string_view source_name) {
    return {
        {"_format", "hh-sol-artifact-1"},
        {"contractName", std::string{contract_name}},
        {"sourceName", std::string{source_name}},
        {"abi", nlohmann::json::array()},
        {"bytecode", to_hex(contract.creation_code, true)},
        {"deployedBytecode", to_hex(contract.runtime_code, true)},
        {"linkReferences", nlohmann::json::object()},
        {"deployedLinkReferences", nlohmann::json::object()},
    };
}

inline void write_json_file(const std::filesystem::path& path, const nlohmann::json& json) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream file{path};
    file << json.dump(2);
}

}  // namespace bytecheck::verify::test_util
