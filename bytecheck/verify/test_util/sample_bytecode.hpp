// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include <bytecheck/core/common/bytes.hpp>
#include <bytecheck/core/common/util.hpp>
#include <bytecheck/verify/metadata/content_hash.hpp>

namespace bytecheck::verify::test_util {

//! Raw metadata documents as emitted by two toolchains for the same contract
inline constexpr std::string_view kSampleRawMetadata{
    R"({"compiler":{"version":"0.6.12+commit.27d51765"},"language":"Solidity","output":{},"settings":{"optimizer":{"enabled":true,"runs":10000000}},"sources":{"contracts/v1/FiatTokenProxy.sol":{"keccak256":"0x1111"}},"version":1})"};
inline constexpr std::string_view kOtherRawMetadata{
    R"({"compiler":{"version":"0.6.12+commit.27d51765"},"language":"Solidity","output":{},"settings":{"optimizer":{"enabled":true,"runs":200}},"sources":{"src/v1/FiatTokenProxy.sol":{"keccak256":"0x2222"}},"version":1})"};

//! CBOR metadata trailer (map plus 2-byte length) carrying the IPFS hash of the given raw metadata
inline Bytes make_metadata_trailer(std::string_view raw_metadata, std::vector<uint8_t> solc_version = {0, 6, 12}) {
    const auto ipfs{ipfs_multihash(raw_metadata)};
    nlohmann::json map{
        {"ipfs", nlohmann::json::binary(std::vector<uint8_t>{ipfs->begin(), ipfs->end()})},
        {"solc", nlohmann::json::binary(std::move(solc_version))},
    };
    const std::vector<uint8_t> cbor{nlohmann::json::to_cbor(map)};
    Bytes trailer{cbor.data(), cbor.size()};
    trailer.push_back(static_cast<uint8_t>(cbor.size() >> 8));
    trailer.push_back(static_cast<uint8_t>(cbor.size() & 0xff));
    return trailer;
}

inline Bytes hex_bytes(std::string_view hex) {
    return *from_hex(hex);
}

}  // namespace bytecheck::verify::test_util
