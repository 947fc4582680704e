// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#include "metadata.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>

#include <bytecheck/core/common/util.hpp>
#include <bytecheck/infra/common/log.hpp>

namespace bytecheck::verify {

VerificationResult<MetadataSplit> split_metadata(ByteView bytecode) {
    if (bytecode.size() < kMetadataLengthSize) {
        return tl::unexpected{VerificationError::kMetadataOutOfBounds};
    }
    const size_t cbor_length{static_cast<size_t>(bytecode[bytecode.size() - 2]) << 8 | bytecode[bytecode.size() - 1]};
    const size_t trailer_length{cbor_length + kMetadataLengthSize};
    if (trailer_length > bytecode.size()) {
        BYTECHECK_DEBUG << "split_metadata: trailer length " << trailer_length << " exceeds bytecode size " << bytecode.size();
        return tl::unexpected{VerificationError::kMetadataOutOfBounds};
    }

    const size_t split_offset{bytecode.size() - trailer_length};
    MetadataSplit split;
    split.code_without_metadata = Bytes{bytecode.substr(0, split_offset)};
    split.metadata_bytes = Bytes{bytecode.substr(split_offset)};
    const auto hash{keccak256(split.metadata_bytes)};
    std::copy(std::begin(hash.bytes), std::end(hash.bytes), split.metadata_hash.bytes);
    return split;
}

bool equal(ByteView hash1, ByteView hash2) noexcept {
    return hash1 == hash2;
}

bool equal(const evmc::bytes32& hash1, const evmc::bytes32& hash2) noexcept {
    return hash1 == hash2;
}

static std::optional<std::string> decode_compiler_version(const nlohmann::json& solc) {
    if (solc.is_string()) {
        return solc.get<std::string>();
    }
    if (solc.is_binary() && solc.get_binary().size() == 3) {
        const auto& v{solc.get_binary()};
        return std::to_string(v[0]) + "." + std::to_string(v[1]) + "." + std::to_string(v[2]);
    }
    return std::nullopt;
}

VerificationResult<CompilerMetadata> decode_metadata(ByteView metadata_bytes) {
    if (metadata_bytes.size() <= kMetadataLengthSize) {
        return tl::unexpected{VerificationError::kMalformedMetadata};
    }
    const ByteView cbor{metadata_bytes.substr(0, metadata_bytes.size() - kMetadataLengthSize)};

    nlohmann::json map;
    try {
        map = nlohmann::json::from_cbor(cbor.begin(), cbor.end());
    } catch (const nlohmann::json::exception& e) {
        BYTECHECK_DEBUG << "decode_metadata: invalid CBOR: " << e.what();
        return tl::unexpected{VerificationError::kMalformedMetadata};
    }
    BYTECHECK_TRACE << "decode_metadata: " << map.dump();
    if (!map.is_object()) {
        return tl::unexpected{VerificationError::kMalformedMetadata};
    }

    CompilerMetadata metadata;
    static constexpr std::pair<const char*, ContentHashScheme> kHashKeys[]{
        {"ipfs", ContentHashScheme::kIpfs},
        {"bzzr1", ContentHashScheme::kBzzr1},
        {"bzzr0", ContentHashScheme::kBzzr0},
    };
    bool hash_found{false};
    for (const auto& [key, scheme] : kHashKeys) {
        if (map.contains(key) && map[key].is_binary()) {
            const auto& binary{map[key].get_binary()};
            metadata.scheme = scheme;
            metadata.content_hash = Bytes{binary.data(), binary.size()};
            hash_found = true;
            break;
        }
    }
    if (!hash_found) {
        return tl::unexpected{VerificationError::kMalformedMetadata};
    }
    if (map.contains("solc")) {
        metadata.compiler_version = decode_compiler_version(map["solc"]);
    }
    if (map.contains("experimental") && map["experimental"].is_boolean()) {
        metadata.experimental = map["experimental"].get<bool>();
    }
    return metadata;
}

VerificationResult<std::string> load_raw_metadata(const std::filesystem::path& path) {
    std::ifstream file{path, std::ios::binary};
    if (!file) {
        BYTECHECK_ERROR << "load_raw_metadata: cannot open " << path.string();
        return tl::unexpected{VerificationError::kInvalidMetadataDocument};
    }
    std::stringstream contents;
    contents << file.rdbuf();
    std::string document{contents.str()};

    const auto json = nlohmann::json::parse(document, /*cb=*/nullptr, /*allow_exceptions=*/false);
    if (json.is_discarded() || !json.is_object()) {
        BYTECHECK_ERROR << "load_raw_metadata: " << path.string() << " is not a JSON object";
        return tl::unexpected{VerificationError::kInvalidMetadataDocument};
    }
    for (const char* key : {"rawMetadata", "metadata"}) {
        if (json.contains(key) && json[key].is_string()) {
            return json[key].get<std::string>();
        }
    }
    return document;
}

}  // namespace bytecheck::verify
