// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <evmc/evmc.hpp>

#include <bytecheck/core/common/bytes.hpp>
#include <bytecheck/verify/common/errors.hpp>

namespace bytecheck::verify {

//! Size of the big-endian length suffix closing the compiler metadata trailer
inline constexpr size_t kMetadataLengthSize{2};

//! Runtime bytecode split in executable part and compiler metadata trailer.
//! code_without_metadata + metadata_bytes reconstructs the original bytecode.
struct MetadataSplit {
    Bytes code_without_metadata;
    Bytes metadata_bytes;         // CBOR map plus its 2-byte length suffix
    evmc::bytes32 metadata_hash;  // keccak256(metadata_bytes)
};

//! \brief Delimits the metadata trailer using only its length field, whatever the encoded content
//! \return kMetadataOutOfBounds if the length field exceeds the available bytecode
VerificationResult<MetadataSplit> split_metadata(ByteView bytecode);

//! Byte-exact hash comparison
bool equal(ByteView hash1, ByteView hash2) noexcept;
bool equal(const evmc::bytes32& hash1, const evmc::bytes32& hash2) noexcept;

enum class ContentHashScheme {
    kIpfs,
    kBzzr0,
    kBzzr1,
};

//! Decoded fields of the CBOR metadata trailer
struct CompilerMetadata {
    ContentHashScheme scheme{ContentHashScheme::kIpfs};
    Bytes content_hash;
    std::optional<std::string> compiler_version;
    bool experimental{false};
};

//! \brief Decodes the CBOR map of a trailer returned by split_metadata
//! \return kMalformedMetadata if not a CBOR map or no recognised content hash is present
VerificationResult<CompilerMetadata> decode_metadata(ByteView metadata_bytes);

//! \brief Reads the compiler raw metadata string from a metadata document.
//! \details Accepted layouts: an object with a string "metadata" or "rawMetadata" field (artifact-like documents)
//! or the raw metadata JSON itself, which is returned verbatim
VerificationResult<std::string> load_raw_metadata(const std::filesystem::path& path);

}  // namespace bytecheck::verify
