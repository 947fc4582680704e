// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

// Content addressing of compiler metadata documents as embedded by solc in the metadata trailer:
// - IPFS CIDv0 multihash of a UnixFS file (https://github.com/ipfs/specs/blob/main/UNIXFS.md)
// - Swarm bzzr0 (legacy chunk tree) and bzzr1 (binary Merkle tree) hashes

#pragma once

#include <string>
#include <string_view>

#include <bytecheck/core/common/base.hpp>
#include <bytecheck/core/common/bytes.hpp>
#include <bytecheck/verify/common/errors.hpp>
#include <bytecheck/verify/metadata/metadata.hpp>

namespace bytecheck::verify {

//! UnixFS chunk size used by the default IPFS chunker
inline constexpr size_t kIpfsChunkSize{256 * kKibi};

//! Max number of links per DAG node in the balanced layout
inline constexpr size_t kIpfsMaxLinksPerNode{174};

//! Swarm chunk size
inline constexpr size_t kSwarmChunkSize{4 * kKibi};

//! \brief Multihash (sha2-256) of the dag-pb root node wrapping the content as a UnixFS file
//! \return kUnsupportedMetadataHash if the content needs more than one level of intermediate nodes
VerificationResult<Bytes> ipfs_multihash(std::string_view content);

//! \brief Legacy Swarm hash (bzzr0) of the content
Bytes swarm_bzzr0_hash(std::string_view content);

//! \brief Swarm BMT hash (bzzr1) of the content
//! \return kUnsupportedMetadataHash if the content exceeds a single chunk
VerificationResult<Bytes> swarm_bzzr1_hash(std::string_view content);

//! \brief Computes the content hash of the raw metadata following the given scheme
VerificationResult<Bytes> content_hash(ContentHashScheme scheme, std::string_view raw_metadata);

//! \brief Base58 (Bitcoin alphabet) rendering used for IPFS CIDv0
std::string to_base58(ByteView data);

}  // namespace bytecheck::verify
