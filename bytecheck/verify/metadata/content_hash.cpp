// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#include "content_hash.hpp"

#include <algorithm>
#include <cstddef>
#include <vector>

#include <evmone_precompiles/sha256.hpp>

#include <bytecheck/core/common/util.hpp>
#include <bytecheck/infra/common/log.hpp>

namespace bytecheck::verify {

namespace pb {

    // Protobuf wire types
    inline constexpr uint8_t kVarint{0};
    inline constexpr uint8_t kLengthDelimited{2};

    void encode_varint(Bytes& to, uint64_t value) {
        while (value >= 0x80) {
            to.push_back(static_cast<uint8_t>((value & 0x7f) | 0x80));
            value >>= 7;
        }
        to.push_back(static_cast<uint8_t>(value));
    }

    void encode_key(Bytes& to, uint8_t field, uint8_t wire_type) {
        to.push_back(static_cast<uint8_t>(field << 3 | wire_type));
    }

    void encode(Bytes& to, uint8_t field, uint64_t value) {
        encode_key(to, field, kVarint);
        encode_varint(to, value);
    }

    void encode(Bytes& to, uint8_t field, ByteView value) {
        encode_key(to, field, kLengthDelimited);
        encode_varint(to, value.size());
        to.append(value);
    }

}  // namespace pb

namespace unixfs {

    inline constexpr uint64_t kFileType{2};

    // unixfs.Data message
    Bytes encode_file_data(ByteView data, uint64_t file_size, const std::vector<uint64_t>& block_sizes) {
        Bytes out;
        pb::encode(out, /*field=*/1, kFileType);
        if (!data.empty()) {
            pb::encode(out, /*field=*/2, data);
        }
        pb::encode(out, /*field=*/3, file_size);
        for (const auto block_size : block_sizes) {
            pb::encode(out, /*field=*/4, block_size);
        }
        return out;
    }

}  // namespace unixfs

namespace dag_pb {

    struct Link {
        Bytes hash;
        uint64_t total_size{0};
    };

    // PBNode message in canonical order: Links (field 2) before Data (field 1)
    Bytes encode_node(const std::vector<Link>& links, ByteView data) {
        Bytes out;
        for (const auto& link : links) {
            Bytes encoded_link;
            pb::encode(encoded_link, /*field=*/1, ByteView{link.hash});
            pb::encode(encoded_link, /*field=*/2, ByteView{});
            pb::encode(encoded_link, /*field=*/3, link.total_size);
            pb::encode(out, /*field=*/2, ByteView{encoded_link});
        }
        pb::encode(out, /*field=*/1, data);
        return out;
    }

}  // namespace dag_pb

static Bytes sha256(ByteView data) {
    Bytes out(kHashLength, 0);
    evmone::crypto::sha256(reinterpret_cast<std::byte*>(out.data()),
                           reinterpret_cast<const std::byte*>(data.data()),
                           data.size());
    return out;
}

static Bytes sha256_multihash(ByteView data) {
    Bytes multihash{0x12, 0x20};  // sha2-256, 32 bytes
    multihash.append(sha256(data));
    return multihash;
}

VerificationResult<Bytes> ipfs_multihash(std::string_view content) {
    const ByteView data{string_view_to_byte_view(content)};
    if (data.size() <= kIpfsChunkSize) {
        const Bytes node{dag_pb::encode_node({}, unixfs::encode_file_data(data, data.size(), {}))};
        return sha256_multihash(node);
    }

    const size_t chunk_count{(data.size() + kIpfsChunkSize - 1) / kIpfsChunkSize};
    if (chunk_count > kIpfsMaxLinksPerNode) {
        BYTECHECK_ERROR << "ipfs_multihash: content size " << data.size() << " requires a multi-level DAG";
        return tl::unexpected{VerificationError::kUnsupportedMetadataHash};
    }
    std::vector<dag_pb::Link> links;
    std::vector<uint64_t> block_sizes;
    links.reserve(chunk_count);
    block_sizes.reserve(chunk_count);
    for (size_t offset{0}; offset < data.size(); offset += kIpfsChunkSize) {
        const ByteView chunk{data.substr(offset, kIpfsChunkSize)};
        const Bytes leaf{dag_pb::encode_node({}, unixfs::encode_file_data(chunk, chunk.size(), {}))};
        links.push_back({.hash = sha256_multihash(leaf), .total_size = leaf.size()});
        block_sizes.push_back(chunk.size());
    }
    const Bytes root{dag_pb::encode_node(links, unixfs::encode_file_data({}, data.size(), block_sizes))};
    return sha256_multihash(root);
}

static Bytes to_little_endian_span(uint64_t size) {
    Bytes span(8, 0);
    for (auto& b : span) {
        b = static_cast<uint8_t>(size & 0xff);
        size >>= 8;
    }
    return span;
}

static Bytes keccak256_bytes(ByteView data) {
    const auto hash{keccak256(data)};
    return Bytes{hash.bytes, kHashLength};
}

static Bytes bzzr0_chunk_hash(ByteView payload, uint64_t size) {
    Bytes buffer{to_little_endian_span(size)};
    buffer.append(payload);
    return keccak256_bytes(buffer);
}

static Bytes bzzr0_intermediate_hash(ByteView data) {
    if (data.size() <= kSwarmChunkSize) {
        return bzzr0_chunk_hash(data, data.size());
    }
    static constexpr size_t kBranches{kSwarmChunkSize / kHashLength};
    size_t max_represented_size{kSwarmChunkSize};
    while (max_represented_size * kBranches < data.size()) {
        max_represented_size *= kBranches;
    }
    Bytes inner_nodes;
    for (size_t offset{0}; offset < data.size(); offset += max_represented_size) {
        inner_nodes.append(bzzr0_intermediate_hash(data.substr(offset, max_represented_size)));
    }
    return bzzr0_chunk_hash(inner_nodes, data.size());
}

Bytes swarm_bzzr0_hash(std::string_view content) {
    return bzzr0_intermediate_hash(string_view_to_byte_view(content));
}

static Bytes bmt_hash(ByteView data) {
    if (data.size() <= 2 * kHashLength) {
        return keccak256_bytes(data);
    }
    const size_t mid_point{data.size() / 2};
    Bytes pair{bmt_hash(data.substr(0, mid_point))};
    pair.append(bmt_hash(data.substr(mid_point)));
    return keccak256_bytes(pair);
}

VerificationResult<Bytes> swarm_bzzr1_hash(std::string_view content) {
    const ByteView data{string_view_to_byte_view(content)};
    if (data.size() > kSwarmChunkSize) {
        BYTECHECK_ERROR << "swarm_bzzr1_hash: content size " << data.size() << " exceeds a single chunk";
        return tl::unexpected{VerificationError::kUnsupportedMetadataHash};
    }
    Bytes chunk{data};
    chunk.resize(kSwarmChunkSize, 0);
    Bytes buffer{to_little_endian_span(data.size())};
    buffer.append(bmt_hash(chunk));
    return keccak256_bytes(buffer);
}

VerificationResult<Bytes> content_hash(ContentHashScheme scheme, std::string_view raw_metadata) {
    switch (scheme) {
        case ContentHashScheme::kIpfs:
            return ipfs_multihash(raw_metadata);
        case ContentHashScheme::kBzzr0:
            return swarm_bzzr0_hash(raw_metadata);
        case ContentHashScheme::kBzzr1:
            return swarm_bzzr1_hash(raw_metadata);
    }
    return tl::unexpected{VerificationError::kUnsupportedMetadataHash};
}

std::string to_base58(ByteView data) {
    static constexpr std::string_view kAlphabet{"123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz"};

    const size_t leading_zeros = static_cast<size_t>(
        std::distance(data.begin(), std::find_if(data.begin(), data.end(), [](uint8_t b) { return b != 0; })));

    // Little-endian base58 digits, converted by repeated division of the big-endian input
    std::vector<uint8_t> digits;
    digits.reserve(data.size() * 138 / 100 + 1);
    for (size_t i{leading_zeros}; i < data.size(); ++i) {
        uint32_t carry{data[i]};
        for (auto& digit : digits) {
            carry += static_cast<uint32_t>(digit) << 8;
            digit = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        while (carry > 0) {
            digits.push_back(static_cast<uint8_t>(carry % 58));
            carry /= 58;
        }
    }

    std::string out(leading_zeros, '1');
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        out.push_back(kAlphabet[*it]);
    }
    return out;
}

}  // namespace bytecheck::verify
